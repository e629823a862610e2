#include "checkkit/config_manager.hpp"
#include "checkkit/number_format.hpp"
#include "checkkit/plugin.hpp"
#include "checkkit/threshold_checker.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

constexpr const char* kVersion = "1.0.0";

struct Options {
    std::optional<double> value;
    std::optional<std::string> warning;
    std::optional<std::string> critical;
    std::optional<std::string> config_path;
    std::optional<std::string> hostname;
    std::optional<int> timeout;
    int verbosity = 0;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " --value VALUE [-w THRESHOLD] [-c THRESHOLD]\n";
    std::cerr << "       [-C config_file] [-H hostname] [-t timeout] [-v]... [-V] [-h]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --value VALUE           Value to check\n";
    std::cerr << "  -w, --warning RANGE     Warning threshold, e.g. 90, 10:20, @0:5, ~:30\n";
    std::cerr << "  -c, --critical RANGE    Critical threshold\n";
    std::cerr << "  -C, --config FILE       Plugin configuration file\n";
    std::cerr << "  -H, --hostname HOST     Host being checked\n";
    std::cerr << "  -t, --timeout SECONDS   Abort the check after SECONDS\n";
    std::cerr << "  -v, --verbose           Increase verbosity, may be repeated\n";
    std::cerr << "  -V, --version           Show version\n";
    std::cerr << "  -h, --help              Show this help message\n";
    std::cerr << "\n";
}

// Returns false on a malformed command line
bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing argument for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string param;
        try {
            if (arg == "-h" || arg == "--help") {
                options.help = true;
            } else if (arg == "-V" || arg == "--version") {
                options.version = true;
            } else if (arg == "-v" || arg == "--verbose") {
                ++options.verbosity;
            } else if (arg.size() > 2 && arg.find_first_not_of('v', 1) == std::string::npos && arg[0] == '-') {
                options.verbosity += static_cast<int>(arg.size() - 1);
            } else if (arg == "--value") {
                if (!next(param)) return false;
                size_t consumed = 0;
                options.value = std::stod(param, &consumed);
                if (consumed != param.size()) throw std::invalid_argument(param);
            } else if (arg == "-w" || arg == "--warning") {
                if (!next(param)) return false;
                options.warning = param;
            } else if (arg == "-c" || arg == "--critical") {
                if (!next(param)) return false;
                options.critical = param;
            } else if (arg == "-C" || arg == "--config") {
                if (!next(param)) return false;
                options.config_path = param;
            } else if (arg == "-H" || arg == "--hostname") {
                if (!next(param)) return false;
                options.hostname = param;
            } else if (arg == "-t" || arg == "--timeout") {
                if (!next(param)) return false;
                size_t consumed = 0;
                options.timeout = std::stoi(param, &consumed);
                if (consumed != param.size()) throw std::invalid_argument(param);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid number for " << arg << ": " << param << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    const int unknown = checkkit::exit_code(checkkit::Status::Unknown);

    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return unknown;
    }
    if (options.help) {
        print_usage(argv[0]);
        return unknown;
    }

    checkkit::PluginConfig config;
    config.name = "value";

    if (options.config_path) {
        checkkit::ConfigManager manager(*options.config_path);
        std::string validation_error;
        if (!manager.load()) {
            checkkit::Plugin plugin(config);
            return plugin.die(std::cout, "Failed to load configuration from " + *options.config_path);
        }
        if (!manager.validate_config(validation_error)) {
            checkkit::Plugin plugin(config);
            return plugin.die(std::cout, "Configuration validation failed: " + validation_error);
        }
        config = manager.get_config();
    }

    if (options.version) {
        std::cout << config.name << " " << (options.config_path ? config.version : kVersion) << "\n";
        return checkkit::exit_code(checkkit::Status::Ok);
    }

    if (!options.value) {
        std::cerr << "--value is required\n";
        print_usage(argv[0]);
        return unknown;
    }

    config.verbosity += options.verbosity;
    if (options.timeout) {
        config.timeout = *options.timeout;
    }

    checkkit::Plugin plugin(config);
    if (config.timeout <= 0) {
        return plugin.die(std::cout, "Timeout must be a positive number of seconds");
    }
    plugin.set_timeout();

    return plugin.run(std::cout, [&](checkkit::Plugin& check) {
        double value = *options.value;
        if (options.hostname) {
            check.logger().info("checking value for host ", *options.hostname);
        }

        checkkit::Status status = checkkit::check_threshold_text(value, options.warning, options.critical);
        check.add_result(status, "value=" + checkkit::format_number(value));
        check.add_perfdata("value", value, "", options.warning, options.critical, 0, 100);

        if (config.verbosity > 2) {
            check.add_extdata("value has been determined to be " + checkkit::format_number(value));
        }
    });
}
