#pragma once

#include "checkkit/config_manager.hpp"
#include "checkkit/extended_data.hpp"
#include "checkkit/logger.hpp"
#include "checkkit/perfdata.hpp"
#include "checkkit/result_set.hpp"
#include "checkkit/status.hpp"
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace checkkit {

// Everything one check execution reports. Not shareable between
// concurrent checks; give each check its own Plugin.
class Plugin {
public:
    explicit Plugin(const PluginConfig& config = PluginConfig{});
    ~Plugin();

    Plugin(const Plugin&) = delete;
    Plugin& operator=(const Plugin&) = delete;

    const PluginConfig& config() const { return config_; }

    void add_result(Status status, const std::string& message = "");

    void add_perfdata(const std::string& label,
                      double value,
                      const std::string& uom = "",
                      const std::optional<ThresholdSpec>& warning = std::nullopt,
                      const std::optional<ThresholdSpec>& critical = std::nullopt,
                      std::optional<double> minimum = std::nullopt,
                      std::optional<double> maximum = std::nullopt);

    void add_extdata(const std::string& line);

    const ResultSet& results() const { return results_; }
    const PerfData& perfdata() const { return perfdata_; }
    const ExtendedData& extdata() const { return extdata_; }

    // Records logged here also land in the extended data
    Logger& logger() { return logger_; }

    // Summary line for the final status, prefixed per configuration
    std::string summary(Status status, const std::string& message) const;

    // Write the aggregated output; returns the exit code
    int finish(std::ostream& out);

    // Write explicit output; returns the exit code
    int exit(std::ostream& out,
             Status status,
             const std::string& message,
             const std::string& perfdata = "",
             const std::string& extdata = "");

    // Internal error, always Unknown
    int die(std::ostream& out, const std::string& message);

    // Run the check body and finish. A bad threshold becomes an Unknown
    // result, any other exception an immediate Unknown exit.
    int run(std::ostream& out, const std::function<void(Plugin&)>& body);

    // Arm SIGALRM. On expiry the timeout message is written to stdout and
    // the process exits with the status' code. Throws std::invalid_argument
    // unless seconds > 0.
    void set_timeout(int seconds, Status status);
    void set_timeout();
    void cancel_timeout();

private:
    PluginConfig config_;
    ResultSet results_;
    PerfData perfdata_;
    ExtendedData extdata_;
    Logger logger_;
    bool timeout_armed_ = false;
};

} // namespace checkkit
