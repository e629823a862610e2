#include "checkkit/plugin.hpp"
#include "checkkit/output.hpp"
#include "checkkit/threshold.hpp"
#include <algorithm>
#include <csignal>
#include <cstring>
#include <ostream>
#include <stdexcept>
#include <unistd.h>

namespace checkkit {

namespace {

// Prepared by set_timeout() so the handler only calls write() and _exit()
char g_timeout_output[1024];
size_t g_timeout_length = 0;
int g_timeout_exit_code = 3;

void timeout_handler(int signal) {
    if (signal == SIGALRM) {
        ssize_t written = ::write(STDOUT_FILENO, g_timeout_output, g_timeout_length);
        (void)written;
        ::_exit(g_timeout_exit_code);
    }
}

} // namespace

Plugin::Plugin(const PluginConfig& config)
    : config_(config)
    , logger_(config.log, level_for_verbosity(config.verbosity))
{
    logger_.set_sink(&extdata_);
}

Plugin::~Plugin() {
    if (timeout_armed_) {
        cancel_timeout();
    }
}

void Plugin::add_result(Status status, const std::string& message) {
    results_.add_result(status, message);
    logger_.debug("result ", to_string(status), ": ", message);
}

void Plugin::add_perfdata(const std::string& label,
                          double value,
                          const std::string& uom,
                          const std::optional<ThresholdSpec>& warning,
                          const std::optional<ThresholdSpec>& critical,
                          std::optional<double> minimum,
                          std::optional<double> maximum) {
    perfdata_.add(label, value, uom, warning, critical, minimum, maximum);
}

void Plugin::add_extdata(const std::string& line) {
    extdata_.add(line);
}

std::string Plugin::summary(Status status, const std::string& message) const {
    if (!config_.status_prefix) {
        return message;
    }
    return format_summary(config_.name, status, message);
}

int Plugin::finish(std::ostream& out) {
    Status code = results_.code();
    std::string message = config_.join_messages
        ? results_.message({code}, config_.message_joiner)
        : results_.message();

    return exit(out, code, message, perfdata_.render(), extdata_.render());
}

int Plugin::exit(std::ostream& out,
                 Status status,
                 const std::string& message,
                 const std::string& perfdata,
                 const std::string& extdata) {
    if (timeout_armed_) {
        cancel_timeout();
    }

    out << render_output(summary(status, message), perfdata, extdata);
    out.flush();
    return exit_code(status);
}

int Plugin::die(std::ostream& out, const std::string& message) {
    return exit(out, Status::Unknown, message);
}

int Plugin::run(std::ostream& out, const std::function<void(Plugin&)>& body) {
    try {
        body(*this);
    } catch (const InvalidThresholdFormat& e) {
        logger_.error(e.what());
        results_.add_result(Status::Unknown, e.what());
    } catch (const std::exception& e) {
        return exit(out, Status::Unknown, std::string("Uncaught exception: ") + e.what(),
                    "", extdata_.render());
    }
    return finish(out);
}

void Plugin::set_timeout(int seconds, Status status) {
    if (seconds <= 0) {
        throw std::invalid_argument("Timeout must be a positive number of seconds, got " + std::to_string(seconds));
    }

    std::string output = render_output(
        summary(status, "plugin timed out after " + std::to_string(seconds) + " seconds"), "", "");

    size_t length = std::min(output.size(), sizeof(g_timeout_output));
    std::memcpy(g_timeout_output, output.data(), length);
    g_timeout_length = length;
    g_timeout_exit_code = exit_code(status);

    std::signal(SIGALRM, timeout_handler);
    ::alarm(static_cast<unsigned int>(seconds));
    timeout_armed_ = true;

    logger_.debug("timeout set to ", seconds, " seconds");
}

void Plugin::set_timeout() {
    set_timeout(config_.timeout, config_.timeout_code());
}

void Plugin::cancel_timeout() {
    ::alarm(0);
    std::signal(SIGALRM, SIG_DFL);
    timeout_armed_ = false;
}

} // namespace checkkit
