#include "checkkit/logger.hpp"
#include <ctime>
#include <iostream>

namespace checkkit {

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        default:                return "ERROR";
    }
}

// Local time, "YYYY-mm-dd HH:MM:SS"
static std::string current_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char buffer[32];
    size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buffer, length);
}

LogLevel level_for_verbosity(int verbosity) {
    if (verbosity >= 2) {
        return LogLevel::Debug;
    } else if (verbosity == 1) {
        return LogLevel::Info;
    }
    return LogLevel::Warning;
}

Logger::Logger(const LogConfig& config, LogLevel level)
    : level_(level)
{
    if (config.log_to_file) {
        log_file_.open(config.log_path, std::ios::app);
        if (!log_file_) {
            std::cerr << "Warning: logging to file disabled, cannot open " << config.log_path << "\n";
        }
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!should_log(level)) {
        return;
    }

    if (sink_) {
        sink_->ingest("[" + to_string(level) + "] " + message);
    }

    if (log_file_.is_open()) {
        log_file_ << "[" << current_timestamp() << "] "
                  << to_string(level) << " - " << message << "\n";
        log_file_.flush();
    }
}

} // namespace checkkit
