#pragma once

#include "checkkit/config_manager.hpp"
#include "checkkit/extended_data.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace checkkit {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(LogLevel level);

// -v count to minimum level: 0 Warning, 1 Info, 2+ Debug
LogLevel level_for_verbosity(int verbosity);

class Logger {
public:
    // Opens config.log_path for appending when config.log_to_file is set
    explicit Logger(const LogConfig& config, LogLevel level = LogLevel::Warning);

    // Every accepted record is also handed to the sink as "[LEVEL] message"
    void set_sink(LineSink* sink) { sink_ = sink; }

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool should_log(LogLevel level) const { return level >= level_; }

    void log(LogLevel level, const std::string& message);

    template<typename... Args>
    void debug(Args&&... args) { write(LogLevel::Debug, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(Args&&... args) { write(LogLevel::Info, std::forward<Args>(args)...); }

    template<typename... Args>
    void warning(Args&&... args) { write(LogLevel::Warning, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(Args&&... args) { write(LogLevel::Error, std::forward<Args>(args)...); }

private:
    template<typename... Args>
    void write(LogLevel level, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        std::ostringstream oss;
        ((oss << args), ...);
        log(level, oss.str());
    }

    LogLevel level_;
    LineSink* sink_ = nullptr;
    std::ofstream log_file_;
};

} // namespace checkkit
