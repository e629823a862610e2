#pragma once

#include "checkkit/status.hpp"
#include <typiconf/typiconf.hpp>
#include <string>

namespace checkkit {

struct LogConfig {
    bool log_to_file = false;
    std::string log_path = "./checkkit.log";

    TYPICONF_DEFINE_FIELDS(LogConfig,
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path)
    )
};

struct PluginConfig {
    std::string name = "CHECK";
    std::string version = "undefined";
    int timeout = 10;                        // seconds
    std::string timeout_status = "UNKNOWN";  // status reported when the timeout fires
    bool status_prefix = true;               // "NAME STATUS - " before the message
    bool join_messages = false;              // summary lists every message at the final status
    std::string message_joiner = ", ";
    int verbosity = 0;
    LogConfig log;

    bool validate() const;

    // Falls back to Unknown for an unrecognised name
    Status timeout_code() const;

    TYPICONF_DEFINE_FIELDS(PluginConfig,
        TYPICONF_FIELD(name),
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(timeout),
        TYPICONF_FIELD(timeout_status),
        TYPICONF_FIELD(status_prefix),
        TYPICONF_FIELD(join_messages),
        TYPICONF_FIELD(message_joiner),
        TYPICONF_FIELD(verbosity),
        TYPICONF_FIELD(log)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration. Keys missing from the file keep their defaults.
    // On failure the previously loaded configuration is kept.
    bool load();

    const PluginConfig& get_config() const { return config_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

private:
    std::string config_path_;
    PluginConfig config_;
};

} // namespace checkkit
