#include "checkkit/config_manager.hpp"
#include <cctype>
#include <iostream>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <algorithm>

// Minimal YAML subset: "key: value" pairs, one level of sections,
// '#' comments and double-quoted strings.
namespace checkkit {

bool PluginConfig::validate() const {
    if (name.empty() || timeout <= 0 || verbosity < 0) {
        return false;
    }
    if (!status_from_string(timeout_status)) {
        return false;
    }
    if (log.log_to_file && log.log_path.empty()) {
        return false;
    }
    return true;
}

Status PluginConfig::timeout_code() const {
    return status_from_string(timeout_status).value_or(Status::Unknown);
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
{
}

static std::string trim(std::string_view text) {
    constexpr std::string_view blanks = " \t\n\r";
    text.remove_prefix(std::min(text.find_first_not_of(blanks), text.size()));
    text.remove_suffix(text.size() - (text.find_last_not_of(blanks) + 1));
    return std::string(text);
}

static std::optional<int> parse_int(const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static std::optional<bool> parse_bool(const std::string& value) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "0") return false;
    return std::nullopt;
}

static bool apply(PluginConfig& target, const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty()) {
        if (key == "name") {
            target.name = value;
        } else if (key == "version") {
            target.version = value;
        } else if (key == "timeout") {
            auto parsed = parse_int(value);
            if (!parsed) return false;
            target.timeout = *parsed;
        } else if (key == "timeout_status") {
            target.timeout_status = value;
        } else if (key == "status_prefix") {
            auto parsed = parse_bool(value);
            if (!parsed) return false;
            target.status_prefix = *parsed;
        } else if (key == "join_messages") {
            auto parsed = parse_bool(value);
            if (!parsed) return false;
            target.join_messages = *parsed;
        } else if (key == "message_joiner") {
            target.message_joiner = value;
        } else if (key == "verbosity") {
            auto parsed = parse_int(value);
            if (!parsed) return false;
            target.verbosity = *parsed;
        }
    } else if (section == "log") {
        if (key == "log_to_file") {
            auto parsed = parse_bool(value);
            if (!parsed) return false;
            target.log.log_to_file = *parsed;
        } else if (key == "log_path") {
            target.log.log_path = value;
        }
    }
    // Unknown keys are ignored
    return true;
}

bool ConfigManager::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << config_path_ << "\n";
        return false;
    }

    // Start from defaults; config_ is only replaced once the whole file parsed
    PluginConfig loaded;

    std::string raw_line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, raw_line)) {
        ++line_number;
        std::string line = trim(raw_line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t indent = raw_line.find_first_not_of(" \t");
        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            std::cerr << config_path_ << ":" << line_number << ": expected 'key: value'\n";
            return false;
        }

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Section header
        if (indent == 0 && value.empty()) {
            current_section = key;
            continue;
        }
        if (indent == 0) {
            current_section.clear();
        }

        // Remove quotes from string values
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (!apply(loaded, current_section, key, value)) {
            std::cerr << config_path_ << ":" << line_number << ": invalid value for '" << key << "': " << value << "\n";
            return false;
        }
    }

    config_ = loaded;
    return true;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    if (config_.name.empty()) {
        error_msg = "Plugin name must not be empty";
        return false;
    }

    if (config_.timeout <= 0) {
        error_msg = "Timeout must be a positive number of seconds";
        return false;
    }

    if (!status_from_string(config_.timeout_status)) {
        error_msg = "Unknown timeout status: " + config_.timeout_status;
        return false;
    }

    if (config_.verbosity < 0) {
        error_msg = "Verbosity must not be negative";
        return false;
    }

    if (config_.log.log_to_file && config_.log.log_path.empty()) {
        error_msg = "log_path is required when log_to_file is enabled";
        return false;
    }

    return config_.validate();
}

} // namespace checkkit
