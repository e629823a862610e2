#pragma once

#include <optional>
#include <string>

namespace checkkit {

// Plugin status. Values double as the process exit code.
enum class Status {
    Ok = 0,
    Warning = 1,
    Critical = 2,
    Unknown = 3
};

int exit_code(Status status);
std::string to_string(Status status);

// Accepts "ok", "WARNING", "Critical", ... or the numeric code "0".."3"
std::optional<Status> status_from_string(const std::string& text);

} // namespace checkkit
