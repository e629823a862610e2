#include "checkkit/status.hpp"
#include <algorithm>
#include <cctype>

namespace checkkit {

int exit_code(Status status) {
    switch (status) {
        case Status::Ok:       return 0;
        case Status::Warning:  return 1;
        case Status::Critical: return 2;
        default:               return 3;
    }
}

std::string to_string(Status status) {
    switch (status) {
        case Status::Ok:       return "OK";
        case Status::Warning:  return "WARNING";
        case Status::Critical: return "CRITICAL";
        default:               return "UNKNOWN";
    }
}

std::optional<Status> status_from_string(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "OK" || upper == "0") return Status::Ok;
    if (upper == "WARNING" || upper == "1") return Status::Warning;
    if (upper == "CRITICAL" || upper == "2") return Status::Critical;
    if (upper == "UNKNOWN" || upper == "3") return Status::Unknown;
    return std::nullopt;
}

} // namespace checkkit
