#include "checkkit/result_set.hpp"
#include <algorithm>

namespace checkkit {

void ResultSet::add_result(Status status, const std::string& message) {
    results_.push_back(Result{status, message});
}

bool ResultSet::has_status(Status status) const {
    return std::any_of(results_.begin(), results_.end(),
                       [status](const Result& result) { return result.status == status; });
}

Status ResultSet::code() const {
    // Unknown must never mask a Critical or a Warning
    if (has_status(Status::Critical)) {
        return Status::Critical;
    } else if (has_status(Status::Warning)) {
        return Status::Warning;
    } else if (has_status(Status::Unknown) || results_.empty()) {
        return Status::Unknown;
    }
    return Status::Ok;
}

std::string ResultSet::message() const {
    Status aggregate = code();
    for (const auto& result : results_) {
        if (result.status == aggregate) {
            return result.message;
        }
    }
    return "";
}

std::string ResultSet::message(const std::vector<Status>& levels, const std::string& joiner) const {
    std::string joined;
    for (const auto& result : results_) {
        if (result.message.empty()) {
            continue;
        }
        if (std::find(levels.begin(), levels.end(), result.status) == levels.end()) {
            continue;
        }
        if (!joined.empty()) {
            joined += joiner;
        }
        joined += result.message;
    }
    return joined;
}

} // namespace checkkit
