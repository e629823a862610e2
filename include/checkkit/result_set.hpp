#pragma once

#include "checkkit/status.hpp"
#include <string>
#include <vector>

namespace checkkit {

struct Result {
    Status status;
    std::string message;
};

// Ordered outcomes of the sub-checks run by one plugin execution
class ResultSet {
public:
    void add_result(Status status, const std::string& message = "");

    // Critical > Warning > Unknown > Ok. Unknown when nothing was added.
    Status code() const;

    // Message of the first result at the aggregate status
    std::string message() const;

    // Non-empty messages of every result whose status is listed, in order
    std::string message(const std::vector<Status>& levels, const std::string& joiner = ", ") const;

    const std::vector<Result>& results() const { return results_; }
    size_t size() const { return results_.size(); }
    bool empty() const { return results_.empty(); }

private:
    bool has_status(Status status) const;

    std::vector<Result> results_;
};

} // namespace checkkit
