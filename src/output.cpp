#include "checkkit/output.hpp"
#include <algorithm>
#include <cctype>

namespace checkkit {

std::string render_output(const std::string& message,
                          const std::string& perfdata,
                          const std::string& extdata) {
    std::string output = message;
    if (!perfdata.empty()) {
        output += " | ";
        output += perfdata;
    }
    output += '\n';

    if (!extdata.empty()) {
        output += extdata;
        output += '\n';
    }
    return output;
}

std::string format_summary(const std::string& name, Status status, const std::string& message) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    return upper + " " + to_string(status) + " - " + message;
}

} // namespace checkkit
