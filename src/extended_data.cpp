#include "checkkit/extended_data.hpp"

namespace checkkit {

void ExtendedData::add(const std::string& line) {
    lines_.push_back(line);
}

std::string ExtendedData::render() const {
    std::string rendered;
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (i > 0) {
            rendered += '\n';
        }
        rendered += lines_[i];
    }
    return rendered;
}

} // namespace checkkit
