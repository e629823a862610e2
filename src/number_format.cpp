#include "checkkit/number_format.hpp"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace checkkit {

namespace {

// Enough fractional digits for the smallest subnormal
constexpr int kMaxFractionDigits = 1074;

} // namespace

std::string format_number(double value) {
    if (!std::isfinite(value)) {
        return "U";
    }

    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }

    // Fewest fractional digits that read back as the same double.
    // Perfdata and ranges have no exponent form, so stay in fixed notation.
    std::string text;
    for (int precision = 0; precision <= kMaxFractionDigits; ++precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        text = oss.str();
        if (std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }

    if (text.find('.') != std::string::npos) {
        size_t last = text.find_last_not_of('0');
        if (text[last] == '.') {
            --last;
        }
        text.erase(last + 1);
    }

    if (text == "-0") {
        return "0";
    }
    return text;
}

} // namespace checkkit
