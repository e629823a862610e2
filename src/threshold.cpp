#include "checkkit/threshold.hpp"
#include "checkkit/number_format.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string_view>

namespace checkkit {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// [+-]? digits [. digits]  or  [+-]? . digits
double parse_number(std::string_view text, const std::string& expression) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        ++pos;
    }

    size_t digits = 0;
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
        ++digits;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
            ++digits;
        }
    }

    if (digits == 0 || pos != text.size()) {
        throw InvalidThresholdFormat(expression, "'" + std::string(text) + "' is not a number");
    }

    std::string number(text);
    double value = std::strtod(number.c_str(), nullptr);
    if (!std::isfinite(value)) {
        throw InvalidThresholdFormat(expression, "'" + number + "' is out of range");
    }
    return value;
}

} // namespace

InvalidThresholdFormat::InvalidThresholdFormat(const std::string& expression, const std::string& reason)
    : std::runtime_error("Error parsing threshold '" + expression + "': " + reason)
    , expression_(expression)
{
}

ThresholdRange::ThresholdRange(double lower, double upper, bool inverted)
    : lower_(lower)
    , upper_(upper)
    , inverted_(inverted)
{
    if (std::isnan(lower_) || std::isnan(upper_) || lower_ == kInfinity || upper_ == -kInfinity) {
        throw InvalidThresholdFormat(to_string(), "bounds are not numbers");
    }
    if (lower_ > upper_) {
        throw InvalidThresholdFormat(to_string(), "start must not be greater than end");
    }
    expression_ = to_string();
}

ThresholdRange ThresholdRange::parse(const std::string& expression) {
    std::string_view text = expression;
    bool inverted = false;

    if (!text.empty() && text.front() == '@') {
        inverted = true;
        text.remove_prefix(1);
    }
    if (text.empty()) {
        throw InvalidThresholdFormat(expression, "empty range");
    }

    double lower = 0.0;
    double upper = kInfinity;

    size_t colon = text.find(':');
    if (colon == std::string_view::npos) {
        // "N" is shorthand for "0:N"
        upper = parse_number(text, expression);
    } else {
        std::string_view start = text.substr(0, colon);
        std::string_view end = text.substr(colon + 1);

        if (start.empty() && end.empty()) {
            throw InvalidThresholdFormat(expression, "range has neither start nor end");
        }

        if (start.empty() || start == "~") {
            lower = -kInfinity;
        } else {
            lower = parse_number(start, expression);
        }

        if (!end.empty()) {
            upper = parse_number(end, expression);
        }
    }

    if (lower > upper) {
        throw InvalidThresholdFormat(expression, "start must not be greater than end");
    }

    ThresholdRange range(lower, upper, inverted);
    range.expression_ = expression;
    return range;
}

bool ThresholdRange::contains(double value) const {
    bool inside = value >= lower_ && value <= upper_;
    return inverted_ ? inside : !inside;
}

std::string ThresholdRange::to_string() const {
    std::string text;
    if (inverted_) {
        text += '@';
    }

    if (lower_ == -kInfinity) {
        text += '~';
    } else {
        text += format_number(lower_);
    }
    text += ':';

    if (upper_ != kInfinity) {
        text += format_number(upper_);
    }
    return text;
}

bool ThresholdRange::operator==(const ThresholdRange& other) const {
    return lower_ == other.lower_ && upper_ == other.upper_ && inverted_ == other.inverted_;
}

} // namespace checkkit
