#pragma once

#include <stdexcept>
#include <string>

namespace checkkit {

class InvalidThresholdFormat : public std::runtime_error {
public:
    InvalidThresholdFormat(const std::string& expression, const std::string& reason);

    const std::string& expression() const { return expression_; }

private:
    std::string expression_;
};

// A monitoring-plugins range: [@]start:end
//
//   10      alarm if < 0 or > 10
//   10:     alarm if < 10
//   :10     alarm if > 10
//   ~:10    same as :10
//   10:20   alarm if < 10 or > 20
//   @10:20  alarm if >= 10 and <= 20
//
// Unbounded ends are held as -inf / +inf.
class ThresholdRange {
public:
    ThresholdRange(double lower, double upper, bool inverted = false);

    // Throws InvalidThresholdFormat
    static ThresholdRange parse(const std::string& expression);

    // True when the value raises an alarm for this range
    bool contains(double value) const;

    double lower() const { return lower_; }
    double upper() const { return upper_; }
    bool inverted() const { return inverted_; }

    // Text this range was parsed from (canonical text if built directly)
    const std::string& expression() const { return expression_; }

    // Canonical form, e.g. "@~:10", "5:", "0:10"
    std::string to_string() const;

    bool operator==(const ThresholdRange& other) const;
    bool operator!=(const ThresholdRange& other) const { return !(*this == other); }

private:
    double lower_;
    double upper_;
    bool inverted_;
    std::string expression_;
};

} // namespace checkkit
