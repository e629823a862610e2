#pragma once

#include "checkkit/threshold.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace checkkit {

class InvalidPerfdataLabel : public std::runtime_error {
public:
    explicit InvalidPerfdataLabel(const std::string& label);
};

// Unit or threshold text that would split the perfdata token
class InvalidPerfdataField : public std::runtime_error {
public:
    InvalidPerfdataField(const std::string& field, const std::string& text);
};

// Threshold column of a perfdata token. Text is kept as written,
// a parsed range is written in its canonical form.
class ThresholdSpec {
public:
    ThresholdSpec(const char* expression) : text_(expression) {}
    ThresholdSpec(std::string expression) : text_(std::move(expression)) {}
    ThresholdSpec(const ThresholdRange& range) : text_(range.to_string()) {}

    const std::string& text() const { return text_; }

private:
    std::string text_;
};

struct PerfDatum {
    std::string label;
    double value = 0.0;
    std::string uom;
    std::optional<std::string> warning;
    std::optional<std::string> critical;
    std::optional<double> minimum;
    std::optional<double> maximum;
};

// 'label'=value[uom];[warn];[crit];[min];[max]
std::string format_perfdatum(const PerfDatum& datum);

class PerfData {
public:
    // Throws InvalidPerfdataLabel or InvalidPerfdataField; the list is
    // unchanged on failure
    void add(const std::string& label,
             double value,
             const std::string& uom = "",
             const std::optional<ThresholdSpec>& warning = std::nullopt,
             const std::optional<ThresholdSpec>& critical = std::nullopt,
             std::optional<double> minimum = std::nullopt,
             std::optional<double> maximum = std::nullopt);

    // Space separated tokens in insertion order, "" when empty
    std::string render() const;

    const std::vector<PerfDatum>& data() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    std::vector<PerfDatum> data_;
};

} // namespace checkkit
