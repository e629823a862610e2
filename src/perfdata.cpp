#include "checkkit/perfdata.hpp"
#include "checkkit/number_format.hpp"

namespace checkkit {

namespace {

// '=' cannot be escaped inside a label and a line break would end the
// plugin output early. Quotes and spaces are handled by quoting.
bool is_valid_label(const std::string& label) {
    return !label.empty() && label.find_first_of("=\r\n") == std::string::npos;
}

// Unit and thresholds sit between the token's ';' separators
bool is_valid_field(const std::string& text) {
    return text.find_first_of("; \t\r\n") == std::string::npos;
}

std::string quote_label(const std::string& label) {
    std::string quoted = "'";
    for (char c : label) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace

InvalidPerfdataLabel::InvalidPerfdataLabel(const std::string& label)
    : std::runtime_error("Invalid perfdata label: '" + label + "'")
{
}

InvalidPerfdataField::InvalidPerfdataField(const std::string& field, const std::string& text)
    : std::runtime_error("Invalid perfdata " + field + ": '" + text + "'")
{
}

std::string format_perfdatum(const PerfDatum& datum) {
    std::string token = quote_label(datum.label);
    token += '=';
    token += format_number(datum.value);
    token += datum.uom;
    token += ';';
    if (datum.warning) token += *datum.warning;
    token += ';';
    if (datum.critical) token += *datum.critical;
    token += ';';
    if (datum.minimum) token += format_number(*datum.minimum);
    token += ';';
    if (datum.maximum) token += format_number(*datum.maximum);
    return token;
}

void PerfData::add(const std::string& label,
                   double value,
                   const std::string& uom,
                   const std::optional<ThresholdSpec>& warning,
                   const std::optional<ThresholdSpec>& critical,
                   std::optional<double> minimum,
                   std::optional<double> maximum) {
    if (!is_valid_label(label)) {
        throw InvalidPerfdataLabel(label);
    }
    if (!is_valid_field(uom)) {
        throw InvalidPerfdataField("unit", uom);
    }
    if (warning && !is_valid_field(warning->text())) {
        throw InvalidPerfdataField("warning threshold", warning->text());
    }
    if (critical && !is_valid_field(critical->text())) {
        throw InvalidPerfdataField("critical threshold", critical->text());
    }

    PerfDatum datum;
    datum.label = label;
    datum.value = value;
    datum.uom = uom;
    if (warning) datum.warning = warning->text();
    if (critical) datum.critical = critical->text();
    datum.minimum = minimum;
    datum.maximum = maximum;

    data_.push_back(std::move(datum));
}

std::string PerfData::render() const {
    std::string rendered;
    for (const auto& datum : data_) {
        if (!rendered.empty()) {
            rendered += ' ';
        }
        rendered += format_perfdatum(datum);
    }
    return rendered;
}

} // namespace checkkit
