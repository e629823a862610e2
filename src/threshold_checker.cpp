#include "checkkit/threshold_checker.hpp"

namespace checkkit {

Status check_threshold(double value,
                       const std::optional<ThresholdRange>& warning,
                       const std::optional<ThresholdRange>& critical) {
    if (critical && critical->contains(value)) {
        return Status::Critical;
    } else if (warning && warning->contains(value)) {
        return Status::Warning;
    }
    return Status::Ok;
}

Status check_threshold_text(double value,
                            const std::optional<std::string>& warning,
                            const std::optional<std::string>& critical) {
    std::optional<ThresholdRange> warning_range;
    std::optional<ThresholdRange> critical_range;

    if (warning) {
        warning_range = ThresholdRange::parse(*warning);
    }
    if (critical) {
        critical_range = ThresholdRange::parse(*critical);
    }
    return check_threshold(value, warning_range, critical_range);
}

} // namespace checkkit
