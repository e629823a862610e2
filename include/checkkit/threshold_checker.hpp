#pragma once

#include "checkkit/status.hpp"
#include "checkkit/threshold.hpp"
#include <optional>
#include <string>

namespace checkkit {

// Critical is tested first, then warning. No thresholds means Ok.
Status check_threshold(double value,
                       const std::optional<ThresholdRange>& warning = std::nullopt,
                       const std::optional<ThresholdRange>& critical = std::nullopt);

// Same, from threshold expressions as given on the command line.
// Throws InvalidThresholdFormat before evaluating anything.
Status check_threshold_text(double value,
                            const std::optional<std::string>& warning,
                            const std::optional<std::string>& critical);

} // namespace checkkit
