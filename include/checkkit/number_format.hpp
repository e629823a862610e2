#pragma once

#include <string>

namespace checkkit {

// Integral values print without a decimal point, others in fixed notation
// with the fewest digits that parse back to the same value (no exponent).
// NaN and infinities print as "U".
std::string format_number(double value);

} // namespace checkkit
