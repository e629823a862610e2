#pragma once

#include "checkkit/status.hpp"
#include <string>

namespace checkkit {

// Plugin output as read by the monitoring core:
//
//   <message>[ | <perfdata>]\n
//   [<extended data>\n]
std::string render_output(const std::string& message,
                          const std::string& perfdata,
                          const std::string& extdata);

// "NAME STATUS - message" with the name upper-cased
std::string format_summary(const std::string& name, Status status, const std::string& message);

} // namespace checkkit
