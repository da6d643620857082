#pragma once

#include <string>

namespace netpilot::command {

/// Strip ANSI/VT100 escape sequences, then drop every byte outside the
/// printable ASCII set (letters, digits, punctuation, space, \t \n \r \v \f).
[[nodiscard]] std::string clean_output(const std::string &raw);

} // namespace netpilot::command
