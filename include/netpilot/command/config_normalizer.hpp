#pragma once

#include <string>
#include <variant>
#include <vector>

namespace netpilot::command {

/// Either a multi-line block of CLI text or an explicit list of lines.
using ConfigPayload = std::variant<std::string, std::vector<std::string>>;

/// True for configuration-mode enter/exit commands ("configure terminal", "end", ...).
[[nodiscard]] bool is_mode_wrapper(const std::string &line);

/// Canonical ordered CLI lines: wrappers and blank lines removed, semicolon-joined
/// commands split, sub-mode indentation kept.
[[nodiscard]] std::vector<std::string> normalize_config(const ConfigPayload &payload);

} // namespace netpilot::command
