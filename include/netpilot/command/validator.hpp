#pragma once

#include <optional>
#include <string>

namespace netpilot::command {

/// Returns the rejection reason, or nullopt when the command is a plain
/// read-only "show" command.
[[nodiscard]] std::optional<std::string> validate_show_command(const std::string &command);

} // namespace netpilot::command
