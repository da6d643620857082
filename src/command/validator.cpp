#include "netpilot/command/validator.hpp"

#include "netpilot/common/fs.hpp"

#include <array>
#include <regex>
#include <string_view>

namespace netpilot::command {

namespace {

constexpr std::array<std::string_view, 7> DISALLOWED_TERMS = {
    "copy", "delete", "erase", "reload", "write", "configure", "conf",
};

} // namespace

std::optional<std::string> validate_show_command(const std::string &command) {
  const std::string lowered = common::to_lower(common::trim(command));

  if (!common::starts_with(lowered, "show")) {
    return "Command '" + command + "' is not a 'show' command.";
  }

  if (lowered.find_first_of("|><") != std::string::npos) {
    return "Command '" + command + "' contains disallowed pipe/redirection.";
  }

  static const std::regex token_pattern("[a-z0-9_-]+");
  for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), token_pattern);
       it != std::sregex_iterator(); ++it) {
    const std::string token = it->str();
    for (const auto term : DISALLOWED_TERMS) {
      if (token == term) {
        return "Command '" + command + "' contains disallowed term '" + token + "'.";
      }
    }
  }

  return std::nullopt;
}

} // namespace netpilot::command
