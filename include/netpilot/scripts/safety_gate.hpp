#pragma once

#include <optional>
#include <string>
#include <vector>

namespace netpilot::scripts {

/// Denylist screen for user-supplied test scripts. It rejects the obvious ways
/// of opening connections or spawning processes; it is not a sandbox.
class ScriptSafetyGate {
public:
  ScriptSafetyGate();
  ScriptSafetyGate(std::vector<std::string> banned_imports, std::vector<std::string> banned_patterns);

  /// The first rule the script breaks, or nullopt when it passes.
  [[nodiscard]] std::optional<std::string> check(const std::string &script) const;

  [[nodiscard]] const std::vector<std::string> &banned_imports() const { return banned_imports_; }
  [[nodiscard]] const std::vector<std::string> &banned_patterns() const { return banned_patterns_; }

private:
  std::vector<std::string> banned_imports_;
  std::vector<std::string> banned_patterns_;
};

} // namespace netpilot::scripts
