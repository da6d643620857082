#include "netpilot/scripts/safety_gate.hpp"

#include "netpilot/common/fs.hpp"

#include <regex>

namespace netpilot::scripts {

ScriptSafetyGate::ScriptSafetyGate()
    : ScriptSafetyGate({"socket", "requests", "urllib", "httpx", "telnetlib", "paramiko", "netmiko"},
                       {R"(\.connect\()", R"(\.disconnect\()", R"(Testbed\()", R"(loader\.load)",
                        R"(subprocess\.)", R"(os\.system)", R"(eval\()", R"(exec\()",
                        "__import__"}) {}

ScriptSafetyGate::ScriptSafetyGate(std::vector<std::string> banned_imports,
                                   std::vector<std::string> banned_patterns)
    : banned_imports_(std::move(banned_imports)), banned_patterns_(std::move(banned_patterns)) {}

std::optional<std::string> ScriptSafetyGate::check(const std::string &script) const {
  const std::string lowered = common::to_lower(script);
  for (const auto &module : banned_imports_) {
    if (lowered.find("import " + module) != std::string::npos ||
        lowered.find("from " + module) != std::string::npos) {
      return "Script contains banned import: " + module;
    }
  }

  for (const auto &pattern : banned_patterns_) {
    const std::regex compiled(pattern, std::regex::ECMAScript | std::regex::icase);
    if (std::regex_search(script, compiled)) {
      return "Script contains banned pattern: " + pattern;
    }
  }

  return std::nullopt;
}

} // namespace netpilot::scripts
