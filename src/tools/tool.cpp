#include "netpilot/tools/tool.hpp"

#include "netpilot/common/fs.hpp"

namespace netpilot::tools {

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .safe = is_safe(),
                  .group = std::string(group())};
}

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end() || common::trim(it->second).empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "Missing argument: " + name);
  }
  return common::Result<std::string>::success(it->second);
}

} // namespace netpilot::tools
