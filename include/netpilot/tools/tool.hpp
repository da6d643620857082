#pragma once

#include "netpilot/common/result.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace netpilot::tools {

using ToolArgs = std::unordered_map<std::string, std::string>;

struct ToolResult {
  /// JSON object carrying "status" and the operation's fields.
  std::string output;
  bool success = true;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  bool safe = false;
  std::string group;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args) = 0;

  /// Read-only tools never change device state.
  [[nodiscard]] virtual bool is_safe() const = 0;
  [[nodiscard]] virtual std::string_view group() const = 0;

  [[nodiscard]] ToolSpec spec() const;
};

[[nodiscard]] common::Result<std::string> required_arg(const ToolArgs &args,
                                                       const std::string &name);

} // namespace netpilot::tools
