#pragma once

#include "netpilot/pipeline/command_pipeline.hpp"
#include "netpilot/scripts/script_runner.hpp"
#include "netpilot/tools/tool.hpp"

#include <future>
#include <memory>
#include <unordered_map>
#include <vector>

namespace netpilot::tools {

class ToolRegistry {
public:
  ToolRegistry() = default;

  void register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::vector<ITool *> all_tools() const;

  /// Runs a tool by name and always yields a JSON object; failures become
  /// {"status":"error","error":...}.
  [[nodiscard]] std::string invoke(std::string_view name, const ToolArgs &args) const;
  [[nodiscard]] std::future<std::string> invoke_async(std::string name, ToolArgs args) const;

  [[nodiscard]] static ToolRegistry
  create_default(std::shared_ptr<pipeline::CommandPipeline> pipeline,
                 std::shared_ptr<scripts::ScriptRunner> script_runner);

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace netpilot::tools
