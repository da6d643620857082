#include "netpilot/tools/tool_registry.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/observability/global.hpp"
#include "netpilot/pipeline/outcome.hpp"
#include "netpilot/tools/builtin/device_tools.hpp"
#include "netpilot/tools/builtin/dynamic_test.hpp"

#include <chrono>
#include <exception>

namespace netpilot::tools {

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  ITool *raw = tool.get();
  by_name_[common::to_lower(std::string(raw->name()))] = raw;
  tools_.push_back(std::move(tool));
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

std::vector<ITool *> ToolRegistry::all_tools() const {
  std::vector<ITool *> out;
  out.reserve(tools_.size());
  for (const auto &tool : tools_) {
    out.push_back(tool.get());
  }
  return out;
}

std::string ToolRegistry::invoke(const std::string_view name, const ToolArgs &args) const {
  ITool *tool = get_tool(name);
  if (tool == nullptr) {
    return pipeline::error_json("Unknown tool: " + std::string(name));
  }

  const auto started = std::chrono::steady_clock::now();
  std::string output;
  bool success = false;
  try {
    const auto result = tool->execute(args);
    if (result.ok()) {
      output = result.value().output;
      success = result.value().success;
    } else {
      output = pipeline::error_json(result.error());
    }
  } catch (const std::exception &e) {
    observability::record_error("tools", std::string(name) + ": " + e.what());
    output = pipeline::error_json(e.what());
  }

  observability::record_tool_call(std::string(tool->name()),
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - started),
                                  success);
  return output;
}

std::future<std::string> ToolRegistry::invoke_async(std::string name, ToolArgs args) const {
  return std::async(std::launch::async, [this, name = std::move(name), args = std::move(args)]() {
    return invoke(name, args);
  });
}

ToolRegistry ToolRegistry::create_default(std::shared_ptr<pipeline::CommandPipeline> pipeline,
                                          std::shared_ptr<scripts::ScriptRunner> script_runner) {
  ToolRegistry registry;
  registry.register_tool(std::make_unique<ListDevicesTool>(pipeline));
  registry.register_tool(std::make_unique<RunShowCommandTool>(pipeline));
  registry.register_tool(std::make_unique<ConfigureDeviceTool>(pipeline));
  registry.register_tool(std::make_unique<ShowRunningConfigTool>(pipeline));
  registry.register_tool(std::make_unique<ShowLoggingTool>(pipeline));
  registry.register_tool(std::make_unique<PingFromDeviceTool>(pipeline));
  registry.register_tool(std::make_unique<RunLinuxCommandTool>(pipeline));
  registry.register_tool(std::make_unique<RunDynamicTestTool>(std::move(script_runner)));
  return registry;
}

} // namespace netpilot::tools
