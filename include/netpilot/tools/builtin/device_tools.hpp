#pragma once

#include "netpilot/command/config_normalizer.hpp"
#include "netpilot/pipeline/command_pipeline.hpp"
#include "netpilot/tools/tool.hpp"

#include <memory>

namespace netpilot::tools {

/// "config_commands" as received: a JSON array of lines or a block of text.
[[nodiscard]] command::ConfigPayload config_payload_from_arg(const std::string &raw);

class DeviceTool : public ITool {
public:
  explicit DeviceTool(std::shared_ptr<pipeline::CommandPipeline> pipeline);

  [[nodiscard]] std::string_view group() const override;

protected:
  [[nodiscard]] static ToolResult from_outcome(const pipeline::ExecutionOutcome &outcome);

  std::shared_ptr<pipeline::CommandPipeline> pipeline_;
};

class ListDevicesTool final : public DeviceTool {
public:
  using DeviceTool::DeviceTool;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args) override;
  [[nodiscard]] bool is_safe() const override;
};

class RunShowCommandTool final : public DeviceTool {
public:
  using DeviceTool::DeviceTool;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args) override;
  [[nodiscard]] bool is_safe() const override;
};

class ConfigureDeviceTool final : public DeviceTool {
public:
  using DeviceTool::DeviceTool;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args) override;
  [[nodiscard]] bool is_safe() const override;
};

class ShowRunningConfigTool final : public DeviceTool {
public:
  using DeviceTool::DeviceTool;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args) override;
  [[nodiscard]] bool is_safe() const override;
};

class ShowLoggingTool final : public DeviceTool {
public:
  using DeviceTool::DeviceTool;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args) override;
  [[nodiscard]] bool is_safe() const override;
};

class PingFromDeviceTool final : public DeviceTool {
public:
  using DeviceTool::DeviceTool;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args) override;
  [[nodiscard]] bool is_safe() const override;
};

class RunLinuxCommandTool final : public DeviceTool {
public:
  using DeviceTool::DeviceTool;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args) override;
  [[nodiscard]] bool is_safe() const override;
};

} // namespace netpilot::tools
