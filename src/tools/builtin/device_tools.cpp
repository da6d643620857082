#include "netpilot/tools/builtin/device_tools.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/common/json_util.hpp"

namespace netpilot::tools {

namespace {

constexpr const char *DEVICE_GROUP = "devices";

constexpr const char *DEVICE_ONLY_SCHEMA =
    R"({"type":"object","required":["device_name"],"properties":{"device_name":{"type":"string"},"toolCallId":{"type":"string"}}})";

constexpr const char *DEVICE_COMMAND_SCHEMA =
    R"({"type":"object","required":["device_name","command"],"properties":{"device_name":{"type":"string"},"command":{"type":"string"},"toolCallId":{"type":"string"}}})";

} // namespace

command::ConfigPayload config_payload_from_arg(const std::string &raw) {
  const std::string trimmed = common::trim(raw);
  if (trimmed.empty() || trimmed.front() != '[' || !common::json_is_valid(trimmed)) {
    return raw;
  }
  // Strings are unescaped; any other element keeps its JSON text as one line.
  std::vector<std::string> lines;
  for (const auto &element : common::json_array_elements(trimmed)) {
    if (element.size() >= 2 && element.front() == '"') {
      lines.push_back(common::json_unescape(element.substr(1, element.size() - 2)));
    } else {
      lines.push_back(element);
    }
  }
  return lines;
}

DeviceTool::DeviceTool(std::shared_ptr<pipeline::CommandPipeline> pipeline)
    : pipeline_(std::move(pipeline)) {}

std::string_view DeviceTool::group() const { return DEVICE_GROUP; }

ToolResult DeviceTool::from_outcome(const pipeline::ExecutionOutcome &outcome) {
  return ToolResult{.output = outcome.to_json(), .success = outcome.completed};
}

// pyats_list_devices

std::string_view ListDevicesTool::name() const { return "pyats_list_devices"; }

std::string_view ListDevicesTool::description() const {
  return "List all devices available in the testbed with their properties";
}

std::string ListDevicesTool::parameters_schema() const {
  return R"({"type":"object","properties":{"toolCallId":{"type":"string"}}})";
}

common::Result<ToolResult> ListDevicesTool::execute(const ToolArgs &args) {
  (void)args;
  std::string output = pipeline_->list_devices();
  const bool success = common::json_get_string(output, "status") == "completed";
  return common::Result<ToolResult>::success(
      ToolResult{.output = std::move(output), .success = success});
}

bool ListDevicesTool::is_safe() const { return true; }

// pyats_run_show_command

std::string_view RunShowCommandTool::name() const { return "pyats_run_show_command"; }

std::string_view RunShowCommandTool::description() const {
  return "Execute a show command on a device and return parsed output (or raw if no parser "
         "applies). Not for 'show logging' or 'show running-config'; no pipes or redirects";
}

std::string RunShowCommandTool::parameters_schema() const { return DEVICE_COMMAND_SCHEMA; }

common::Result<ToolResult> RunShowCommandTool::execute(const ToolArgs &args) {
  const auto device = required_arg(args, "device_name");
  if (!device.ok()) {
    return common::Result<ToolResult>::failure(device.status());
  }
  const auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ToolResult>::failure(command.status());
  }
  return common::Result<ToolResult>::success(
      from_outcome(pipeline_->run_show(device.value(), command.value())));
}

bool RunShowCommandTool::is_safe() const { return true; }

// pyats_configure_device

std::string_view ConfigureDeviceTool::name() const { return "pyats_configure_device"; }

std::string_view ConfigureDeviceTool::description() const {
  return "Apply configuration to a device. Pass a list of lines or a multiline block; "
         "config mode entry and exit are handled automatically, sub-mode indentation is kept";
}

std::string ConfigureDeviceTool::parameters_schema() const {
  return R"({"type":"object","required":["device_name","config_commands"],"properties":{"device_name":{"type":"string"},"config_commands":{"oneOf":[{"type":"string"},{"type":"array","items":{"type":"string"}}]},"toolCallId":{"type":"string"}}})";
}

common::Result<ToolResult> ConfigureDeviceTool::execute(const ToolArgs &args) {
  const auto device = required_arg(args, "device_name");
  if (!device.ok()) {
    return common::Result<ToolResult>::failure(device.status());
  }
  const auto it = args.find("config_commands");
  const std::string raw = it == args.end() ? std::string() : it->second;
  return common::Result<ToolResult>::success(from_outcome(
      pipeline_->apply_configuration(device.value(), config_payload_from_arg(raw))));
}

bool ConfigureDeviceTool::is_safe() const { return false; }

// pyats_show_running_config

std::string_view ShowRunningConfigTool::name() const { return "pyats_show_running_config"; }

std::string_view ShowRunningConfigTool::description() const {
  return "Retrieve the running configuration of a device";
}

std::string ShowRunningConfigTool::parameters_schema() const { return DEVICE_ONLY_SCHEMA; }

common::Result<ToolResult> ShowRunningConfigTool::execute(const ToolArgs &args) {
  const auto device = required_arg(args, "device_name");
  if (!device.ok()) {
    return common::Result<ToolResult>::failure(device.status());
  }
  return common::Result<ToolResult>::success(from_outcome(pipeline_->learn_config(device.value())));
}

bool ShowRunningConfigTool::is_safe() const { return true; }

// pyats_show_logging

std::string_view ShowLoggingTool::name() const { return "pyats_show_logging"; }

std::string_view ShowLoggingTool::description() const { return "Retrieve recent device logs"; }

std::string ShowLoggingTool::parameters_schema() const { return DEVICE_ONLY_SCHEMA; }

common::Result<ToolResult> ShowLoggingTool::execute(const ToolArgs &args) {
  const auto device = required_arg(args, "device_name");
  if (!device.ok()) {
    return common::Result<ToolResult>::failure(device.status());
  }
  return common::Result<ToolResult>::success(
      from_outcome(pipeline_->learn_logging(device.value())));
}

bool ShowLoggingTool::is_safe() const { return true; }

// pyats_ping_from_network_device

std::string_view PingFromDeviceTool::name() const { return "pyats_ping_from_network_device"; }

std::string_view PingFromDeviceTool::description() const {
  return "Run a ping from a network device and return the parsed result when available";
}

std::string PingFromDeviceTool::parameters_schema() const { return DEVICE_COMMAND_SCHEMA; }

common::Result<ToolResult> PingFromDeviceTool::execute(const ToolArgs &args) {
  const auto device = required_arg(args, "device_name");
  if (!device.ok()) {
    return common::Result<ToolResult>::failure(device.status());
  }
  const auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ToolResult>::failure(command.status());
  }
  return common::Result<ToolResult>::success(
      from_outcome(pipeline_->ping(device.value(), command.value())));
}

bool PingFromDeviceTool::is_safe() const { return true; }

// pyats_run_linux_command

std::string_view RunLinuxCommandTool::name() const { return "pyats_run_linux_command"; }

std::string_view RunLinuxCommandTool::description() const {
  return "Execute a command on a Linux host from the testbed";
}

std::string RunLinuxCommandTool::parameters_schema() const { return DEVICE_COMMAND_SCHEMA; }

common::Result<ToolResult> RunLinuxCommandTool::execute(const ToolArgs &args) {
  const auto device = required_arg(args, "device_name");
  if (!device.ok()) {
    return common::Result<ToolResult>::failure(device.status());
  }
  const auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ToolResult>::failure(command.status());
  }
  return common::Result<ToolResult>::success(
      from_outcome(pipeline_->run_linux_command(device.value(), command.value())));
}

bool RunLinuxCommandTool::is_safe() const { return false; }

} // namespace netpilot::tools
