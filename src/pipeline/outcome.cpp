#include "netpilot/pipeline/outcome.hpp"

#include "netpilot/common/json_util.hpp"

#include <sstream>

namespace netpilot::pipeline {

namespace {

bool carries_command(const OperationKind kind) {
  return kind == OperationKind::Show || kind == OperationKind::Ping ||
         kind == OperationKind::Linux;
}

const char *output_field(const OperationKind kind) {
  switch (kind) {
  case OperationKind::Configure:
  case OperationKind::Show:
  case OperationKind::Ping:
    return "raw_output";
  case OperationKind::LearnConfig:
    return "running_config";
  case OperationKind::LearnLogging:
    return "logging";
  case OperationKind::Linux:
    return "output";
  }
  return "raw_output";
}

std::string nullable(const std::optional<std::string> &value, const bool quote) {
  if (!value.has_value()) {
    return "null";
  }
  return quote ? common::json_quote(*value) : *value;
}

} // namespace

std::string_view operation_name(const OperationKind kind) {
  switch (kind) {
  case OperationKind::Show:
    return "show";
  case OperationKind::Configure:
    return "configure";
  case OperationKind::LearnConfig:
    return "learn_config";
  case OperationKind::LearnLogging:
    return "learn_logging";
  case OperationKind::Ping:
    return "ping";
  case OperationKind::Linux:
    return "linux";
  }
  return "unknown";
}

std::string ExecutionOutcome::to_json() const {
  std::ostringstream out;
  out << "{\"status\":" << (completed ? "\"completed\"" : "\"error\"")
      << ",\"device\":" << common::json_quote(device);
  if (carries_command(kind)) {
    out << ",\"command\":" << common::json_quote(command);
  }
  if (kind == OperationKind::Configure) {
    out << ",\"lines_sent\":" << common::json_string_array(lines_sent);
  }

  if (!completed) {
    out << ",\"error\":" << common::json_quote(error) << "}";
    return out.str();
  }

  if (parsed_output.has_value()) {
    out << ",\"parsed_output\":" << *parsed_output;
  }
  out << ",\"" << output_field(kind) << "\":" << common::json_quote(output);
  if (kind == OperationKind::Show || kind == OperationKind::Ping) {
    out << ",\"parser_used\":" << nullable(parser_used, true);
  }
  out << "}";
  return out.str();
}

ExecutionOutcome make_error(const OperationKind kind, std::string device,
                            const common::Status &status) {
  ExecutionOutcome outcome;
  outcome.kind = kind;
  outcome.completed = false;
  outcome.device = std::move(device);
  outcome.error = status.error();
  outcome.error_kind = status.kind();
  return outcome;
}

std::string devices_to_json(const testbed::TopologySnapshot &topology) {
  std::ostringstream out;
  out << "{\"status\":\"completed\",\"devices\":{";
  bool first = true;
  for (const auto &device : topology.devices()) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(device.name) << ":{\"os\":" << common::json_quote(device.os)
        << ",\"type\":" << common::json_quote(device.type)
        << ",\"platform\":" << common::json_quote(device.platform)
        << ",\"connections\":" << common::json_string_array(device.connection_labels()) << "}";
  }
  out << "}}";
  return out.str();
}

std::string error_json(const std::string &message) {
  return "{\"status\":\"error\",\"error\":" + common::json_quote(message) + "}";
}

} // namespace netpilot::pipeline
