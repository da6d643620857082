#pragma once

#include "netpilot/common/result.hpp"
#include "netpilot/testbed/topology.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netpilot::pipeline {

enum class OperationKind { Show, Configure, LearnConfig, LearnLogging, Ping, Linux };

[[nodiscard]] std::string_view operation_name(OperationKind kind);

/// Uniform result of every device operation.
struct ExecutionOutcome {
  OperationKind kind = OperationKind::Show;
  bool completed = false;
  std::string device;
  std::string command;
  std::vector<std::string> lines_sent;
  /// Cleaned device output.
  std::string output;
  std::optional<std::string> parsed_output;
  std::optional<std::string> parser_used;
  std::string error;
  common::ErrorKind error_kind = common::ErrorKind::None;

  [[nodiscard]] std::string to_json() const;
};

[[nodiscard]] ExecutionOutcome make_error(OperationKind kind, std::string device,
                                          const common::Status &status);

/// {"status":"completed","devices":{name:{os,type,platform,connections[]}}}
[[nodiscard]] std::string devices_to_json(const testbed::TopologySnapshot &topology);

/// {"status":"error","error":...}
[[nodiscard]] std::string error_json(const std::string &message);

} // namespace netpilot::pipeline
