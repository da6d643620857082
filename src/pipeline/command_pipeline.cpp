#include "netpilot/pipeline/command_pipeline.hpp"

#include "netpilot/command/output_cleaner.hpp"
#include "netpilot/command/validator.hpp"
#include "netpilot/common/fs.hpp"
#include "netpilot/observability/global.hpp"

#include <exception>

namespace netpilot::pipeline {

namespace {

constexpr const char *RUNNING_CONFIG_COMMAND = "show running-config";
constexpr const char *LOGGING_COMMAND = "show logging";

bool is_device_failure(const common::ErrorKind kind) {
  return kind == common::ErrorKind::Connection || kind == common::ErrorKind::Execution ||
         kind == common::ErrorKind::Timeout;
}

ExecutionOutcome start(const OperationKind kind, const std::string &device,
                       const std::string &command = "") {
  ExecutionOutcome outcome;
  outcome.kind = kind;
  outcome.device = device;
  outcome.command = command;
  return outcome;
}

void fail(ExecutionOutcome &outcome, const common::ErrorKind kind, std::string message) {
  outcome.completed = false;
  outcome.error_kind = kind;
  outcome.error = std::move(message);
  observability::record_error(std::string(operation_name(outcome.kind)),
                              outcome.device + ": " + outcome.error);
}

} // namespace

CommandPipeline::CommandPipeline(std::shared_ptr<testbed::TopologyCache> topology,
                                 std::shared_ptr<device::SessionCache> sessions,
                                 std::shared_ptr<const parsing::IParserRegistry> parsers,
                                 OperationTimeouts timeouts)
    : topology_(std::move(topology)), sessions_(std::move(sessions)),
      parsers_(std::move(parsers)), timeouts_(timeouts) {}

void CommandPipeline::execute(ExecutionOutcome &outcome, const Step &step,
                              const bool attempt_parse) {
  auto leased = sessions_->acquire(outcome.device);
  if (!leased.ok()) {
    fail(outcome, leased.kind(), leased.error());
    return;
  }
  device::SessionLease lease = std::move(leased.value());

  const auto started = std::chrono::steady_clock::now();
  common::Result<std::string> raw = common::Result<std::string>::failure("not executed");
  try {
    raw = step(lease.client());
  } catch (const std::exception &e) {
    raw = common::Result<std::string>::failure(common::ErrorKind::Execution, e.what());
  }
  observability::record_metric(observability::CommandLatencyMetric{
      .device = outcome.device,
      .operation = std::string(operation_name(outcome.kind)),
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});

  if (!raw.ok()) {
    if (is_device_failure(raw.kind())) {
      lease.mark_failed();
    }
    fail(outcome, raw.kind(), raw.error());
    return;
  }

  outcome.completed = true;
  outcome.output = command::clean_output(raw.value());
  if (attempt_parse) {
    try_parse(outcome);
  }
}

void CommandPipeline::try_parse(ExecutionOutcome &outcome) {
  if (parsers_ == nullptr) {
    return;
  }
  testbed::TopologyPtr holder;
  const auto device = topology_->find_device(outcome.device, holder);
  if (!device.ok()) {
    return;
  }
  const auto parser = parsers_->find(outcome.command, *device.value());
  if (parser == nullptr) {
    return;
  }

  try {
    const auto parsed = parser->parse(outcome.output);
    if (!parsed.ok()) {
      observability::record_warning("parsing", "Parser failed: " + parsed.error());
      return;
    }
    outcome.parsed_output = parsed.value();
    outcome.parser_used = std::string(parser->name());
  } catch (const std::exception &e) {
    observability::record_warning("parsing", std::string("Parser failed: ") + e.what());
  }
}

ExecutionOutcome CommandPipeline::run_show(const std::string &device, const std::string &command) {
  auto outcome = start(OperationKind::Show, device, command);
  if (const auto rejected = command::validate_show_command(command); rejected.has_value()) {
    fail(outcome, common::ErrorKind::Validation, *rejected);
    return outcome;
  }
  const auto timeout = timeouts_.show;
  execute(
      outcome, [&](device::IDeviceClient &client) { return client.execute(command, timeout); },
      true);
  return outcome;
}

ExecutionOutcome CommandPipeline::apply_configuration(const std::string &device,
                                                      const command::ConfigPayload &payload) {
  auto outcome = start(OperationKind::Configure, device);
  outcome.lines_sent = command::normalize_config(payload);
  if (outcome.lines_sent.empty()) {
    fail(outcome, common::ErrorKind::Validation, "No valid configuration lines provided.");
    return outcome;
  }
  const auto timeout = timeouts_.configure;
  execute(
      outcome,
      [&](device::IDeviceClient &client) { return client.configure(outcome.lines_sent, timeout); },
      false);
  return outcome;
}

ExecutionOutcome CommandPipeline::learn_config(const std::string &device) {
  auto outcome = start(OperationKind::LearnConfig, device, RUNNING_CONFIG_COMMAND);
  const auto timeout = timeouts_.learn_config;
  execute(
      outcome,
      [&](device::IDeviceClient &client) { return client.execute(RUNNING_CONFIG_COMMAND, timeout); },
      false);
  return outcome;
}

ExecutionOutcome CommandPipeline::learn_logging(const std::string &device) {
  auto outcome = start(OperationKind::LearnLogging, device, LOGGING_COMMAND);
  const auto timeout = timeouts_.learn_logging;
  execute(
      outcome,
      [&](device::IDeviceClient &client) { return client.execute(LOGGING_COMMAND, timeout); },
      false);
  return outcome;
}

ExecutionOutcome CommandPipeline::ping(const std::string &device, const std::string &command) {
  auto outcome = start(OperationKind::Ping, device, command);
  if (common::trim(command).empty()) {
    fail(outcome, common::ErrorKind::Validation, "Ping command must not be empty.");
    return outcome;
  }
  const auto timeout = timeouts_.ping;
  execute(
      outcome, [&](device::IDeviceClient &client) { return client.execute(command, timeout); },
      true);
  return outcome;
}

ExecutionOutcome CommandPipeline::run_linux_command(const std::string &device,
                                                    const std::string &command) {
  auto outcome = start(OperationKind::Linux, device, command);
  if (common::trim(command).empty()) {
    fail(outcome, common::ErrorKind::Validation, "Command must not be empty.");
    return outcome;
  }
  const auto timeout = timeouts_.linux_command;
  execute(
      outcome, [&](device::IDeviceClient &client) { return client.execute(command, timeout); },
      false);
  return outcome;
}

std::string CommandPipeline::list_devices() {
  const auto topology = topology_->get();
  if (!topology.ok()) {
    return error_json(topology.error());
  }
  return devices_to_json(*topology.value());
}

std::future<ExecutionOutcome> CommandPipeline::run_show_async(std::string device,
                                                              std::string command) {
  return std::async(std::launch::async, [this, device = std::move(device),
                                         command = std::move(command)]() {
    return run_show(device, command);
  });
}

std::future<ExecutionOutcome>
CommandPipeline::apply_configuration_async(std::string device, command::ConfigPayload payload) {
  return std::async(std::launch::async, [this, device = std::move(device),
                                         payload = std::move(payload)]() {
    return apply_configuration(device, payload);
  });
}

std::future<ExecutionOutcome> CommandPipeline::learn_config_async(std::string device) {
  return std::async(std::launch::async,
                    [this, device = std::move(device)]() { return learn_config(device); });
}

std::future<ExecutionOutcome> CommandPipeline::learn_logging_async(std::string device) {
  return std::async(std::launch::async,
                    [this, device = std::move(device)]() { return learn_logging(device); });
}

std::future<ExecutionOutcome> CommandPipeline::ping_async(std::string device, std::string command) {
  return std::async(std::launch::async, [this, device = std::move(device),
                                         command = std::move(command)]() {
    return ping(device, command);
  });
}

std::future<ExecutionOutcome> CommandPipeline::run_linux_command_async(std::string device,
                                                                       std::string command) {
  return std::async(std::launch::async, [this, device = std::move(device),
                                         command = std::move(command)]() {
    return run_linux_command(device, command);
  });
}

} // namespace netpilot::pipeline
