#pragma once

#include "netpilot/command/config_normalizer.hpp"
#include "netpilot/device/session_cache.hpp"
#include "netpilot/parsing/parser.hpp"
#include "netpilot/pipeline/outcome.hpp"
#include "netpilot/testbed/topology_cache.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>

namespace netpilot::pipeline {

struct OperationTimeouts {
  std::chrono::seconds show{60};
  std::chrono::seconds configure{180};
  std::chrono::seconds learn_config{120};
  std::chrono::seconds learn_logging{120};
  std::chrono::seconds ping{180};
  std::chrono::seconds linux_command{120};
};

/// acquire -> validate/normalize -> execute -> clean -> parse -> release.
/// Never throws; every failure comes back as an error outcome.
class CommandPipeline {
public:
  CommandPipeline(std::shared_ptr<testbed::TopologyCache> topology,
                  std::shared_ptr<device::SessionCache> sessions,
                  std::shared_ptr<const parsing::IParserRegistry> parsers,
                  OperationTimeouts timeouts = {});

  [[nodiscard]] ExecutionOutcome run_show(const std::string &device, const std::string &command);
  [[nodiscard]] ExecutionOutcome apply_configuration(const std::string &device,
                                                     const command::ConfigPayload &payload);
  [[nodiscard]] ExecutionOutcome learn_config(const std::string &device);
  [[nodiscard]] ExecutionOutcome learn_logging(const std::string &device);
  [[nodiscard]] ExecutionOutcome ping(const std::string &device, const std::string &command);
  [[nodiscard]] ExecutionOutcome run_linux_command(const std::string &device,
                                                   const std::string &command);

  /// Completed JSON listing of the current topology, or an error JSON.
  [[nodiscard]] std::string list_devices();

  [[nodiscard]] std::future<ExecutionOutcome> run_show_async(std::string device,
                                                             std::string command);
  [[nodiscard]] std::future<ExecutionOutcome>
  apply_configuration_async(std::string device, command::ConfigPayload payload);
  [[nodiscard]] std::future<ExecutionOutcome> learn_config_async(std::string device);
  [[nodiscard]] std::future<ExecutionOutcome> learn_logging_async(std::string device);
  [[nodiscard]] std::future<ExecutionOutcome> ping_async(std::string device, std::string command);
  [[nodiscard]] std::future<ExecutionOutcome> run_linux_command_async(std::string device,
                                                                      std::string command);

  [[nodiscard]] const OperationTimeouts &timeouts() const { return timeouts_; }

private:
  using Step = std::function<common::Result<std::string>(device::IDeviceClient &)>;

  /// Runs `step` on a leased session and fills output (and parse, when asked).
  void execute(ExecutionOutcome &outcome, const Step &step, bool attempt_parse);
  void try_parse(ExecutionOutcome &outcome);

  std::shared_ptr<testbed::TopologyCache> topology_;
  std::shared_ptr<device::SessionCache> sessions_;
  std::shared_ptr<const parsing::IParserRegistry> parsers_;
  OperationTimeouts timeouts_;
};

} // namespace netpilot::pipeline
