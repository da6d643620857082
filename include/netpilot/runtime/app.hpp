#pragma once

#include "netpilot/common/clock.hpp"
#include "netpilot/common/result.hpp"
#include "netpilot/config/schema.hpp"
#include "netpilot/device/session_cache.hpp"
#include "netpilot/parsing/parser.hpp"
#include "netpilot/pipeline/command_pipeline.hpp"
#include "netpilot/process/runner.hpp"
#include "netpilot/scripts/script_runner.hpp"
#include "netpilot/testbed/topology_cache.hpp"
#include "netpilot/tools/tool_registry.hpp"

#include <memory>

namespace netpilot::runtime {

/// Collaborators that talk to the outside world. Anything left null gets the
/// production implementation.
struct RuntimeComponents {
  std::shared_ptr<testbed::ITopologyLoader> topology_loader;
  std::shared_ptr<device::IDeviceClientFactory> client_factory;
  std::shared_ptr<process::IProcessRunner> process_runner;
  std::shared_ptr<const parsing::IParserRegistry> parsers;
  common::NowFn now;
};

/// Owns the caches, pipeline, script runner and tool registry for the life of
/// the process. Destruction closes every cached device session.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);
  ~RuntimeContext();

  RuntimeContext(const RuntimeContext &) = delete;
  RuntimeContext &operator=(const RuntimeContext &) = delete;

  [[nodiscard]] static common::Result<std::unique_ptr<RuntimeContext>>
  create(config::Config config, RuntimeComponents components = {});
  [[nodiscard]] static common::Result<std::unique_ptr<RuntimeContext>> from_disk();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] testbed::TopologyCache &topology() { return *topology_; }
  [[nodiscard]] device::SessionCache &sessions() { return *sessions_; }
  [[nodiscard]] pipeline::CommandPipeline &pipeline() { return *pipeline_; }
  [[nodiscard]] scripts::ScriptRunner &scripts() { return *scripts_; }
  [[nodiscard]] const tools::ToolRegistry &tools() const { return tools_; }

  void shutdown();

private:
  config::Config config_;
  std::shared_ptr<testbed::TopologyCache> topology_;
  std::shared_ptr<device::SessionCache> sessions_;
  std::shared_ptr<pipeline::CommandPipeline> pipeline_;
  std::shared_ptr<scripts::ScriptRunner> scripts_;
  tools::ToolRegistry tools_;
  bool shut_down_ = false;
};

} // namespace netpilot::runtime
