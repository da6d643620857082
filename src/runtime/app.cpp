#include "netpilot/runtime/app.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/config/config.hpp"
#include "netpilot/device/ssh_client.hpp"
#include "netpilot/observability/factory.hpp"
#include "netpilot/observability/global.hpp"

#include <algorithm>

namespace netpilot::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

RuntimeContext::~RuntimeContext() { shutdown(); }

common::Result<std::unique_ptr<RuntimeContext>> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<RuntimeContext>>::failure(loaded.status());
  }
  return create(std::move(loaded.value()));
}

common::Result<std::unique_ptr<RuntimeContext>> RuntimeContext::create(config::Config config,
                                                                       RuntimeComponents components) {
  using ContextResult = common::Result<std::unique_ptr<RuntimeContext>>;

  observability::set_global_observer(observability::create_observer(config));

  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return ContextResult::failure(common::ErrorKind::Load, validated.error());
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }

  const std::filesystem::path artifacts_root = common::expand_path(config.artifacts.dir);
  if (const auto dir = common::ensure_dir(artifacts_root); !dir.ok()) {
    return ContextResult::failure(dir.status());
  }

  if (components.topology_loader == nullptr) {
    components.topology_loader = std::make_shared<testbed::TomlTopologyLoader>();
  }
  if (components.process_runner == nullptr) {
    components.process_runner = std::make_shared<process::PosixProcessRunner>();
  }
  if (components.client_factory == nullptr) {
    components.client_factory =
        std::make_shared<device::SshDeviceClientFactory>(components.process_runner);
  }
  if (components.parsers == nullptr) {
    components.parsers = std::make_shared<parsing::StaticParserRegistry>();
  }
  if (!components.now) {
    components.now = common::steady_now();
  }

  auto context = std::make_unique<RuntimeContext>(std::move(config));
  const auto &cfg = context->config_;

  context->topology_ = std::make_shared<testbed::TopologyCache>(
      components.topology_loader, cfg.testbed.path, std::chrono::seconds(cfg.testbed.cache_ttl_s),
      components.now);
  context->sessions_ = std::make_shared<device::SessionCache>(
      context->topology_, components.client_factory,
      std::chrono::seconds(std::max<std::int64_t>(cfg.sessions.cache_ttl_s, 0)), components.now);
  context->pipeline_ = std::make_shared<pipeline::CommandPipeline>(
      context->topology_, context->sessions_, components.parsers);

  scripts::ScriptRunnerOptions script_options;
  script_options.artifacts_root = artifacts_root;
  script_options.keep_artifacts = cfg.artifacts.keep;
  script_options.runner_binary = cfg.scripts.runner;
  script_options.testbed_path = cfg.testbed.path;
  script_options.default_timeout = std::chrono::seconds(cfg.scripts.timeout_s);
  context->scripts_ =
      std::make_shared<scripts::ScriptRunner>(std::move(script_options), components.process_runner);

  context->tools_ = tools::ToolRegistry::create_default(context->pipeline_, context->scripts_);

  // The testbed must load once before anything is served.
  const auto initial = context->topology_->get();
  if (!initial.ok()) {
    return ContextResult::failure(common::ErrorKind::Load, initial.error());
  }

  return ContextResult::success(std::move(context));
}

void RuntimeContext::shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  if (sessions_ != nullptr) {
    sessions_->shutdown();
  }
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

} // namespace netpilot::runtime
