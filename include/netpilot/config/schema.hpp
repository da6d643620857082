#pragma once

#include <cstdint>
#include <string>

namespace netpilot::config {

struct TestbedConfig {
  std::string path;
  std::int64_t cache_ttl_s = 30;
};

struct SessionsConfig {
  // 0 disables session caching: every operation connects and disconnects.
  std::int64_t cache_ttl_s = 0;
};

struct ArtifactsConfig {
  std::string dir = "~/.netpilot/artifacts";
  bool keep = true;
};

struct ScriptsConfig {
  std::string runner = "pyats";
  std::uint64_t timeout_s = 300;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  TestbedConfig testbed;
  SessionsConfig sessions;
  ArtifactsConfig artifacts;
  ScriptsConfig scripts;
  ObservabilityConfig observability;
};

} // namespace netpilot::config
