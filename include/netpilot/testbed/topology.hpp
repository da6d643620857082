#pragma once

#include "netpilot/common/result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace netpilot::testbed {

struct ConnectionEndpoint {
  std::string protocol;
  std::string ip;
  std::uint16_t port = 0;
};

struct DeviceInfo {
  std::string name;
  std::string os;
  std::string type;
  std::string platform;
  std::string username;
  std::string password;
  /// Keyed by connection label ("cli", "ssh", ...), sorted.
  std::map<std::string, ConnectionEndpoint> connections;

  [[nodiscard]] std::vector<std::string> connection_labels() const;
  /// Preferred endpoint: "cli", then "ssh", then the first declared label.
  [[nodiscard]] const ConnectionEndpoint *default_connection() const;
};

/// Immutable view of one load of the device inventory.
class TopologySnapshot {
public:
  TopologySnapshot(std::string name, std::string source_path, std::vector<DeviceInfo> devices);

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::string &source_path() const { return source_path_; }
  [[nodiscard]] const std::vector<DeviceInfo> &devices() const { return devices_; }
  [[nodiscard]] const DeviceInfo *find(const std::string &device_name) const;
  [[nodiscard]] std::size_t size() const { return devices_.size(); }

private:
  std::string name_;
  std::string source_path_;
  std::vector<DeviceInfo> devices_;
};

using TopologyPtr = std::shared_ptr<const TopologySnapshot>;

class ITopologyLoader {
public:
  virtual ~ITopologyLoader() = default;
  [[nodiscard]] virtual common::Result<TopologyPtr> load(const std::string &path) = 0;
};

/// Reads a TOML testbed:
///   [testbed] name
///   [devices.<name>] os, type, platform, username, password
///   [devices.<name>.connections.<label>] protocol, ip, port
class TomlTopologyLoader final : public ITopologyLoader {
public:
  [[nodiscard]] common::Result<TopologyPtr> load(const std::string &path) override;
};

[[nodiscard]] common::Result<TopologyPtr> parse_topology(const std::string &toml_text,
                                                         const std::string &source_path);

} // namespace netpilot::testbed
