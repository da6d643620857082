#include "netpilot/testbed/topology.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/common/toml.hpp"

#include <algorithm>

namespace netpilot::testbed {

std::vector<std::string> DeviceInfo::connection_labels() const {
  std::vector<std::string> labels;
  labels.reserve(connections.size());
  for (const auto &[label, endpoint] : connections) {
    (void)endpoint;
    labels.push_back(label);
  }
  return labels;
}

const ConnectionEndpoint *DeviceInfo::default_connection() const {
  for (const char *preferred : {"cli", "ssh"}) {
    if (const auto it = connections.find(preferred); it != connections.end()) {
      return &it->second;
    }
  }
  if (connections.empty()) {
    return nullptr;
  }
  return &connections.begin()->second;
}

TopologySnapshot::TopologySnapshot(std::string name, std::string source_path,
                                   std::vector<DeviceInfo> devices)
    : name_(std::move(name)), source_path_(std::move(source_path)), devices_(std::move(devices)) {}

const DeviceInfo *TopologySnapshot::find(const std::string &device_name) const {
  const auto it = std::find_if(devices_.begin(), devices_.end(),
                               [&](const DeviceInfo &device) { return device.name == device_name; });
  return it == devices_.end() ? nullptr : &*it;
}

common::Result<TopologyPtr> parse_topology(const std::string &toml_text,
                                           const std::string &source_path) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<TopologyPtr>::failure(common::ErrorKind::Load,
                                                "Failed to parse testbed: " + parsed.error());
  }
  const auto &doc = parsed.value();

  std::vector<DeviceInfo> devices;
  for (const auto &name : doc.child_tables("devices")) {
    const std::string prefix = "devices." + name + ".";
    DeviceInfo device;
    device.name = name;
    device.os = doc.get_string(prefix + "os");
    device.type = doc.get_string(prefix + "type");
    device.platform = doc.get_string(prefix + "platform");
    device.username = doc.get_string(prefix + "username");
    device.password = doc.get_string(prefix + "password");

    for (const auto &label : doc.child_tables(prefix + "connections")) {
      const std::string conn_prefix = prefix + "connections." + label + ".";
      ConnectionEndpoint endpoint;
      endpoint.protocol = doc.get_string(conn_prefix + "protocol");
      endpoint.ip = doc.get_string(conn_prefix + "ip");
      const int port = doc.get_int(conn_prefix + "port", 0);
      if (port < 0 || port > 65535) {
        return common::Result<TopologyPtr>::failure(
            common::ErrorKind::Load,
            "Invalid port for device '" + name + "' connection '" + label + "'");
      }
      endpoint.port = static_cast<std::uint16_t>(port);
      device.connections.emplace(label, std::move(endpoint));
    }

    if (device.os.empty()) {
      return common::Result<TopologyPtr>::failure(common::ErrorKind::Load,
                                                  "Device '" + name + "' has no os");
    }
    devices.push_back(std::move(device));
  }

  std::string testbed_name = doc.get_string("testbed.name");
  if (testbed_name.empty()) {
    testbed_name = std::filesystem::path(source_path).stem().string();
  }

  return common::Result<TopologyPtr>::success(std::make_shared<const TopologySnapshot>(
      std::move(testbed_name), source_path, std::move(devices)));
}

common::Result<TopologyPtr> TomlTopologyLoader::load(const std::string &path) {
  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<TopologyPtr>::failure(common::ErrorKind::Load, content.error());
  }
  return parse_topology(content.value(), path);
}

} // namespace netpilot::testbed
