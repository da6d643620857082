#pragma once

#include "netpilot/common/result.hpp"
#include "netpilot/testbed/topology.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace netpilot::device {

struct ConnectOptions {
  std::chrono::seconds connection_timeout{120};
  bool learn_hostname = true;
  bool log_stdout = false;
  /// Management-interface ("mit") mode: skip device init commands.
  bool mit = true;
};

/// A session with one network device. Implementations are driven by one
/// thread at a time; the session cache serializes access per device.
class IDeviceClient {
public:
  virtual ~IDeviceClient() = default;

  [[nodiscard]] virtual const std::string &device_name() const = 0;
  [[nodiscard]] virtual common::Status connect(const ConnectOptions &options) = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
  [[nodiscard]] virtual common::Result<std::string> execute(const std::string &command,
                                                            std::chrono::seconds timeout) = 0;
  [[nodiscard]] virtual common::Result<std::string>
  configure(const std::vector<std::string> &lines, std::chrono::seconds timeout) = 0;
  [[nodiscard]] virtual common::Status disconnect() = 0;
};

class IDeviceClientFactory {
public:
  virtual ~IDeviceClientFactory() = default;
  [[nodiscard]] virtual common::Result<std::shared_ptr<IDeviceClient>>
  create(const testbed::DeviceInfo &device) = 0;
};

} // namespace netpilot::device
