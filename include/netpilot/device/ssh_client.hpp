#pragma once

#include "netpilot/device/client.hpp"
#include "netpilot/process/runner.hpp"

#include <memory>

namespace netpilot::device {

/// Drives a device through the system ssh binary. Commands are fed on stdin of
/// a non-interactive session; a password in the testbed is handed to sshpass.
class SshDeviceClient final : public IDeviceClient {
public:
  SshDeviceClient(testbed::DeviceInfo device, std::shared_ptr<process::IProcessRunner> runner);

  [[nodiscard]] const std::string &device_name() const override { return device_.name; }
  [[nodiscard]] common::Status connect(const ConnectOptions &options) override;
  [[nodiscard]] bool is_connected() const override { return connected_; }
  [[nodiscard]] common::Result<std::string> execute(const std::string &command,
                                                    std::chrono::seconds timeout) override;
  [[nodiscard]] common::Result<std::string> configure(const std::vector<std::string> &lines,
                                                      std::chrono::seconds timeout) override;
  [[nodiscard]] common::Status disconnect() override;

  [[nodiscard]] const std::string &hostname() const { return hostname_; }
  [[nodiscard]] std::vector<std::string> ssh_args() const;

private:
  [[nodiscard]] common::Result<std::string> run_session(const std::string &script,
                                                        std::chrono::seconds timeout);

  testbed::DeviceInfo device_;
  std::shared_ptr<process::IProcessRunner> runner_;
  ConnectOptions options_;
  bool connected_ = false;
  std::string hostname_;
};

class SshDeviceClientFactory final : public IDeviceClientFactory {
public:
  explicit SshDeviceClientFactory(std::shared_ptr<process::IProcessRunner> runner);

  [[nodiscard]] common::Result<std::shared_ptr<IDeviceClient>>
  create(const testbed::DeviceInfo &device) override;

private:
  std::shared_ptr<process::IProcessRunner> runner_;
};

} // namespace netpilot::device
