#include "netpilot/device/ssh_client.hpp"

#include "netpilot/common/fs.hpp"

#include <sstream>

namespace netpilot::device {

namespace {

std::string hostname_from_prompt(const std::string &output) {
  const auto lines = common::split_lines(output);
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    const std::string line = common::trim(*it);
    if (line.empty()) {
      continue;
    }
    const auto end = line.find_first_of("#>$");
    if (end != std::string::npos && end > 0) {
      return line.substr(0, end);
    }
  }
  return "";
}

} // namespace

SshDeviceClient::SshDeviceClient(testbed::DeviceInfo device,
                                 std::shared_ptr<process::IProcessRunner> runner)
    : device_(std::move(device)), runner_(std::move(runner)) {}

std::vector<std::string> SshDeviceClient::ssh_args() const {
  const auto *endpoint = device_.default_connection();
  std::vector<std::string> args;
  if (!device_.password.empty()) {
    args.insert(args.end(), {"sshpass", "-e"});
  }
  args.insert(args.end(), {"ssh", "-T", "-oStrictHostKeyChecking=no",
                           "-oUserKnownHostsFile=/dev/null", "-oLogLevel=ERROR"});
  args.push_back(device_.password.empty() ? "-oBatchMode=yes" : "-oBatchMode=no");
  args.push_back("-oConnectTimeout=" + std::to_string(options_.connection_timeout.count()));
  if (endpoint != nullptr && endpoint->port != 0) {
    args.push_back("-p");
    args.push_back(std::to_string(endpoint->port));
  }
  const std::string host = endpoint != nullptr ? endpoint->ip : device_.name;
  args.push_back(device_.username.empty() ? host : device_.username + "@" + host);
  return args;
}

common::Result<std::string> SshDeviceClient::run_session(const std::string &script,
                                                         const std::chrono::seconds timeout) {
  process::ProcessOptions options;
  options.timeout = timeout;
  options.stdin_text = script;
  if (!device_.password.empty()) {
    options.env["SSHPASS"] = device_.password;
  }

  auto result = runner_->run(ssh_args(), options);
  if (!result.ok()) {
    if (result.kind() == common::ErrorKind::Timeout) {
      return common::Result<std::string>::failure(
          common::ErrorKind::Timeout,
          "Timed out after " + std::to_string(timeout.count()) + "s on " + device_.name);
    }
    // ssh exits 255 on transport failures; the session is gone.
    connected_ = false;
    return common::Result<std::string>::failure(common::ErrorKind::Connection,
                                                common::trim(result.error()));
  }
  return common::Result<std::string>::success(std::move(result.value().stdout_text));
}

common::Status SshDeviceClient::connect(const ConnectOptions &options) {
  if (device_.default_connection() == nullptr) {
    return common::Status::error(common::ErrorKind::Connection,
                                 "Device '" + device_.name + "' declares no connections");
  }
  options_ = options;
  connected_ = true;
  auto probe = run_session("\n", options.connection_timeout);
  if (!probe.ok()) {
    connected_ = false;
    return probe.status();
  }
  if (options.learn_hostname) {
    hostname_ = hostname_from_prompt(probe.value());
  }
  return common::Status::success();
}

common::Result<std::string> SshDeviceClient::execute(const std::string &command,
                                                     const std::chrono::seconds timeout) {
  if (!connected_) {
    return common::Result<std::string>::failure(common::ErrorKind::Connection,
                                                "Device '" + device_.name + "' is not connected");
  }
  std::ostringstream script;
  if (!options_.mit) {
    script << "terminal length 0\n";
  }
  script << command << "\nexit\n";
  return run_session(script.str(), timeout);
}

common::Result<std::string> SshDeviceClient::configure(const std::vector<std::string> &lines,
                                                       const std::chrono::seconds timeout) {
  if (!connected_) {
    return common::Result<std::string>::failure(common::ErrorKind::Connection,
                                                "Device '" + device_.name + "' is not connected");
  }
  std::ostringstream script;
  script << "configure terminal\n";
  for (const auto &line : lines) {
    script << line << '\n';
  }
  script << "end\nexit\n";
  return run_session(script.str(), timeout);
}

common::Status SshDeviceClient::disconnect() {
  connected_ = false;
  return common::Status::success();
}

SshDeviceClientFactory::SshDeviceClientFactory(std::shared_ptr<process::IProcessRunner> runner)
    : runner_(std::move(runner)) {}

common::Result<std::shared_ptr<IDeviceClient>>
SshDeviceClientFactory::create(const testbed::DeviceInfo &device) {
  return common::Result<std::shared_ptr<IDeviceClient>>::success(
      std::make_shared<SshDeviceClient>(device, runner_));
}

} // namespace netpilot::device
