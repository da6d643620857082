#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <thread>

namespace netpilot::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("netpilot-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::string sample_testbed_toml() {
  return R"(# lab testbed
[testbed]
name = "lab"

[devices.r1]
os = "iosxe"
type = "router"
platform = "cat8k"
username = "admin"

[devices.r1.connections.cli]
protocol = "ssh"
ip = "10.0.0.1"
port = 22

[devices.r2]
os = "iosxe"
type = "router"
platform = "csr1000v"

[devices.r2.connections.cli]
protocol = "ssh"
ip = "10.0.0.2"

[devices.r2.connections.rest]
protocol = "https"
ip = "10.0.0.2"
port = 443

[devices.jump]
os = "linux"
type = "linux"

[devices.jump.connections.ssh]
protocol = "ssh"
ip = "10.0.0.10"
port = 2222
)";
}

config::Config temp_config(const TempWorkspace &workspace) {
  workspace.create_file("testbed.toml", sample_testbed_toml());
  config::Config config;
  config.testbed.path = (workspace.path() / "testbed.toml").string();
  config.artifacts.dir = (workspace.path() / "artifacts").string();
  config.observability.backend = "none";
  return config;
}

testbed::DeviceInfo make_device(const std::string &name, const std::string &os) {
  testbed::DeviceInfo device;
  device.name = name;
  device.os = os;
  device.type = "router";
  device.platform = "cat8k";
  device.connections.emplace("cli", testbed::ConnectionEndpoint{.protocol = "ssh",
                                                                .ip = "192.0.2.1",
                                                                .port = 22});
  return device;
}

testbed::TopologyPtr make_topology(const std::vector<std::string> &device_names) {
  std::vector<testbed::DeviceInfo> devices;
  devices.reserve(device_names.size());
  for (const auto &name : device_names) {
    devices.push_back(make_device(name));
  }
  return std::make_shared<const testbed::TopologySnapshot>("fake", "fake.toml",
                                                           std::move(devices));
}

ManualClock::ManualClock() : state_(std::make_shared<State>()) {
  state_->now = common::TimePoint{} + std::chrono::hours(1);
}

common::NowFn ManualClock::now_fn() const {
  auto state = state_;
  return [state] {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->now;
  };
}

common::TimePoint ManualClock::now() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->now;
}

void ManualClock::advance(const std::chrono::seconds by) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->now += by;
}

FakeDeviceClient::FakeDeviceClient(std::string name, std::shared_ptr<FakeDeviceState> state)
    : name_(std::move(name)), state_(std::move(state)) {}

common::Status FakeDeviceClient::connect(const device::ConnectOptions &options) {
  ++state_->connect_calls;
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->last_options = options;
    delay = state_->connect_delay;
    if (state_->connect_error.has_value()) {
      return common::Status::error(common::ErrorKind::Connection, *state_->connect_error);
    }
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  connected_ = true;
  return common::Status::success();
}

common::Result<std::string> FakeDeviceClient::execute(const std::string &command,
                                                      std::chrono::seconds) {
  ++state_->execute_calls;
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->commands.push_back(command);
  if (state_->throw_on_execute) {
    throw std::runtime_error("unexpected prompt");
  }
  if (state_->drop_on_execute) {
    state_->drop_on_execute = false;
    connected_ = false;
    return common::Result<std::string>::failure(common::ErrorKind::Connection,
                                                "connection closed by " + name_);
  }
  if (state_->execute_error.has_value()) {
    return common::Result<std::string>::failure(common::ErrorKind::Execution,
                                                *state_->execute_error);
  }
  if (const auto it = state_->outputs.find(command); it != state_->outputs.end()) {
    return common::Result<std::string>::success(it->second);
  }
  return common::Result<std::string>::success(state_->default_output);
}

common::Result<std::string> FakeDeviceClient::configure(const std::vector<std::string> &lines,
                                                        std::chrono::seconds) {
  ++state_->configure_calls;
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->last_lines = lines;
  if (state_->execute_error.has_value()) {
    return common::Result<std::string>::failure(common::ErrorKind::Execution,
                                                *state_->execute_error);
  }
  return common::Result<std::string>::success("\x1b[1mr1(config)#\x1b[0m applied");
}

common::Status FakeDeviceClient::disconnect() {
  ++state_->disconnect_calls;
  connected_ = false;
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->fail_disconnect) {
    return common::Status::error(common::ErrorKind::Connection, "disconnect refused");
  }
  return common::Status::success();
}

common::Result<std::shared_ptr<device::IDeviceClient>>
FakeClientFactory::create(const testbed::DeviceInfo &device) {
  ++create_calls_;
  auto shared_state = state(device.name);
  auto client = std::make_shared<FakeDeviceClient>(device.name, shared_state);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_clients_[device.name] = client;
  }
  return common::Result<std::shared_ptr<device::IDeviceClient>>::success(client);
}

std::shared_ptr<FakeDeviceState> FakeClientFactory::state(const std::string &device_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = states_[device_name];
  if (slot == nullptr) {
    slot = std::make_shared<FakeDeviceState>();
  }
  return slot;
}

std::shared_ptr<FakeDeviceClient> FakeClientFactory::last_client(const std::string &device_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_clients_.find(device_name);
  return it == last_clients_.end() ? nullptr : it->second;
}

FakeTopologyLoader::FakeTopologyLoader(std::vector<std::string> device_names)
    : device_names_(std::move(device_names)) {}

common::Result<testbed::TopologyPtr> FakeTopologyLoader::load(const std::string &) {
  ++load_calls_;
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_.has_value()) {
    return common::Result<testbed::TopologyPtr>::failure(common::ErrorKind::Load, *error_);
  }
  return common::Result<testbed::TopologyPtr>::success(make_topology(device_names_));
}

void FakeTopologyLoader::set_error(std::optional<std::string> error) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_ = std::move(error);
}

void FakeTopologyLoader::set_devices(std::vector<std::string> device_names) {
  std::lock_guard<std::mutex> lock(mutex_);
  device_names_ = std::move(device_names);
}

common::Result<process::ProcessResult>
FakeProcessRunner::run(const std::vector<std::string> &args,
                       const process::ProcessOptions &options) {
  ++calls;
  last_args = args;
  last_options = options;

  if (time_out) {
    return common::Result<process::ProcessResult>::failure(common::ErrorKind::Timeout,
                                                           args.front() + " timed out");
  }

  if (report_content.has_value()) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
      if (args[i] == "--json-job") {
        std::ofstream out(args[i + 1], std::ios::trunc);
        out << *report_content;
      }
    }
  }

  if (exit_code != 0 && !options.allow_failure) {
    return common::Result<process::ProcessResult>::failure(
        common::ErrorKind::Execution,
        stderr_text.empty() ? "command failed: " + process::join_args(args) : stderr_text);
  }

  process::ProcessResult result;
  result.exit_code = exit_code;
  result.stdout_text = stdout_text;
  result.stderr_text = stderr_text;
  return common::Result<process::ProcessResult>::success(std::move(result));
}

RuntimeHarness::RuntimeHarness(const std::int64_t session_ttl_s) {
  auto config = temp_config(workspace);
  config.sessions.cache_ttl_s = session_ttl_s;

  runtime::RuntimeComponents components;
  components.client_factory = factory;
  components.process_runner = process;
  auto created = runtime::RuntimeContext::create(std::move(config), std::move(components));
  if (!created.ok()) {
    throw std::runtime_error("runtime setup failed: " + created.error());
  }
  context = std::move(created.value());
}

} // namespace netpilot::testing
