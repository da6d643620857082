#include "test_framework.hpp"

#include "netpilot/common/json_util.hpp"
#include "netpilot/device/session_cache.hpp"
#include "netpilot/parsing/parser.hpp"
#include "netpilot/pipeline/command_pipeline.hpp"
#include "netpilot/testbed/topology_cache.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>

namespace {

namespace nt = netpilot::testing;
namespace pl = netpilot::pipeline;
using netpilot::common::ErrorKind;
using namespace std::chrono_literals;

class VersionParser final : public netpilot::parsing::IOutputParser {
public:
  [[nodiscard]] std::string_view name() const override { return "ShowVersion"; }

  [[nodiscard]] netpilot::common::Result<std::string>
  parse(const std::string &output) const override {
    if (output.find("IOS") == std::string::npos) {
      return netpilot::common::Result<std::string>::failure("no version banner");
    }
    return netpilot::common::Result<std::string>::success(R"({"version":{"os":"IOS-XE"}})");
  }
};

struct Fixture {
  std::shared_ptr<nt::FakeTopologyLoader> loader = std::make_shared<nt::FakeTopologyLoader>();
  std::shared_ptr<nt::FakeClientFactory> factory = std::make_shared<nt::FakeClientFactory>();
  std::shared_ptr<netpilot::parsing::StaticParserRegistry> parsers =
      std::make_shared<netpilot::parsing::StaticParserRegistry>();
  std::shared_ptr<netpilot::testbed::TopologyCache> topology;
  std::shared_ptr<netpilot::device::SessionCache> sessions;
  std::unique_ptr<pl::CommandPipeline> pipeline;

  explicit Fixture(const std::chrono::seconds session_ttl = 60s) {
    topology = std::make_shared<netpilot::testbed::TopologyCache>(loader, "lab.toml", 30s);
    sessions = std::make_shared<netpilot::device::SessionCache>(topology, factory, session_ttl);
    parsers->register_parser("show version", "iosxe", std::make_shared<VersionParser>());
    pipeline = std::make_unique<pl::CommandPipeline>(topology, sessions, parsers);
  }

  void set_output(const std::string &device, const std::string &command,
                  const std::string &output) {
    const auto state = factory->state(device);
    std::lock_guard<std::mutex> lock(state->mutex);
    state->outputs[command] = output;
  }
};

} // namespace

void register_pipeline_tests(std::vector<netpilot::tests::TestCase> &tests) {
  using netpilot::tests::require;
  namespace common = netpilot::common;

  tests.push_back({"parser_registry_longest_prefix_and_os", [] {
                     netpilot::parsing::StaticParserRegistry registry;
                     auto generic = std::make_shared<VersionParser>();
                     auto specific = std::make_shared<VersionParser>();
                     registry.register_parser("show", "", generic);
                     registry.register_parser("show  version", "iosxe", specific);
                     require(registry.size() == 2, "two entries");

                     const auto ios = nt::make_device("r1", "iosxe");
                     const auto nxos = nt::make_device("n1", "nxos");
                     require(registry.find("SHOW   version", ios) == specific,
                             "longest prefix should win after space collapsing");
                     require(registry.find("show version", nxos) == generic,
                             "os-specific entry should not match other os");
                     require(registry.find("ping 10.0.0.1", ios) == nullptr, "no match");
                   }});

  tests.push_back({"show_command_returns_cleaned_and_parsed_output", [] {
                     Fixture fx;
                     fx.set_output("r1", "show version", "\x1b[1mCisco IOS XE\x1b[0m\r\n");
                     const auto outcome = fx.pipeline->run_show("r1", "show version");
                     require(outcome.completed, outcome.error);
                     require(outcome.output == "Cisco IOS XE\r\n", "output should be cleaned");
                     require(outcome.parser_used.value_or("") == "ShowVersion", "parser name");
                     const auto json = outcome.to_json();
                     require(common::json_is_valid(json), "outcome json must be valid: " + json);
                     require(common::json_get_string(json, "status") == "completed", "status");
                     require(common::json_get_object(json, "parsed_output") ==
                                 R"({"version":{"os":"IOS-XE"}})",
                             "parsed output embedded as json");
                   }});

  tests.push_back({"show_command_without_parser_returns_raw", [] {
                     Fixture fx;
                     fx.set_output("r2", "show clock", "*10:00:00.000 UTC Mon Oct 19 2026");
                     const auto outcome = fx.pipeline->run_show("r2", "show clock");
                     require(outcome.completed, outcome.error);
                     require(!outcome.parsed_output.has_value(), "no parser applies");
                     const auto json = outcome.to_json();
                     require(json.find("\"parser_used\":null") != std::string::npos,
                             "parser_used should be null: " + json);
                     require(common::json_get_string(json, "raw_output") ==
                                 "*10:00:00.000 UTC Mon Oct 19 2026",
                             "raw output field");
                   }});

  tests.push_back({"parser_failure_falls_back_to_raw", [] {
                     Fixture fx;
                     fx.set_output("r1", "show version", "unexpected text");
                     const auto outcome = fx.pipeline->run_show("r1", "show version");
                     require(outcome.completed, "a parse failure is not an operation failure");
                     require(!outcome.parsed_output.has_value(), "no parsed output");
                     require(!outcome.parser_used.has_value(), "no parser reported");
                   }});

  tests.push_back({"invalid_show_command_never_touches_device", [] {
                     Fixture fx;
                     const auto outcome =
                         fx.pipeline->run_show("r1", "show running-config | include foo");
                     require(!outcome.completed, "pipe should be rejected");
                     require(outcome.error_kind == ErrorKind::Validation, "validation error");
                     require(fx.factory->create_calls() == 0, "no session should be opened");
                     const auto json = outcome.to_json();
                     require(common::json_get_string(json, "status") == "error", "status");
                     require(common::json_get_string(json, "device") == "r1", "device echoed");
                     require(common::json_get_string(json, "command") ==
                                 "show running-config | include foo",
                             "command echoed");
                   }});

  tests.push_back({"unknown_device_is_not_found_outcome", [] {
                     Fixture fx;
                     const auto outcome = fx.pipeline->run_show("core9", "show version");
                     require(!outcome.completed, "unknown device should fail");
                     require(outcome.error_kind == ErrorKind::NotFound, "not found");
                     require(outcome.error.find("core9") != std::string::npos, "names device");
                   }});

  tests.push_back({"device_drop_mid_execute_is_reported_and_not_cached", [] {
                     Fixture fx;
                     require(fx.pipeline->run_show("r1", "show clock").completed, "warm up");
                     require(fx.sessions->size() == 1, "session cached");
                     {
                       const auto state = fx.factory->state("r1");
                       std::lock_guard<std::mutex> lock(state->mutex);
                       state->drop_on_execute = true;
                     }

                     const auto outcome = fx.pipeline->run_show("r1", "show version");
                     require(!outcome.completed, "drop should fail the operation");
                     require(outcome.error_kind == ErrorKind::Connection, "connection error");
                     const auto json = outcome.to_json();
                     require(common::json_get_string(json, "status") == "error", "status");
                     require(common::json_get_string(json, "device") == "r1", "device echoed");
                     require(common::json_get_string(json, "command") == "show version",
                             "command echoed");
                     require(fx.sessions->size() == 0, "broken session must leave the cache");

                     require(fx.pipeline->run_show("r1", "show clock").completed,
                             "next call reconnects");
                     require(fx.factory->state("r1")->connect_calls == 2, "reconnected once");
                   }});

  tests.push_back({"execution_error_forces_disconnect", [] {
                     Fixture fx;
                     {
                       const auto state = fx.factory->state("r2");
                       std::lock_guard<std::mutex> lock(state->mutex);
                       state->execute_error = "% Invalid input detected";
                     }
                     const auto outcome = fx.pipeline->run_show("r2", "show inventory");
                     require(!outcome.completed, "execution error should fail");
                     require(outcome.error_kind == ErrorKind::Execution, "execution error");
                     require(fx.factory->state("r2")->disconnect_calls == 1,
                             "session force-released");
                     require(fx.sessions->size() == 0, "nothing cached");
                   }});

  tests.push_back({"throwing_client_becomes_error_outcome", [] {
                     Fixture fx;
                     {
                       const auto state = fx.factory->state("r1");
                       std::lock_guard<std::mutex> lock(state->mutex);
                       state->throw_on_execute = true;
                     }
                     const auto outcome = fx.pipeline->learn_config("r1");
                     require(!outcome.completed, "exception should become an error");
                     require(outcome.error == "unexpected prompt", "message kept");
                     require(fx.pipeline->run_show("r2", "show clock").completed,
                             "other devices unaffected");
                   }});

  tests.push_back({"configure_sends_normalized_lines", [] {
                     Fixture fx;
                     const auto outcome = fx.pipeline->apply_configuration(
                         "r1", std::string("configure terminal\ninterface Gi0/0\n cdp enable\nend\n"));
                     require(outcome.completed, outcome.error);
                     const std::vector<std::string> expected = {"interface Gi0/0", " cdp enable"};
                     require(outcome.lines_sent == expected, "lines_sent mismatch");
                     {
                       const auto state = fx.factory->state("r1");
                       std::lock_guard<std::mutex> lock(state->mutex);
                       require(state->last_lines == expected, "device got normalized lines");
                     }
                     const auto json = outcome.to_json();
                     require(common::json_get_string_array(json, "lines_sent") == expected,
                             "lines_sent serialized");
                     require(common::json_get_string(json, "raw_output") ==
                                 "r1(config)# applied",
                             "configure output is cleaned");
                     require(json.find("parser_used") == std::string::npos,
                             "configure does not report a parser");
                   }});

  tests.push_back({"configure_with_only_wrappers_is_rejected", [] {
                     Fixture fx;
                     const auto outcome = fx.pipeline->apply_configuration(
                         "r1", std::vector<std::string>{"conf t", "", "end"});
                     require(!outcome.completed, "nothing to send");
                     require(outcome.error == "No valid configuration lines provided.",
                             "unexpected message: " + outcome.error);
                     require(fx.factory->create_calls() == 0, "no session opened");
                   }});

  tests.push_back({"learn_operations_use_fixed_commands", [] {
                     Fixture fx;
                     fx.set_output("r1", "show running-config", "hostname r1\n");
                     fx.set_output("r1", "show logging", "%SYS-5-CONFIG_I\n");
                     const auto config = fx.pipeline->learn_config("r1");
                     const auto logging = fx.pipeline->learn_logging("r1");
                     require(config.completed && logging.completed, "both should complete");
                     require(common::json_get_string(config.to_json(), "running_config") ==
                                 "hostname r1\n",
                             "running_config field");
                     require(common::json_get_string(logging.to_json(), "logging") ==
                                 "%SYS-5-CONFIG_I\n",
                             "logging field");
                   }});

  tests.push_back({"ping_and_linux_commands", [] {
                     Fixture fx;
                     fx.set_output("r1", "ping 10.0.0.2", "Success rate is 100 percent (5/5)");
                     const auto ping = fx.pipeline->ping("r1", "ping 10.0.0.2");
                     require(ping.completed, ping.error);
                     require(ping.to_json().find("\"parser_used\":null") != std::string::npos,
                             "ping reports parser_used");

                     const auto empty_ping = fx.pipeline->ping("r1", "   ");
                     require(!empty_ping.completed, "empty ping rejected");
                     require(empty_ping.error_kind == ErrorKind::Validation, "validation error");

                     fx.set_output("r2", "uname -a", "Linux jump 6.1.0");
                     const auto linux_out = fx.pipeline->run_linux_command("r2", "uname -a");
                     require(linux_out.completed, linux_out.error);
                     require(common::json_get_string(linux_out.to_json(), "output") ==
                                 "Linux jump 6.1.0",
                             "linux output field");
                     require(!fx.pipeline->run_linux_command("r2", "").completed,
                             "empty command rejected");
                   }});

  tests.push_back({"async_operations_run_in_parallel", [] {
                     Fixture fx;
                     auto show = fx.pipeline->run_show_async("r1", "show version");
                     auto config = fx.pipeline->learn_config_async("r2");
                     auto logging = fx.pipeline->learn_logging_async("r1");
                     auto configure = fx.pipeline->apply_configuration_async(
                         "r2", std::vector<std::string>{"hostname lab"});
                     auto ping = fx.pipeline->ping_async("r2", "ping 10.0.0.1");
                     auto linux_cmd = fx.pipeline->run_linux_command_async("r1", "uptime");
                     require(show.get().completed, "show");
                     require(config.get().completed, "learn config");
                     require(logging.get().completed, "learn logging");
                     require(configure.get().completed, "configure");
                     require(ping.get().completed, "ping");
                     require(linux_cmd.get().completed, "linux");
                     require(fx.factory->state("r1")->connect_calls == 1, "r1 connected once");
                     require(fx.factory->state("r2")->connect_calls == 1, "r2 connected once");
                   }});

  tests.push_back({"caching_disabled_pipeline_disconnects_after_each_call", [] {
                     Fixture fx(0s);
                     require(fx.pipeline->run_show("r1", "show clock").completed, "first");
                     require(fx.pipeline->run_show("r1", "show clock").completed, "second");
                     const auto state = fx.factory->state("r1");
                     require(state->connect_calls == 2 && state->disconnect_calls == 2,
                             "every call connects and disconnects");
                   }});

  tests.push_back({"list_devices_reports_topology", [] {
                     Fixture fx;
                     const auto json = fx.pipeline->list_devices();
                     require(common::json_is_valid(json), "valid json: " + json);
                     require(common::json_get_string(json, "status") == "completed", "status");
                     const auto devices = common::json_get_object(json, "devices");
                     require(devices.find("\"r1\"") != std::string::npos, "r1 listed");
                     require(devices.find("\"connections\":[\"cli\"]") != std::string::npos,
                             "connection labels listed");

                     fx.loader->set_error("testbed unreadable");
                     fx.topology->invalidate();
                     const auto failed = fx.pipeline->list_devices();
                     require(common::json_get_string(failed, "status") == "error", "error status");
                     require(common::json_get_string(failed, "error") == "testbed unreadable",
                             "error message");
                   }});
}
