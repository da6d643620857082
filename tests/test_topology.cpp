#include "test_framework.hpp"

#include "netpilot/testbed/topology.hpp"
#include "netpilot/testbed/topology_cache.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>

void register_topology_tests(std::vector<netpilot::tests::TestCase> &tests) {
  using netpilot::tests::require;
  namespace tb = netpilot::testbed;
  namespace nt = netpilot::testing;
  using namespace std::chrono_literals;

  tests.push_back({"parse_topology_reads_devices_and_connections", [] {
                     const auto parsed =
                         tb::parse_topology(nt::sample_testbed_toml(), "/labs/lab.toml");
                     require(parsed.ok(), parsed.error());
                     const auto &topology = *parsed.value();
                     require(topology.name() == "lab", "testbed name mismatch");
                     require(topology.size() == 3, "expected three devices");

                     const auto *r1 = topology.find("r1");
                     require(r1 != nullptr, "r1 should exist");
                     require(r1->os == "iosxe" && r1->platform == "cat8k", "r1 fields mismatch");
                     require(r1->username == "admin", "username mismatch");
                     const auto *endpoint = r1->default_connection();
                     require(endpoint != nullptr && endpoint->ip == "10.0.0.1" &&
                                 endpoint->port == 22,
                             "r1 endpoint mismatch");

                     const auto *r2 = topology.find("r2");
                     require(r2 != nullptr, "r2 should exist");
                     require(r2->connection_labels() == std::vector<std::string>({"cli", "rest"}),
                             "r2 labels mismatch");
                     require(r2->default_connection()->port == 0, "unset port should be 0");
                   }});

  tests.push_back({"default_connection_prefers_cli_then_ssh", [] {
                     const auto parsed = tb::parse_topology(nt::sample_testbed_toml(), "lab.toml");
                     require(parsed.ok(), parsed.error());
                     const auto *jump = parsed.value()->find("jump");
                     require(jump != nullptr, "jump should exist");
                     require(jump->default_connection()->port == 2222, "ssh label expected");

                     tb::DeviceInfo odd;
                     odd.connections.emplace("zeta", tb::ConnectionEndpoint{.protocol = "telnet",
                                                                            .ip = "192.0.2.9",
                                                                            .port = 23});
                     require(odd.default_connection()->port == 23, "first label is the fallback");
                     require(tb::DeviceInfo{}.default_connection() == nullptr,
                             "no connections means no endpoint");
                   }});

  tests.push_back({"parse_topology_falls_back_to_file_stem", [] {
                     const auto parsed = tb::parse_topology("[devices.sw1]\nos = \"nxos\"\n",
                                                            "/tmp/campus-core.toml");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value()->name() == "campus-core", "stem should name testbed");
                   }});

  tests.push_back({"parse_topology_requires_os", [] {
                     const auto parsed =
                         tb::parse_topology("[devices.sw1]\ntype = \"switch\"\n", "lab.toml");
                     require(!parsed.ok(), "missing os should fail");
                     require(parsed.kind() == netpilot::common::ErrorKind::Load, "load error");
                     require(parsed.error().find("sw1") != std::string::npos, "names the device");
                   }});

  tests.push_back({"parse_topology_rejects_bad_port", [] {
                     const auto parsed = tb::parse_topology(
                         "[devices.sw1]\nos = \"nxos\"\n[devices.sw1.connections.cli]\nip = "
                         "\"192.0.2.1\"\nport = 70000\n",
                         "lab.toml");
                     require(!parsed.ok(), "out of range port should fail");
                   }});

  tests.push_back({"toml_loader_missing_file_is_load_error", [] {
                     const nt::TempWorkspace workspace;
                     tb::TomlTopologyLoader loader;
                     const auto loaded = loader.load((workspace.path() / "absent.toml").string());
                     require(!loaded.ok(), "missing file should fail");
                     require(loaded.kind() == netpilot::common::ErrorKind::Load, "load error");
                   }});

  tests.push_back({"toml_loader_reads_file", [] {
                     const nt::TempWorkspace workspace;
                     workspace.create_file("lab.toml", nt::sample_testbed_toml());
                     tb::TomlTopologyLoader loader;
                     const auto loaded = loader.load((workspace.path() / "lab.toml").string());
                     require(loaded.ok(), loaded.error());
                     require(loaded.value()->find("r2") != nullptr, "r2 should load");
                   }});

  tests.push_back({"topology_cache_reuses_snapshot_within_ttl", [] {
                     auto loader = std::make_shared<nt::FakeTopologyLoader>();
                     nt::ManualClock clock;
                     tb::TopologyCache cache(loader, "lab.toml", 30s, clock.now_fn());

                     const auto first = cache.get();
                     clock.advance(10s);
                     const auto second = cache.get();
                     require(first.ok() && second.ok(), "loads should succeed");
                     require(first.value().get() == second.value().get(),
                             "same snapshot instance within ttl");
                     require(loader->load_calls() == 1, "exactly one load");

                     clock.advance(25s);
                     const auto third = cache.get();
                     require(third.ok(), third.error());
                     require(third.value().get() != first.value().get(), "expired snapshot replaced");
                     require(loader->load_calls() == 2, "exactly one reload after ttl");
                   }});

  tests.push_back({"topology_cache_non_positive_ttl_reloads_every_call", [] {
                     for (const auto ttl : {0s, -5s}) {
                       auto loader = std::make_shared<nt::FakeTopologyLoader>();
                       nt::ManualClock clock;
                       tb::TopologyCache cache(loader, "lab.toml", ttl, clock.now_fn());
                       for (int i = 0; i < 3; ++i) {
                         require(cache.get().ok(), "load should succeed");
                       }
                       require(loader->load_calls() == 3, "every call should reload");
                     }
                   }});

  tests.push_back({"topology_cache_reload_failure_is_reported", [] {
                     auto loader = std::make_shared<nt::FakeTopologyLoader>();
                     nt::ManualClock clock;
                     tb::TopologyCache cache(loader, "lab.toml", 5s, clock.now_fn());
                     require(cache.get().ok(), "initial load should succeed");

                     loader->set_error("file vanished");
                     clock.advance(6s);
                     const auto failed = cache.get();
                     require(!failed.ok(), "reload failure should surface");
                     require(failed.kind() == netpilot::common::ErrorKind::Load, "load error");

                     loader->set_error(std::nullopt);
                     require(cache.get().ok(), "recovers once the loader does");
                   }});

  tests.push_back({"topology_cache_invalidate_forces_reload", [] {
                     auto loader = std::make_shared<nt::FakeTopologyLoader>();
                     tb::TopologyCache cache(loader, "lab.toml", 300s);
                     require(cache.get().ok(), "load should succeed");
                     loader->set_devices({"r1", "r2", "r3"});
                     cache.invalidate();
                     const auto reloaded = cache.get();
                     require(reloaded.ok(), reloaded.error());
                     require(reloaded.value()->size() == 3, "new device list expected");
                   }});

  tests.push_back({"find_device_unknown_is_not_found", [] {
                     auto loader = std::make_shared<nt::FakeTopologyLoader>();
                     tb::TopologyCache cache(loader, "lab.toml", 30s);
                     tb::TopologyPtr holder;
                     const auto found = cache.find_device("r9", holder);
                     require(!found.ok(), "unknown device should fail");
                     require(found.kind() == netpilot::common::ErrorKind::NotFound, "not found");
                     require(found.error() == "Device 'r9' not found in testbed 'lab.toml'.",
                             "unexpected message: " + found.error());

                     const auto known = cache.find_device("r2", holder);
                     require(known.ok(), known.error());
                     require(known.value()->name == "r2", "device mismatch");
                   }});
}
