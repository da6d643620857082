#include "test_framework.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/config/config.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

// Every variable the loader reads, cleared for the duration of a test.
struct CleanNetpilotEnv {
  EnvGuard config_path{"NETPILOT_CONFIG_PATH", std::nullopt};
  EnvGuard env_file{"NETPILOT_ENV_FILE", std::nullopt};
  EnvGuard testbed{"NETPILOT_TESTBED_PATH", std::nullopt};
  EnvGuard testbed_ttl{"NETPILOT_TESTBED_CACHE_TTL", std::nullopt};
  EnvGuard conn_ttl{"NETPILOT_CONN_CACHE_TTL", std::nullopt};
  EnvGuard artifacts{"NETPILOT_ARTIFACTS_DIR", std::nullopt};
  EnvGuard keep{"NETPILOT_KEEP_ARTIFACTS", std::nullopt};
  EnvGuard runner{"NETPILOT_TEST_RUNNER", std::nullopt};
  EnvGuard timeout{"NETPILOT_TEST_TIMEOUT", std::nullopt};
  EnvGuard observability{"NETPILOT_OBSERVABILITY", std::nullopt};
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = netpilot::config::config_path_override();
    if (next.has_value()) {
      netpilot::config::set_config_path_override(*next);
    } else {
      netpilot::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      netpilot::config::set_config_path_override(*old_override);
    } else {
      netpilot::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("netpilot-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<netpilot::tests::TestCase> &tests) {
  using netpilot::tests::require;
  namespace cfg = netpilot::config;

  tests.push_back({"config_path_defaults_under_home", [] {
                     const CleanNetpilotEnv clean;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / ".netpilot" / "config.toml",
                             "unexpected config path: " + path.value().string());
                   }});

  tests.push_back({"config_path_env_override", [] {
                     const CleanNetpilotEnv clean;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard env_path("NETPILOT_CONFIG_PATH",
                                             (home / "custom.toml").string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / "custom.toml", "env override should apply");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const CleanNetpilotEnv clean;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.testbed.path.empty(), "no testbed by default");
                     require(config.testbed.cache_ttl_s == 30, "topology ttl default");
                     require(config.sessions.cache_ttl_s == 0, "session caching off by default");
                     require(config.artifacts.keep, "artifacts kept by default");
                     require(config.scripts.runner == "pyats", "runner default");
                     require(config.scripts.timeout_s == 300, "script timeout default");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const CleanNetpilotEnv clean;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());

                     write_file(path.value(), R"(
[testbed]
path = "/labs/core.toml"
cache_ttl_s = 10

[sessions]
cache_ttl_s = 300

[artifacts]
dir = "/var/tmp/netpilot"
keep = false

[scripts]
runner = "/opt/pyats/bin/pyats"
timeout_s = 900

[observability]
backend = "none"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.testbed.path == "/labs/core.toml", "testbed path");
                     require(config.testbed.cache_ttl_s == 10, "testbed ttl");
                     require(config.sessions.cache_ttl_s == 300, "session ttl");
                     require(config.artifacts.dir == "/var/tmp/netpilot", "artifacts dir");
                     require(!config.artifacts.keep, "keep flag");
                     require(config.scripts.runner == "/opt/pyats/bin/pyats", "runner");
                     require(config.scripts.timeout_s == 900, "timeout");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"load_config_malformed_file_is_load_error", [] {
                     const CleanNetpilotEnv clean;
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override(home / "broken.toml");
                     write_file(home / "broken.toml", "[testbed]\npath\n");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "malformed config should fail");
                     require(loaded.kind() == netpilot::common::ErrorKind::Load, "load error");
                   }});

  tests.push_back({"env_overrides_take_precedence", [] {
                     const CleanNetpilotEnv clean;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     write_file(path.value(), "[testbed]\npath = \"/from/file.toml\"\n");

                     const EnvGuard testbed("NETPILOT_TESTBED_PATH", "/from/env.toml");
                     const EnvGuard conn_ttl("NETPILOT_CONN_CACHE_TTL", "120");
                     const EnvGuard testbed_ttl("NETPILOT_TESTBED_CACHE_TTL", "-1");
                     const EnvGuard keep("NETPILOT_KEEP_ARTIFACTS", "no");
                     const EnvGuard artifacts("NETPILOT_ARTIFACTS_DIR", "/srv/artifacts");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.testbed.path == "/from/env.toml", "env testbed path wins");
                     require(config.sessions.cache_ttl_s == 120, "session ttl from env");
                     require(config.testbed.cache_ttl_s == -1, "negative ttl accepted");
                     require(!config.artifacts.keep, "keep flag from env");
                     require(config.artifacts.dir == "/srv/artifacts", "artifacts dir from env");
                   }});

  tests.push_back({"env_overrides_ignore_unparseable_numbers", [] {
                     const CleanNetpilotEnv clean;
                     const EnvGuard conn_ttl("NETPILOT_CONN_CACHE_TTL", "soon");
                     const EnvGuard timeout("NETPILOT_TEST_TIMEOUT", "0");
                     cfg::Config config;
                     config.sessions.cache_ttl_s = 45;
                     cfg::apply_env_overrides(config);
                     require(config.sessions.cache_ttl_s == 45, "bad number keeps previous value");
                     require(config.scripts.timeout_s == 300, "non-positive timeout ignored");
                   }});

  tests.push_back({"dotenv_in_config_dir_supplies_testbed", [] {
                     const CleanNetpilotEnv clean;
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override;
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     write_file(dir.value() / ".env",
                                "# lab settings\nexport NETPILOT_TESTBED_PATH=\"/labs/dotenv.toml\"\n");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().testbed.path == "/labs/dotenv.toml",
                             "dotenv value should apply: " + loaded.value().testbed.path);
                   }});

  tests.push_back({"parse_flag_accepts_common_spellings", [] {
                     require(cfg::parse_flag("YES", false), "yes");
                     require(cfg::parse_flag(" on ", false), "on");
                     require(!cfg::parse_flag("0", true), "0");
                     require(!cfg::parse_flag("off", true), "off");
                     require(cfg::parse_flag("maybe", true), "fallback kept");
                   }});

  tests.push_back({"validate_requires_existing_testbed", [] {
                     cfg::Config config;
                     const auto missing = cfg::validate_config(config);
                     require(!missing.ok(), "empty testbed path should fail");
                     require(missing.kind() == netpilot::common::ErrorKind::Validation,
                             "validation error");

                     config.testbed.path = (make_temp_home() / "absent.toml").string();
                     require(!cfg::validate_config(config).ok(), "absent file should fail");
                   }});

  tests.push_back({"validate_reports_warnings", [] {
                     const auto home = make_temp_home();
                     write_file(home / "lab.toml", "[devices.r1]\nos = \"iosxe\"\n");
                     cfg::Config config;
                     config.testbed.path = (home / "lab.toml").string();
                     const auto clean = cfg::validate_config(config);
                     require(clean.ok(), clean.error());
                     require(clean.value().empty(), "defaults produce no warnings");

                     config.testbed.cache_ttl_s = 0;
                     config.sessions.cache_ttl_s = -3;
                     config.artifacts.keep = false;
                     const auto warned = cfg::validate_config(config);
                     require(warned.ok(), warned.error());
                     require(warned.value().size() == 3, "three warnings expected");

                     config.scripts.timeout_s = 0;
                     require(!cfg::validate_config(config).ok(), "zero timeout is an error");
                   }});
}
