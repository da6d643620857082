#include "netpilot/config/config.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace netpilot::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".netpilot";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("NETPILOT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("NETPILOT_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env first so set_env_if_missing keeps its values over cwd.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::int64_t> parse_int_env(const char *value) {
  const std::string text = common::trim(value);
  std::int64_t parsed = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorKind::Io, "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.status());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

bool parse_flag(const std::string &value, const bool fallback) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
    return true;
  }
  if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
    return false;
  }
  return fallback;
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *path = non_empty_env("NETPILOT_TESTBED_PATH"); path != nullptr) {
    config.testbed.path = common::expand_path(path);
  }
  if (const char *ttl = non_empty_env("NETPILOT_TESTBED_CACHE_TTL"); ttl != nullptr) {
    if (const auto parsed = parse_int_env(ttl); parsed.has_value()) {
      config.testbed.cache_ttl_s = *parsed;
    }
  }
  if (const char *ttl = non_empty_env("NETPILOT_CONN_CACHE_TTL"); ttl != nullptr) {
    if (const auto parsed = parse_int_env(ttl); parsed.has_value()) {
      config.sessions.cache_ttl_s = *parsed;
    }
  }
  if (const char *dir = non_empty_env("NETPILOT_ARTIFACTS_DIR"); dir != nullptr) {
    config.artifacts.dir = dir;
  }
  if (const char *keep = non_empty_env("NETPILOT_KEEP_ARTIFACTS"); keep != nullptr) {
    config.artifacts.keep = parse_flag(keep, config.artifacts.keep);
  }
  if (const char *runner = non_empty_env("NETPILOT_TEST_RUNNER"); runner != nullptr) {
    config.scripts.runner = runner;
  }
  if (const char *timeout = non_empty_env("NETPILOT_TEST_TIMEOUT"); timeout != nullptr) {
    if (const auto parsed = parse_int_env(timeout); parsed.has_value() && *parsed > 0) {
      config.scripts.timeout_s = static_cast<std::uint64_t>(*parsed);
    }
  }
  if (const char *backend = non_empty_env("NETPILOT_OBSERVABILITY"); backend != nullptr) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;
  if (doc.has("testbed.path")) {
    config.testbed.path = expand_config_value(doc.get_string("testbed.path"));
  }
  config.testbed.cache_ttl_s = doc.get_int("testbed.cache_ttl_s",
                                           static_cast<int>(config.testbed.cache_ttl_s));
  config.sessions.cache_ttl_s = doc.get_int("sessions.cache_ttl_s",
                                            static_cast<int>(config.sessions.cache_ttl_s));

  config.artifacts.dir = doc.get_string("artifacts.dir", config.artifacts.dir);
  config.artifacts.keep = doc.get_bool("artifacts.keep", config.artifacts.keep);

  config.scripts.runner = expand_config_value(doc.get_string("scripts.runner", config.scripts.runner));
  config.scripts.timeout_s = doc.get_u64("scripts.timeout_s", config.scripts.timeout_s);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Load,
                                           "Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Load,
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.testbed.path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::Validation,
        "testbed path is not set (testbed.path or NETPILOT_TESTBED_PATH)");
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(config.testbed.path, ec)) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::Validation, "testbed file does not exist: " + config.testbed.path);
  }
  if (config.scripts.timeout_s == 0) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::Validation, "scripts.timeout_s must be > 0");
  }
  if (common::trim(config.scripts.runner).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        common::ErrorKind::Validation, "scripts.runner must not be empty");
  }

  if (config.testbed.cache_ttl_s <= 0) {
    warnings.push_back("testbed.cache_ttl_s <= 0: the testbed is reloaded on every call");
  }
  if (config.sessions.cache_ttl_s < 0) {
    warnings.push_back("sessions.cache_ttl_s < 0 is treated as 0 (session caching disabled)");
  }
  if (!config.artifacts.keep) {
    warnings.push_back("artifacts.keep is false: script run directories are removed after each run");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace netpilot::config
