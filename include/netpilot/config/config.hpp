#pragma once

#include "netpilot/common/result.hpp"
#include "netpilot/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace netpilot::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parse a boolean flag the way environment switches are written ("1", "true", "yes", "on").
[[nodiscard]] bool parse_flag(const std::string &value, bool fallback);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace netpilot::config
