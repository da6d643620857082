#pragma once

#include "netpilot/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace netpilot::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string trim_right(const std::string &input, const std::string &chars);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Split on "\n", "\r\n" and "\r"; the terminators are not kept.
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);

/// Remove the leading whitespace shared by every non-blank line.
[[nodiscard]] std::string dedent(const std::string &text);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] Status write_text_file(const std::filesystem::path &path, const std::string &content);

} // namespace netpilot::common
