#pragma once

#include "netpilot/common/result.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace netpilot::common {

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;

  /// Sorted, de-duplicated names of the tables directly below `prefix`
  /// (e.g. "devices" -> {"r1", "r2"} for keys "devices.r1.os", "devices.r2.os").
  [[nodiscard]] std::vector<std::string> child_tables(const std::string &prefix) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace netpilot::common
