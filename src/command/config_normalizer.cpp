#include "netpilot/command/config_normalizer.hpp"

#include "netpilot/common/fs.hpp"

#include <array>
#include <sstream>
#include <string_view>

namespace netpilot::command {

namespace {

constexpr std::array<std::string_view, 5> MODE_WRAPPERS = {
    "configure terminal", "conf t", "config t", "configure t", "end",
};

std::vector<std::string> block_lines(const std::string &block) {
  std::string text = common::dedent(block);
  const auto first = text.find_first_not_of("\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of("\r\n");
  text = text.substr(first, last - first + 1);
  return common::split_lines(text);
}

void append_line(const std::string &raw_line, std::vector<std::string> &out) {
  const std::string line = common::trim_right(raw_line, "\r\n");
  if (common::trim(line).empty()) {
    return;
  }

  if (line.find(';') != std::string::npos) {
    std::stringstream stream(line);
    std::string part;
    while (std::getline(stream, part, ';')) {
      const std::string command = common::trim(part);
      if (!command.empty() && !is_mode_wrapper(command)) {
        out.push_back(command);
      }
    }
    return;
  }

  if (is_mode_wrapper(line)) {
    return;
  }
  out.push_back(line);
}

} // namespace

bool is_mode_wrapper(const std::string &line) {
  const std::string normalized = common::to_lower(common::trim(line));
  for (const auto wrapper : MODE_WRAPPERS) {
    if (normalized == wrapper) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> normalize_config(const ConfigPayload &payload) {
  std::vector<std::string> out;
  if (const auto *lines = std::get_if<std::vector<std::string>>(&payload)) {
    for (const auto &line : *lines) {
      append_line(line, out);
    }
    return out;
  }

  for (const auto &line : block_lines(std::get<std::string>(payload))) {
    append_line(line, out);
  }
  return out;
}

} // namespace netpilot::command
