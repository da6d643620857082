#include "netpilot/parsing/parser.hpp"

#include "netpilot/common/fs.hpp"

namespace netpilot::parsing {

namespace {

// "show  ip   route" and "show ip route" select the same parser.
std::string collapse_spaces(const std::string &command) {
  std::string out;
  bool in_space = false;
  for (const char ch : common::to_lower(common::trim(command))) {
    if (ch == ' ' || ch == '\t') {
      in_space = true;
      continue;
    }
    if (in_space && !out.empty()) {
      out.push_back(' ');
    }
    in_space = false;
    out.push_back(ch);
  }
  return out;
}

} // namespace

void StaticParserRegistry::register_parser(std::string command_prefix, std::string os,
                                           std::shared_ptr<const IOutputParser> parser) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(Entry{.command_prefix = collapse_spaces(command_prefix),
                           .os = common::to_lower(common::trim(os)),
                           .parser = std::move(parser)});
}

std::shared_ptr<const IOutputParser>
StaticParserRegistry::find(const std::string &command, const testbed::DeviceInfo &device) const {
  const std::string normalized = collapse_spaces(command);
  const std::string os = common::to_lower(device.os);

  std::lock_guard<std::mutex> lock(mutex_);
  const Entry *best = nullptr;
  for (const auto &entry : entries_) {
    if (!entry.os.empty() && entry.os != os) {
      continue;
    }
    if (!common::starts_with(normalized, entry.command_prefix)) {
      continue;
    }
    if (best == nullptr || entry.command_prefix.size() > best->command_prefix.size()) {
      best = &entry;
    }
  }
  return best == nullptr ? nullptr : best->parser;
}

std::size_t StaticParserRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace netpilot::parsing
