#pragma once

#include "netpilot/common/result.hpp"
#include "netpilot/testbed/topology.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace netpilot::parsing {

/// Turns cleaned command output into a structured value (JSON text).
/// Fails when the output does not match the parser's grammar.
class IOutputParser {
public:
  virtual ~IOutputParser() = default;
  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::string> parse(const std::string &output) const = 0;
};

class IParserRegistry {
public:
  virtual ~IParserRegistry() = default;
  [[nodiscard]] virtual std::shared_ptr<const IOutputParser>
  find(const std::string &command, const testbed::DeviceInfo &device) const = 0;
};

/// Lookup table keyed by (command prefix, os). The longest matching prefix
/// wins; an empty os matches every device.
class StaticParserRegistry final : public IParserRegistry {
public:
  void register_parser(std::string command_prefix, std::string os,
                       std::shared_ptr<const IOutputParser> parser);

  [[nodiscard]] std::shared_ptr<const IOutputParser>
  find(const std::string &command, const testbed::DeviceInfo &device) const override;

  [[nodiscard]] std::size_t size() const;

private:
  struct Entry {
    std::string command_prefix;
    std::string os;
    std::shared_ptr<const IOutputParser> parser;
  };

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

} // namespace netpilot::parsing
