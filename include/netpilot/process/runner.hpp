#pragma once

#include "netpilot/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netpilot::process {

struct ProcessOptions {
  /// Non-zero exit codes are returned as results instead of failures.
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  std::optional<std::filesystem::path> working_dir;
  /// Added to (and overriding) the inherited environment.
  std::map<std::string, std::string> env;
  std::string stdin_text;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// args[0] is the program, resolved through PATH. A timeout kills the
  /// child and fails with ErrorKind::Timeout.
  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &args, const ProcessOptions &options = {}) = 0;
};

class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] common::Result<ProcessResult>
  run(const std::vector<std::string> &args, const ProcessOptions &options = {}) override;
};

[[nodiscard]] std::string join_args(const std::vector<std::string> &args);

} // namespace netpilot::process
