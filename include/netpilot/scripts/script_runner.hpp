#pragma once

#include "netpilot/common/result.hpp"
#include "netpilot/process/runner.hpp"
#include "netpilot/scripts/safety_gate.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace netpilot::scripts {

struct ScriptRunnerOptions {
  std::filesystem::path artifacts_root;
  bool keep_artifacts = true;
  std::string runner_binary = "pyats";
  std::string testbed_path;
  std::chrono::seconds default_timeout{300};
};

struct ScriptRun {
  std::string run_id;
  std::filesystem::path artifacts_dir;
  std::filesystem::path script_path;
  std::filesystem::path job_path;
  std::filesystem::path report_path;
};

struct ScriptRunResult {
  bool completed = false;
  std::string error;
  common::ErrorKind error_kind = common::ErrorKind::None;
  /// artifacts_dir stays empty when the run was rejected before materializing.
  ScriptRun run;
  int return_code = 0;
  std::string overall_result = "UNKNOWN";
  std::string stdout_text;
  std::string stderr_text;
  /// The machine-readable report as JSON text; absent when missing or invalid.
  std::optional<std::string> report_json;

  [[nodiscard]] std::string to_json() const;
};

/// PASSED / FAILED from the first stdout line naming an overall verdict, else UNKNOWN.
[[nodiscard]] std::string extract_overall_result(const std::string &stdout_text);

/// Easypy job file that runs `script_path` as a testscript.
[[nodiscard]] std::string render_job_file(const std::filesystem::path &script_path);

class ScriptRunner {
public:
  using WallClock = std::function<std::chrono::system_clock::time_point()>;

  ScriptRunner(ScriptRunnerOptions options, std::shared_ptr<process::IProcessRunner> runner,
               ScriptSafetyGate gate = {}, WallClock wall_clock = {});

  [[nodiscard]] ScriptRunResult run(const std::string &script,
                                    std::optional<std::chrono::seconds> timeout = std::nullopt);

  [[nodiscard]] const ScriptRunnerOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<ScriptRun> materialize(const std::string &script);
  [[nodiscard]] std::optional<std::string> read_report(const std::filesystem::path &path) const;
  void discard(const ScriptRun &run) const;

  ScriptRunnerOptions options_;
  std::shared_ptr<process::IProcessRunner> runner_;
  ScriptSafetyGate gate_;
  WallClock wall_clock_;
};

} // namespace netpilot::scripts
