#include "netpilot/scripts/script_runner.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/common/json_util.hpp"
#include "netpilot/observability/global.hpp"

#include <array>
#include <iomanip>
#include <openssl/rand.h>
#include <sstream>

namespace netpilot::scripts {

namespace {

constexpr const char *SCRIPT_FILENAME = "test_script.py";
constexpr const char *JOB_FILENAME = "job.py";
constexpr const char *REPORT_FILENAME = "report.json";

common::Result<std::string> random_suffix() {
  std::array<unsigned char, 4> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "failed to generate run id");
  }
  std::ostringstream out;
  for (const unsigned char byte : bytes) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return common::Result<std::string>::success(out.str());
}

std::string escape_single_quoted(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch == '\\' || ch == '\'') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

} // namespace

std::string extract_overall_result(const std::string &stdout_text) {
  for (const auto &line : common::split_lines(stdout_text)) {
    const std::string lowered = common::to_lower(line);
    if (lowered.find("overall") == std::string::npos) {
      continue;
    }
    if (lowered.find("passed") != std::string::npos) {
      return "PASSED";
    }
    if (lowered.find("failed") != std::string::npos) {
      return "FAILED";
    }
  }
  return "UNKNOWN";
}

std::string render_job_file(const std::filesystem::path &script_path) {
  std::ostringstream job;
  job << "from pyats.easypy import run\n"
      << "def main(runtime):\n"
      << "    run(testscript='" << escape_single_quoted(script_path.string())
      << "', runtime=runtime)\n";
  return job.str();
}

std::string ScriptRunResult::to_json() const {
  std::ostringstream out;
  if (!completed) {
    out << "{\"status\":\"error\",\"error\":" << common::json_quote(error);
    if (!run.artifacts_dir.empty()) {
      out << ",\"artifacts_dir\":" << common::json_quote(run.artifacts_dir.string());
    }
    out << "}";
    return out.str();
  }

  out << "{\"status\":\"completed\""
      << ",\"returncode\":" << return_code
      << ",\"overall_result\":" << common::json_quote(overall_result)
      << ",\"stdout\":" << common::json_quote(stdout_text)
      << ",\"stderr\":" << common::json_quote(stderr_text)
      << ",\"report\":" << (report_json.has_value() ? *report_json : std::string("null"))
      << ",\"artifacts_dir\":" << common::json_quote(run.artifacts_dir.string())
      << ",\"paths\":{\"script\":" << common::json_quote(run.script_path.string())
      << ",\"job\":" << common::json_quote(run.job_path.string())
      << ",\"report\":" << common::json_quote(run.report_path.string()) << "}}";
  return out.str();
}

ScriptRunner::ScriptRunner(ScriptRunnerOptions options,
                           std::shared_ptr<process::IProcessRunner> runner, ScriptSafetyGate gate,
                           WallClock wall_clock)
    : options_(std::move(options)), runner_(std::move(runner)), gate_(std::move(gate)),
      wall_clock_(std::move(wall_clock)) {
  if (!wall_clock_) {
    wall_clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

common::Result<ScriptRun> ScriptRunner::materialize(const std::string &script) {
  const auto suffix = random_suffix();
  if (!suffix.ok()) {
    return common::Result<ScriptRun>::failure(suffix.status());
  }
  const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            wall_clock_().time_since_epoch())
                            .count();

  ScriptRun run;
  run.run_id = "test_" + std::to_string(epoch_ms) + "_" + suffix.value();
  run.artifacts_dir = options_.artifacts_root / run.run_id;
  run.script_path = run.artifacts_dir / SCRIPT_FILENAME;
  run.job_path = run.artifacts_dir / JOB_FILENAME;
  run.report_path = run.artifacts_dir / REPORT_FILENAME;

  const auto dir = common::ensure_dir(run.artifacts_dir);
  if (!dir.ok()) {
    return common::Result<ScriptRun>::failure(dir.status());
  }
  if (const auto written = common::write_text_file(run.script_path, script); !written.ok()) {
    return common::Result<ScriptRun>::failure(written);
  }
  if (const auto written = common::write_text_file(run.job_path, render_job_file(run.script_path));
      !written.ok()) {
    return common::Result<ScriptRun>::failure(written);
  }
  return common::Result<ScriptRun>::success(std::move(run));
}

std::optional<std::string> ScriptRunner::read_report(const std::filesystem::path &path) const {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    observability::record_warning("scripts", "Failed to read report: " + content.error());
    return std::nullopt;
  }
  const std::string text = common::trim(content.value());
  if (text.empty()) {
    return std::nullopt;
  }
  if (!common::json_is_valid(text)) {
    observability::record_warning("scripts", "Failed to parse report JSON: " + path.string());
    return std::nullopt;
  }
  return text;
}

void ScriptRunner::discard(const ScriptRun &run) const {
  std::error_code ec;
  std::filesystem::remove_all(run.artifacts_dir, ec);
  if (ec) {
    observability::record_warning("scripts", "Failed to remove " + run.artifacts_dir.string() +
                                                 ": " + ec.message());
  }
}

ScriptRunResult ScriptRunner::run(const std::string &script,
                                  const std::optional<std::chrono::seconds> timeout) {
  ScriptRunResult result;
  if (common::trim(script).empty()) {
    result.error = "Empty test script content provided.";
    result.error_kind = common::ErrorKind::Validation;
    return result;
  }
  if (const auto rejected = gate_.check(script); rejected.has_value()) {
    result.error = *rejected;
    result.error_kind = common::ErrorKind::Validation;
    return result;
  }

  auto materialized = materialize(script);
  if (!materialized.ok()) {
    result.error = materialized.error();
    result.error_kind = materialized.kind();
    return result;
  }
  result.run = std::move(materialized.value());

  const auto limit = timeout.value_or(options_.default_timeout);
  process::ProcessOptions process_options;
  process_options.allow_failure = true;
  process_options.timeout = limit;
  process_options.working_dir = result.run.artifacts_dir;
  process_options.env["PYATS_TESTBED_PATH"] = options_.testbed_path;

  const auto started = std::chrono::steady_clock::now();
  const auto executed = runner_->run({options_.runner_binary, "run", "job",
                                      result.run.job_path.string(), "--json-job",
                                      result.run.report_path.string()},
                                     process_options);
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!executed.ok()) {
    result.error_kind = executed.kind();
    result.error = executed.kind() == common::ErrorKind::Timeout
                       ? "pyATS job timed out after " + std::to_string(limit.count()) + "s"
                       : executed.error();
    observability::record_error("scripts", result.run.run_id + ": " + result.error);
    return result;
  }

  const auto &process_result = executed.value();
  result.completed = true;
  result.return_code = process_result.exit_code;
  result.stdout_text = process_result.stdout_text;
  result.stderr_text = process_result.stderr_text;
  result.overall_result = extract_overall_result(process_result.stdout_text);
  result.report_json = read_report(result.run.report_path);

  observability::record_script_run(result.run.run_id, result.overall_result, result.return_code,
                                   duration);

  if (!options_.keep_artifacts) {
    discard(result.run);
  }
  return result;
}

} // namespace netpilot::scripts
