#include "netpilot/cli/commands.hpp"

#include "netpilot/common/fs.hpp"
#include "netpilot/common/json_util.hpp"
#include "netpilot/config/config.hpp"
#include "netpilot/pipeline/outcome.hpp"
#include "netpilot/runtime/app.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace netpilot::cli {

namespace {

std::string version_string() {
#ifdef NETPILOT_VERSION
  std::string version = NETPILOT_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "netpilot " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

common::Result<std::unique_ptr<runtime::RuntimeContext>> open_runtime() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << "[ERROR] " << context.error() << "\n";
  }
  return context;
}

// key=value pairs; "@path" reads the value from a file.
common::Result<tools::ToolArgs> parse_call_args(const std::vector<std::string> &args,
                                                const std::size_t begin) {
  tools::ToolArgs out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    const auto eq = args[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      return common::Result<tools::ToolArgs>::failure(common::ErrorKind::Validation,
                                                      "expected key=value, got: " + args[i]);
    }
    const std::string key = args[i].substr(0, eq);
    std::string value = args[i].substr(eq + 1);
    if (common::starts_with(value, "@")) {
      auto content = common::read_text_file(common::expand_path(value.substr(1)));
      if (!content.ok()) {
        return common::Result<tools::ToolArgs>::failure(content.status());
      }
      value = std::move(content.value());
    }
    out[key] = std::move(value);
  }
  return common::Result<tools::ToolArgs>::success(std::move(out));
}

int run_devices() {
  auto context = open_runtime();
  if (!context.ok()) {
    return 1;
  }
  std::cout << context.value()->pipeline().list_devices() << "\n";
  return 0;
}

int run_tools() {
  auto context = open_runtime();
  if (!context.ok()) {
    return 1;
  }
  for (const auto &spec : context.value()->tools().all_specs()) {
    std::cout << spec.name << (spec.safe ? "" : " (changes state)") << "\n  "
              << spec.description << "\n";
  }
  return 0;
}

int run_call(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: netpilot call <tool> [key=value ...]\n";
    return 1;
  }
  const auto tool_args = parse_call_args(args, 1);
  if (!tool_args.ok()) {
    std::cerr << tool_args.error() << "\n";
    return 1;
  }
  auto context = open_runtime();
  if (!context.ok()) {
    return 1;
  }
  const std::string output = context.value()->tools().invoke(args[0], tool_args.value());
  std::cout << output << "\n";
  return common::json_get_string(output, "status") == "completed" ? 0 : 2;
}

int run_serve() {
  auto context = open_runtime();
  if (!context.ok()) {
    return 1;
  }
  std::cerr << "[INFO] " << version_string() << " serving "
            << context.value()->tools().all_tools().size() << " tools on stdin/stdout\n";
  (void)serve_stream(*context.value(), std::cin, std::cout);
  context.value()->shutdown();
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  netpilot [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  devices                    List devices in the testbed\n";
  std::cout << "  tools                      List available tools\n";
  std::cout << "  call <tool> [key=value]    Invoke one tool (value @FILE reads a file)\n";
  std::cout << "  serve                      Answer JSON tool requests, one per stdin line\n";
  std::cout << "  config-path                Print the config file location\n";
  std::cout << "  version                    Show version\n\n";
  std::cout << "ENVIRONMENT\n";
  std::cout << "  NETPILOT_TESTBED_PATH      Testbed file (required)\n";
  std::cout << "  NETPILOT_CONN_CACHE_TTL    Seconds to keep idle device sessions (0 = off)\n";
  std::cout << "  NETPILOT_ARTIFACTS_DIR     Where script runs are kept\n";
}

} // namespace

std::size_t serve_stream(runtime::RuntimeContext &context, std::istream &in, std::ostream &out) {
  std::size_t handled = 0;
  std::string line;
  while (std::getline(in, line)) {
    const std::string request = common::trim(line);
    if (request.empty()) {
      continue;
    }
    ++handled;

    if (!common::json_is_valid(request) || request.front() != '{') {
      out << pipeline::error_json("Invalid request: expected a JSON object") << std::endl;
      continue;
    }
    const std::string tool = common::json_get_string(request, "tool");
    if (tool.empty()) {
      out << pipeline::error_json("Invalid request: missing \"tool\"") << std::endl;
      continue;
    }

    tools::ToolArgs args;
    const std::string arguments = common::json_get_object(request, "arguments");
    if (!arguments.empty()) {
      for (auto &[key, value] : common::json_parse_flat(arguments)) {
        args.emplace(key, std::move(value));
      }
    }
    out << context.tools().invoke(tool, args) << std::endl;
  }
  return handled;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "devices") {
    return run_devices();
  }
  if (subcommand == "tools") {
    return run_tools();
  }
  if (subcommand == "call") {
    return run_call(args);
  }
  if (subcommand == "serve") {
    return run_serve();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace netpilot::cli
