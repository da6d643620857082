#include "netpilot/process/runner.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace netpilot::process {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Drains what is readable now; closes the fd on EOF so it drops out of poll.
void read_into_buffer(int &fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (fd >= 0) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
      return;
    }
    close_fd(fd);
  }
}

// Pushes as much pending stdin as the pipe accepts; closes it once drained.
void write_pending(int &fd, const std::string &data, std::size_t &offset) {
  while (fd >= 0 && offset < data.size()) {
    const ssize_t written = write(fd, data.data() + offset, data.size() - offset);
    if (written > 0) {
      offset += static_cast<std::size_t>(written);
      continue;
    }
    if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;
    }
    close_fd(fd);
    return;
  }
  close_fd(fd);
}

struct Pipes {
  int in[2] = {-1, -1};
  int out[2] = {-1, -1};
  int err[2] = {-1, -1};

  bool open() { return pipe(in) == 0 && pipe(out) == 0 && pipe(err) == 0; }

  void close_all() {
    for (int *pair : {in, out, err}) {
      close_fd(pair[0]);
      close_fd(pair[1]);
    }
  }
};

// Inherited environment with `overrides` applied, as NAME=value strings.
std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides) {
  std::vector<std::string> entries;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view text(*entry);
    const auto eq = text.find('=');
    const std::string name(text.substr(0, eq));
    if (!overrides.contains(name)) {
      entries.emplace_back(text);
    }
  }
  for (const auto &[name, value] : overrides) {
    entries.push_back(name + "=" + value);
  }
  return entries;
}

std::vector<char *> c_string_array(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

} // namespace

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &args,
                                                      const ProcessOptions &options) {
  if (args.empty()) {
    return common::Result<ProcessResult>::failure(common::ErrorKind::Validation,
                                                  "command is empty");
  }

  Pipes pipes;
  if (!pipes.open()) {
    pipes.close_all();
    return common::Result<ProcessResult>::failure(common::ErrorKind::Io,
                                                  "failed to create pipes for " + args.front());
  }

  // Everything the child needs is allocated before fork.
  std::vector<std::string> argv_storage(args);
  std::vector<std::string> env_storage = build_environment(options.env);
  std::vector<char *> argv = c_string_array(argv_storage);
  std::vector<char *> envp = c_string_array(env_storage);

  const pid_t pid = fork();
  if (pid < 0) {
    pipes.close_all();
    return common::Result<ProcessResult>::failure(common::ErrorKind::Execution,
                                                  "failed to fork " + args.front());
  }

  if (pid == 0) {
    (void)dup2(pipes.in[0], STDIN_FILENO);
    (void)dup2(pipes.out[1], STDOUT_FILENO);
    (void)dup2(pipes.err[1], STDERR_FILENO);
    pipes.close_all();

    if (options.working_dir.has_value() && chdir(options.working_dir->c_str()) != 0) {
      _exit(126);
    }
    execvpe(argv[0], argv.data(), envp.data());
    _exit(127);
  }

  close_fd(pipes.in[0]);
  close_fd(pipes.out[1]);
  close_fd(pipes.err[1]);
  set_non_blocking(pipes.in[1]);
  set_non_blocking(pipes.out[0]);
  set_non_blocking(pipes.err[0]);

  std::string stdout_text;
  std::string stderr_text;
  std::size_t stdin_offset = 0;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    write_pending(pipes.in[1], options.stdin_text, stdin_offset);
    read_into_buffer(pipes.out[0], stdout_text);
    read_into_buffer(pipes.err[0], stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = pipes.out[0], .events = POLLIN, .revents = 0},
        {.fd = pipes.err[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(pipes.out[0], stdout_text);
  read_into_buffer(pipes.err[0], stderr_text);
  pipes.close_all();

  if (timed_out) {
    const auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count();
    return common::Result<ProcessResult>::failure(
        common::ErrorKind::Timeout,
        args.front() + " timed out after " + std::to_string(seconds) + "s");
  }

  ProcessResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  if (result.exit_code == 127 && result.stdout_text.empty() && result.stderr_text.empty()) {
    return common::Result<ProcessResult>::failure(common::ErrorKind::Execution,
                                                  "failed to execute " + args.front());
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "command failed: " + join_args(args)
                                    : result.stderr_text;
    return common::Result<ProcessResult>::failure(common::ErrorKind::Execution, message);
  }

  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace netpilot::process
