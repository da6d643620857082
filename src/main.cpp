#include "netpilot/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // Writes to a child that exited early must fail with EPIPE, not kill us.
  std::signal(SIGPIPE, SIG_IGN);
  return netpilot::cli::run_cli(argc, argv);
}
