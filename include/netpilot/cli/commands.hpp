#pragma once

#include <cstddef>
#include <iosfwd>

namespace netpilot::runtime {
class RuntimeContext;
}

namespace netpilot::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

/// Answers one JSON tool request per input line with one JSON result line.
/// Returns the number of requests handled.
std::size_t serve_stream(runtime::RuntimeContext &context, std::istream &in, std::ostream &out);

} // namespace netpilot::cli
