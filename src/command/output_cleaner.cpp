#include "netpilot/command/output_cleaner.hpp"

#include <regex>

namespace netpilot::command {

namespace {

const std::regex &ansi_escape_pattern() {
  // Fe escapes are ESC followed by 0x40-0x5F other than '[', which opens a CSI.
  static const std::regex pattern(R"(\x1B(?:[@-Z\x5C-\x5F]|\[[0-?]*[ -/]*[@-~]))");
  return pattern;
}

bool is_printable(const char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  if (uch >= 0x20 && uch <= 0x7E) {
    return true;
  }
  return ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

} // namespace

std::string clean_output(const std::string &raw) {
  const std::string stripped = std::regex_replace(raw, ansi_escape_pattern(), "");
  std::string out;
  out.reserve(stripped.size());
  for (const char ch : stripped) {
    if (is_printable(ch)) {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace netpilot::command
