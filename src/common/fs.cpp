#include "netpilot/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>

namespace netpilot::common {

namespace {

bool is_blank(const std::string &line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string leading_whitespace(const std::string &line) {
  std::size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
    ++i;
  }
  return line.substr(0, i);
}

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

std::string trim_right(const std::string &input, const std::string &chars) {
  const auto end = input.find_last_not_of(chars);
  if (end == std::string::npos) {
    return "";
  }
  return input.substr(0, end + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\r' || ch == '\n') {
      lines.push_back(current);
      current.clear();
      if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    current.push_back(ch);
  }
  if (!current.empty()) {
    lines.push_back(current);
  }
  return lines;
}

std::string dedent(const std::string &text) {
  const auto lines = split_lines(text);

  std::optional<std::string> margin;
  for (const auto &line : lines) {
    if (is_blank(line)) {
      continue;
    }
    const std::string indent = leading_whitespace(line);
    if (!margin.has_value()) {
      margin = indent;
      continue;
    }
    std::size_t common = 0;
    while (common < margin->size() && common < indent.size() &&
           (*margin)[common] == indent[common]) {
      ++common;
    }
    margin->resize(common);
  }

  const std::size_t cut = margin.has_value() ? margin->size() : 0;
  std::ostringstream out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out << '\n';
    }
    if (is_blank(lines[i])) {
      continue;
    }
    out << lines[i].substr(cut);
  }
  if (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    out << '\n';
  }
  return out.str();
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorKind::Io, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorKind::Io, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorKind::Io, "Failed to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure(ErrorKind::Io, "Failed to read file: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_text_file(const std::filesystem::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Status::error(ErrorKind::Io, "Failed to open file for writing: " + path.string());
  }
  out << content;
  out.flush();
  if (!out) {
    return Status::error(ErrorKind::Io, "Failed to write file: " + path.string());
  }
  return Status::success();
}

} // namespace netpilot::common
