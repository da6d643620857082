#include "netpilot/common/result.hpp"

namespace netpilot::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Connection:
    return "connection";
  case ErrorKind::Execution:
    return "execution";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Load:
    return "load";
  case ErrorKind::Io:
    return "io";
  }
  return "unknown";
}

} // namespace netpilot::common
