#pragma once

#include <chrono>
#include <functional>

namespace netpilot::common {

using TimePoint = std::chrono::steady_clock::time_point;
using NowFn = std::function<TimePoint()>;

inline NowFn steady_now() {
  return [] { return std::chrono::steady_clock::now(); };
}

} // namespace netpilot::common
