#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace netpilot::observability {

struct DeviceConnectEvent {
  std::string device;
  std::chrono::milliseconds duration{0};
  bool success = false;
  std::string error;
};

struct DeviceDisconnectEvent {
  std::string device;
  std::string reason;
};

struct SessionEvictEvent {
  std::string device;
  std::chrono::milliseconds idle{0};
};

struct TopologyLoadEvent {
  std::string path;
  std::size_t device_count = 0;
};

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ScriptRunEvent {
  std::string run_id;
  std::string overall_result;
  int return_code = 0;
  std::chrono::milliseconds duration{0};
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DeviceConnectEvent, DeviceDisconnectEvent, SessionEvictEvent, TopologyLoadEvent,
                 ToolCallEvent, ScriptRunEvent, WarningEvent, ErrorEvent>;

struct CachedSessionsMetric {
  std::uint64_t count = 0;
};

struct CommandLatencyMetric {
  std::string device;
  std::string operation;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<CachedSessionsMetric, CommandLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace netpilot::observability
