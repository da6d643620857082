#include "netpilot/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace netpilot::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::string level = "INFO";
  const std::string message = std::visit(
      [&level](auto &&evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DeviceConnectEvent>) {
          if (!evt.success) {
            level = "ERROR";
            return "device.connect device=" + evt.device + " success=false error=" + evt.error;
          }
          return "device.connect device=" + evt.device +
                 " duration_ms=" + std::to_string(evt.duration.count());
        } else if constexpr (std::is_same_v<T, DeviceDisconnectEvent>) {
          return "device.disconnect device=" + evt.device + " reason=" + evt.reason;
        } else if constexpr (std::is_same_v<T, SessionEvictEvent>) {
          return "session.evict device=" + evt.device +
                 " idle_ms=" + std::to_string(evt.idle.count());
        } else if constexpr (std::is_same_v<T, TopologyLoadEvent>) {
          level = "DEBUG";
          return "topology.load path=" + evt.path +
                 " devices=" + std::to_string(evt.device_count);
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          return "tool.call name=" + evt.tool + " success=" + bool_text(evt.success) +
                 " duration_ms=" + std::to_string(evt.duration.count());
        } else if constexpr (std::is_same_v<T, ScriptRunEvent>) {
          return "script.run id=" + evt.run_id + " overall=" + evt.overall_result +
                 " returncode=" + std::to_string(evt.return_code) +
                 " duration_ms=" + std::to_string(evt.duration.count());
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          level = "WARN";
          return evt.component + ": " + evt.message;
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          level = "ERROR";
          return evt.component + ": " + evt.message;
        }
      },
      event);

  std::lock_guard<std::mutex> lock(write_mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  const std::string message = std::visit(
      [](auto &&m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CachedSessionsMetric>) {
          return "metric.cached_sessions=" + std::to_string(m.count);
        } else if constexpr (std::is_same_v<T, CommandLatencyMetric>) {
          return "metric.command_latency_ms=" + std::to_string(m.latency.count()) +
                 " device=" + m.device + " op=" + m.operation;
        }
      },
      metric);

  std::lock_guard<std::mutex> lock(write_mutex_);
  std::cerr << "[DEBUG] " << message << "\n";
}

} // namespace netpilot::observability
