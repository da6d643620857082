#include "netpilot/observability/global.hpp"

#include <mutex>

namespace netpilot::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_device_connect(const std::string &device, const std::chrono::milliseconds duration,
                           const bool success, const std::string &error) {
  record_event(DeviceConnectEvent{
      .device = device, .duration = duration, .success = success, .error = error});
}

void record_device_disconnect(const std::string &device, const std::string &reason) {
  record_event(DeviceDisconnectEvent{.device = device, .reason = reason});
}

void record_session_evict(const std::string &device, const std::chrono::milliseconds idle) {
  record_event(SessionEvictEvent{.device = device, .idle = idle});
}

void record_topology_load(const std::string &path, const std::size_t device_count) {
  record_event(TopologyLoadEvent{.path = path, .device_count = device_count});
}

void record_tool_call(const std::string &tool, const std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success});
}

void record_script_run(const std::string &run_id, const std::string &overall_result,
                       const int return_code, const std::chrono::milliseconds duration) {
  record_event(ScriptRunEvent{.run_id = run_id,
                              .overall_result = overall_result,
                              .return_code = return_code,
                              .duration = duration});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace netpilot::observability
