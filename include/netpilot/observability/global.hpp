#pragma once

#include "netpilot/observability/observer.hpp"

#include <memory>

namespace netpilot::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_device_connect(const std::string &device, std::chrono::milliseconds duration,
                           bool success, const std::string &error = "");
void record_device_disconnect(const std::string &device, const std::string &reason);
void record_session_evict(const std::string &device, std::chrono::milliseconds idle);
void record_topology_load(const std::string &path, std::size_t device_count);
void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success);
void record_script_run(const std::string &run_id, const std::string &overall_result,
                       int return_code, std::chrono::milliseconds duration);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace netpilot::observability
