#pragma once

#include "netpilot/observability/observer.hpp"

#include <mutex>

namespace netpilot::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::mutex write_mutex_;
};

} // namespace netpilot::observability
