#pragma once

#include "netpilot/config/schema.hpp"
#include "netpilot/observability/observer.hpp"

#include <memory>

namespace netpilot::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace netpilot::observability
