#pragma once

#include "netpilot/common/clock.hpp"
#include "netpilot/testbed/topology.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace netpilot::testbed {

/// Single-slot TTL cache over the testbed descriptor. A non-positive TTL
/// reloads on every call. Readers always receive a complete snapshot.
class TopologyCache {
public:
  TopologyCache(std::shared_ptr<ITopologyLoader> loader, std::string path,
                std::chrono::seconds ttl, common::NowFn now = common::steady_now());

  [[nodiscard]] common::Result<TopologyPtr> get();
  [[nodiscard]] common::Result<const DeviceInfo *> find_device(const std::string &name,
                                                               TopologyPtr &holder);
  void invalidate();

  [[nodiscard]] const std::string &path() const { return path_; }
  [[nodiscard]] std::chrono::seconds ttl() const { return ttl_; }

private:
  [[nodiscard]] bool fresh_locked(common::TimePoint now) const;

  std::shared_ptr<ITopologyLoader> loader_;
  std::string path_;
  std::chrono::seconds ttl_;
  common::NowFn now_;

  std::mutex mutex_;
  TopologyPtr snapshot_;
  std::optional<common::TimePoint> loaded_at_;
};

} // namespace netpilot::testbed
