#include "netpilot/testbed/topology_cache.hpp"

#include "netpilot/observability/global.hpp"

namespace netpilot::testbed {

TopologyCache::TopologyCache(std::shared_ptr<ITopologyLoader> loader, std::string path,
                             const std::chrono::seconds ttl, common::NowFn now)
    : loader_(std::move(loader)), path_(std::move(path)), ttl_(ttl), now_(std::move(now)) {}

bool TopologyCache::fresh_locked(const common::TimePoint now) const {
  if (snapshot_ == nullptr || !loaded_at_.has_value() || ttl_.count() <= 0) {
    return false;
  }
  return now - *loaded_at_ <= ttl_;
}

common::Result<TopologyPtr> TopologyCache::get() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = now_();
  if (fresh_locked(now)) {
    return common::Result<TopologyPtr>::success(snapshot_);
  }

  auto loaded = loader_->load(path_);
  if (!loaded.ok()) {
    observability::record_error("testbed", "failed to load " + path_ + ": " + loaded.error());
    return common::Result<TopologyPtr>::failure(common::ErrorKind::Load, loaded.error());
  }

  snapshot_ = loaded.value();
  loaded_at_ = now;
  observability::record_topology_load(path_, snapshot_->size());
  return common::Result<TopologyPtr>::success(snapshot_);
}

common::Result<const DeviceInfo *> TopologyCache::find_device(const std::string &name,
                                                              TopologyPtr &holder) {
  auto topology = get();
  if (!topology.ok()) {
    return common::Result<const DeviceInfo *>::failure(topology.status());
  }
  holder = topology.value();
  const DeviceInfo *device = holder->find(name);
  if (device == nullptr) {
    return common::Result<const DeviceInfo *>::failure(
        common::ErrorKind::NotFound, "Device '" + name + "' not found in testbed '" + path_ + "'.");
  }
  return common::Result<const DeviceInfo *>::success(device);
}

void TopologyCache::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_.reset();
  loaded_at_.reset();
}

} // namespace netpilot::testbed
