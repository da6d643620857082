#include "netpilot/device/session_cache.hpp"

#include "netpilot/observability/global.hpp"

#include <exception>
#include <vector>

namespace netpilot::device {

struct SessionSlot {
  // Held for the whole of connect + execute on this device.
  std::mutex op_mutex;
  // Guarded by SessionCache::mutex_.
  std::shared_ptr<IDeviceClient> client;
  common::TimePoint last_used{};
};

namespace {

bool connected_quietly(const IDeviceClient &client) {
  try {
    return client.is_connected();
  } catch (const std::exception &e) {
    observability::record_warning("sessions", "is_connected failed for " +
                                                  client.device_name() + ": " + e.what());
    return false;
  }
}

std::chrono::milliseconds elapsed_ms(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace

SessionLease::SessionLease(SessionLease &&other) noexcept
    : cache_(other.cache_), device_(std::move(other.device_)), client_(std::move(other.client_)),
      slot_(std::move(other.slot_)), lock_(std::move(other.lock_)), force_(other.force_) {
  other.cache_ = nullptr;
}

SessionLease &SessionLease::operator=(SessionLease &&other) noexcept {
  if (this != &other) {
    release();
    cache_ = other.cache_;
    device_ = std::move(other.device_);
    client_ = std::move(other.client_);
    slot_ = std::move(other.slot_);
    lock_ = std::move(other.lock_);
    force_ = other.force_;
    other.cache_ = nullptr;
  }
  return *this;
}

SessionLease::~SessionLease() { release(); }

void SessionLease::release() {
  if (cache_ == nullptr || client_ == nullptr) {
    return;
  }
  cache_->release(*this, force_);
  cache_ = nullptr;
}

SessionCache::SessionCache(std::shared_ptr<testbed::TopologyCache> topology,
                           std::shared_ptr<IDeviceClientFactory> factory,
                           const std::chrono::seconds ttl, common::NowFn now,
                           ConnectOptions connect_options)
    : topology_(std::move(topology)), factory_(std::move(factory)), ttl_(ttl),
      now_(std::move(now)), connect_options_(connect_options) {}

SessionCache::~SessionCache() { shutdown(); }

std::shared_ptr<SessionSlot> SessionCache::slot_for(const std::string &device_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = slots_[device_name];
  if (slot == nullptr) {
    slot = std::make_shared<SessionSlot>();
  }
  return slot;
}

void SessionCache::disconnect_quietly(IDeviceClient &client, const std::string &reason) {
  try {
    if (!client.is_connected()) {
      return;
    }
    const auto status = client.disconnect();
    if (!status.ok()) {
      observability::record_warning("sessions", "Error disconnecting " + client.device_name() +
                                                    ": " + status.error());
      return;
    }
    observability::record_device_disconnect(client.device_name(), reason);
  } catch (const std::exception &e) {
    observability::record_warning("sessions",
                                  "Error disconnecting " + client.device_name() + ": " + e.what());
  }
}

void SessionCache::publish_size_locked() const {
  std::uint64_t count = 0;
  for (const auto &[name, slot] : slots_) {
    (void)name;
    if (slot->client != nullptr) {
      ++count;
    }
  }
  observability::record_metric(observability::CachedSessionsMetric{.count = count});
}

void SessionCache::evict_expired() {
  if (!caching_enabled()) {
    return;
  }

  struct Expired {
    std::shared_ptr<IDeviceClient> client;
    std::chrono::milliseconds idle;
  };
  std::vector<Expired> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();
    for (auto &[name, slot] : slots_) {
      (void)name;
      if (slot->client == nullptr || now - slot->last_used <= ttl_) {
        continue;
      }
      // A slot in use is not idle, whatever its timestamp says.
      std::unique_lock<std::mutex> busy(slot->op_mutex, std::try_to_lock);
      if (!busy.owns_lock()) {
        continue;
      }
      expired.push_back(
          {std::move(slot->client),
           std::chrono::duration_cast<std::chrono::milliseconds>(now - slot->last_used)});
      slot->client.reset();
    }
    if (!expired.empty()) {
      publish_size_locked();
    }
  }

  for (auto &entry : expired) {
    observability::record_session_evict(entry.client->device_name(), entry.idle);
    disconnect_quietly(*entry.client, "ttl expired");
  }
}

common::Result<SessionLease> SessionCache::acquire(const std::string &device_name) {
  testbed::TopologyPtr topology;
  const auto device = topology_->find_device(device_name, topology);
  if (!device.ok()) {
    return common::Result<SessionLease>::failure(device.status());
  }

  evict_expired();

  auto slot = slot_for(device_name);
  std::unique_lock<std::mutex> op_lock(slot->op_mutex);

  std::shared_ptr<IDeviceClient> client;
  if (caching_enabled()) {
    std::lock_guard<std::mutex> lock(mutex_);
    client = slot->client;
  }

  if (client != nullptr && connected_quietly(*client)) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot->last_used = now_();
  } else {
    auto created = factory_->create(*device.value());
    if (!created.ok()) {
      return common::Result<SessionLease>::failure(common::ErrorKind::Connection,
                                                   created.error());
    }
    client = created.value();

    const auto started = std::chrono::steady_clock::now();
    common::Status connected = common::Status::success();
    try {
      if (!client->is_connected()) {
        connected = client->connect(connect_options_);
      }
    } catch (const std::exception &e) {
      connected = common::Status::error(common::ErrorKind::Connection, e.what());
    }
    observability::record_device_connect(device_name, elapsed_ms(started), connected.ok(),
                                         connected.error());
    if (!connected.ok()) {
      return common::Result<SessionLease>::failure(
          common::ErrorKind::Connection,
          "Failed to connect to " + device_name + ": " + connected.error());
    }

    if (caching_enabled()) {
      std::lock_guard<std::mutex> lock(mutex_);
      slot->client = client;
      slot->last_used = now_();
      publish_size_locked();
    }
  }

  SessionLease lease;
  lease.cache_ = this;
  lease.device_ = device_name;
  lease.client_ = std::move(client);
  lease.slot_ = std::move(slot);
  lease.lock_ = std::move(op_lock);
  return common::Result<SessionLease>::success(std::move(lease));
}

void SessionCache::release(SessionLease &lease, const bool force) {
  if (lease.client_ == nullptr) {
    return;
  }

  if (caching_enabled() && !force) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lease.slot_ != nullptr && lease.slot_->client == lease.client_) {
      lease.slot_->last_used = now_();
    }
  } else {
    if (caching_enabled() && lease.slot_ != nullptr) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (lease.slot_->client == lease.client_) {
        lease.slot_->client.reset();
        publish_size_locked();
      }
    }
    disconnect_quietly(*lease.client_, force ? "forced release" : "released");
  }

  if (lease.lock_.owns_lock()) {
    lease.lock_.unlock();
  }
}

void SessionCache::shutdown() {
  std::vector<std::shared_ptr<IDeviceClient>> clients;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[name, slot] : slots_) {
      (void)name;
      if (slot->client != nullptr) {
        clients.push_back(std::move(slot->client));
        slot->client.reset();
      }
    }
    if (!clients.empty()) {
      publish_size_locked();
    }
  }
  for (const auto &client : clients) {
    disconnect_quietly(*client, "shutdown");
  }
}

std::size_t SessionCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &[name, slot] : slots_) {
    (void)name;
    if (slot->client != nullptr) {
      ++count;
    }
  }
  return count;
}

} // namespace netpilot::device
