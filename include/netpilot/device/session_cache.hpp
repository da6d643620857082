#pragma once

#include "netpilot/common/clock.hpp"
#include "netpilot/device/client.hpp"
#include "netpilot/testbed/topology_cache.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace netpilot::device {

class SessionCache;
struct SessionSlot;

/// Exclusive use of one device session for the duration of an operation.
/// Releasing (explicitly or on destruction) hands the session back to the cache.
class SessionLease {
public:
  SessionLease() = default;
  SessionLease(SessionLease &&other) noexcept;
  SessionLease &operator=(SessionLease &&other) noexcept;
  SessionLease(const SessionLease &) = delete;
  SessionLease &operator=(const SessionLease &) = delete;
  ~SessionLease();

  [[nodiscard]] IDeviceClient &client() const { return *client_; }
  [[nodiscard]] const std::string &device() const { return device_; }
  [[nodiscard]] bool active() const { return lock_.owns_lock(); }

  /// The session is broken; releasing disconnects it even when caching is on.
  void mark_failed() { force_ = true; }
  void release();

private:
  friend class SessionCache;

  SessionCache *cache_ = nullptr;
  std::string device_;
  std::shared_ptr<IDeviceClient> client_;
  std::shared_ptr<SessionSlot> slot_;
  std::unique_lock<std::mutex> lock_;
  bool force_ = false;
};

/// Device name -> live session. With a positive TTL sessions are kept and
/// evicted after TTL of idleness; otherwise every lease connects and its
/// release disconnects.
class SessionCache {
public:
  SessionCache(std::shared_ptr<testbed::TopologyCache> topology,
               std::shared_ptr<IDeviceClientFactory> factory, std::chrono::seconds ttl,
               common::NowFn now = common::steady_now(), ConnectOptions connect_options = {});
  ~SessionCache();

  SessionCache(const SessionCache &) = delete;
  SessionCache &operator=(const SessionCache &) = delete;

  [[nodiscard]] common::Result<SessionLease> acquire(const std::string &device_name);
  void release(SessionLease &lease, bool force = false);

  /// Disconnect entries idle for longer than the TTL.
  void evict_expired();
  /// Disconnect and forget every cached session.
  void shutdown();

  [[nodiscard]] bool caching_enabled() const { return ttl_.count() > 0; }
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::chrono::seconds ttl() const { return ttl_; }

private:
  std::shared_ptr<SessionSlot> slot_for(const std::string &device_name);
  void disconnect_quietly(IDeviceClient &client, const std::string &reason);
  void publish_size_locked() const;

  std::shared_ptr<testbed::TopologyCache> topology_;
  std::shared_ptr<IDeviceClientFactory> factory_;
  std::chrono::seconds ttl_;
  common::NowFn now_;
  ConnectOptions connect_options_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionSlot>> slots_;
};

} // namespace netpilot::device
