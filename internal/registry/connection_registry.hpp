#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/registry/session.hpp"
#include "internal/util/time.hpp"

namespace relay::registry {

/*
  Receives admission and removal events. Called inside the per-device
  critical section, so events for one device arrive strictly ordered.
  Implementations must not call back into the registry's mutating API.
*/
class RegistryObserver {
 public:
  virtual ~RegistryObserver() = default;

  // `superseded` is true when an older device session was displaced.
  virtual void OnDeviceAdmitted(const std::shared_ptr<Session>& session, bool superseded) = 0;
  virtual void OnDeviceRemoved(const std::shared_ptr<Session>& session)                    = 0;

  virtual void OnControllerAdmitted(const std::shared_ptr<Session>&) {
  }
  virtual void OnControllerRemoved(const std::shared_ptr<Session>&) {
  }
};

struct RemovedSession {
  std::string     session_id;
  std::string     identity;
  relay::v1::Role role = relay::v1::ROLE_UNSPECIFIED;
  std::string     device_id;
};

struct RegistryStats {
  std::size_t              device_sessions     = 0;
  std::size_t              controller_sessions = 0;
  std::vector<std::string> online_devices;
};

/*
  ConnectionRegistry

  Owns every live Session.

    devices_                device id     -> its single device session
    controllers_by_device_  device id     -> controller sessions watching it
    controller_sessions_    controller id -> session ids
    sessions_               session id    -> session (reverse index)

  Mutations for one device are serialized by a sharded mutex; the maps
  themselves sit behind index_mutex_ which is only held for map access.
  Lock order: shard, then index.
*/
class ConnectionRegistry {
 public:
  // Runs on the new session before it is published to lookups, so its
  // first outbound message precedes anything another thread sends to it.
  using Greeting = std::function<void(Session&)>;

  explicit ConnectionRegistry(util::ClockFn clock = util::Now);

  // Held weakly; observers usually own the registry.
  void AddObserver(const std::shared_ptr<RegistryObserver>& observer);

  // Installs a new device session; an existing one is closed with
  // SUPERSEDED first.
  std::shared_ptr<Session> AdmitDevice(const std::string& device_id, std::shared_ptr<transport::Transport> transport, const Greeting& greeting = {});

  std::shared_ptr<Session> AdmitController(const std::string& controller_id, const std::string& device_id,
                                           std::shared_ptr<transport::Transport> transport, const Greeting& greeting = {});

  // Idempotent. Superseded sessions no longer own anything and yield nullopt.
  std::optional<RemovedSession> Remove(const std::shared_ptr<Session>& session);

  std::shared_ptr<Session>              LookupDeviceSession(const std::string& device_id) const;
  std::vector<std::shared_ptr<Session>> LookupControllerSessions(const std::string& device_id) const;

  bool IsCurrentDeviceSession(const Session& session) const;

  RegistryStats Stats() const;

  void CloseAll(relay::v1::CloseReason reason);

  // Closes the device session and every controller watching the device.
  void CloseDevice(const std::string& device_id, relay::v1::CloseReason reason);

 private:
  static constexpr std::size_t kShardCount = 64;

  std::mutex& Shard(const std::string& device_id);
  std::vector<std::shared_ptr<RegistryObserver>> Observers() const;

  util::ClockFn clock_;

  std::array<std::mutex, kShardCount> shards_;

  mutable std::shared_mutex                                                                    index_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>>                                   devices_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::shared_ptr<Session>>> controllers_by_device_;
  std::unordered_map<std::string, std::unordered_set<std::string>>                            controller_sessions_;
  std::unordered_map<std::string, std::shared_ptr<Session>>                                   sessions_;

  mutable std::mutex                           observers_mutex_;
  std::vector<std::weak_ptr<RegistryObserver>> observers_;
};

} // namespace relay::registry
