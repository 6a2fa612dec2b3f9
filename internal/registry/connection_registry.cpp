#include "connection_registry.hpp"

#include <functional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace relay::registry {

namespace {

void PublishGauges(std::size_t devices, std::size_t controllers) {
  observability::Metrics::Instance().SetActiveSessions("device", static_cast<std::int64_t>(devices));
  observability::Metrics::Instance().SetActiveSessions("controller", static_cast<std::int64_t>(controllers));
}

} // namespace

ConnectionRegistry::ConnectionRegistry(util::ClockFn clock) : clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
}

void ConnectionRegistry::AddObserver(const std::shared_ptr<RegistryObserver>& observer) {
  std::lock_guard lock(observers_mutex_);
  observers_.push_back(observer);
}

std::vector<std::shared_ptr<RegistryObserver>> ConnectionRegistry::Observers() const {
  std::lock_guard                                lock(observers_mutex_);
  std::vector<std::shared_ptr<RegistryObserver>> out;
  out.reserve(observers_.size());
  for (const auto& weak : observers_) {
    if (auto observer = weak.lock()) out.push_back(std::move(observer));
  }
  return out;
}

std::mutex& ConnectionRegistry::Shard(const std::string& device_id) {
  return shards_[std::hash<std::string>{}(device_id) % kShardCount];
}

// ---------------------------------------------------------------------------
// Admission
// ---------------------------------------------------------------------------

std::shared_ptr<Session> ConnectionRegistry::AdmitDevice(const std::string& device_id, std::shared_ptr<transport::Transport> transport,
                                                         const Greeting& greeting) {
  if (device_id.empty()) {
    throw std::invalid_argument("device session requires a device id");
  }

  std::lock_guard shard(Shard(device_id));

  auto session = std::make_shared<Session>(util::NewId(), relay::v1::ROLE_DEVICE, device_id, device_id, std::move(transport), clock_());
  if (greeting) greeting(*session);

  std::shared_ptr<Session> displaced;
  std::size_t              device_count     = 0;
  std::size_t              controller_count = 0;
  {
    std::unique_lock index(index_mutex_);
    auto&            slot = devices_[device_id];
    displaced             = std::move(slot);
    slot                  = session;
    if (displaced) {
      sessions_.erase(displaced->Id());
    }
    sessions_.emplace(session->Id(), session);
    device_count     = devices_.size();
    controller_count = sessions_.size() - devices_.size();
  }

  if (displaced) {
    displaced->Close(relay::v1::CLOSE_REASON_SUPERSEDED, "replaced by a newer device connection");
    RELAY_LOG_INFO("device session superseded", {observability::DeviceField(device_id), observability::StringField("old_session", displaced->Id()),
                                                 observability::StringField("new_session", session->Id())});
  } else {
    RELAY_LOG_INFO("device session admitted", {observability::DeviceField(device_id), observability::StringField("session", session->Id())});
  }
  PublishGauges(device_count, controller_count);

  for (const auto& observer : Observers()) {
    observer->OnDeviceAdmitted(session, displaced != nullptr);
  }
  return session;
}

std::shared_ptr<Session> ConnectionRegistry::AdmitController(const std::string& controller_id, const std::string& device_id,
                                                             std::shared_ptr<transport::Transport> transport, const Greeting& greeting) {
  if (controller_id.empty() || device_id.empty()) {
    throw std::invalid_argument("controller session requires a controller id and a device id");
  }

  std::lock_guard shard(Shard(device_id));

  auto session = std::make_shared<Session>(util::NewId(), relay::v1::ROLE_CONTROLLER, controller_id, device_id, std::move(transport), clock_());
  if (greeting) greeting(*session);

  std::size_t device_count     = 0;
  std::size_t controller_count = 0;
  {
    std::unique_lock index(index_mutex_);
    controllers_by_device_[device_id].emplace(session->Id(), session);
    controller_sessions_[controller_id].insert(session->Id());
    sessions_.emplace(session->Id(), session);
    device_count     = devices_.size();
    controller_count = sessions_.size() - devices_.size();
  }

  RELAY_LOG_INFO("controller session admitted", {observability::StringField("controller_id", controller_id),
                                                 observability::DeviceField(device_id), observability::StringField("session", session->Id())});
  PublishGauges(device_count, controller_count);

  for (const auto& observer : Observers()) {
    observer->OnControllerAdmitted(session);
  }
  return session;
}

// ---------------------------------------------------------------------------
// Removal
// ---------------------------------------------------------------------------

std::optional<RemovedSession> ConnectionRegistry::Remove(const std::shared_ptr<Session>& session) {
  if (!session) {
    return std::nullopt;
  }

  std::lock_guard shard(Shard(session->DeviceId()));

  std::size_t device_count     = 0;
  std::size_t controller_count = 0;
  {
    std::unique_lock index(index_mutex_);
    auto             it = sessions_.find(session->Id());
    if (it == sessions_.end() || it->second != session) {
      return std::nullopt;
    }
    sessions_.erase(it);

    if (session->Role() == relay::v1::ROLE_DEVICE) {
      auto slot = devices_.find(session->DeviceId());
      if (slot != devices_.end() && slot->second == session) {
        devices_.erase(slot);
      }
    } else {
      if (auto watchers = controllers_by_device_.find(session->DeviceId()); watchers != controllers_by_device_.end()) {
        watchers->second.erase(session->Id());
        if (watchers->second.empty()) controllers_by_device_.erase(watchers);
      }
      if (auto owned = controller_sessions_.find(session->Identity()); owned != controller_sessions_.end()) {
        owned->second.erase(session->Id());
        if (owned->second.empty()) controller_sessions_.erase(owned);
      }
    }
    device_count     = devices_.size();
    controller_count = sessions_.size() - devices_.size();
  }

  RELAY_LOG_INFO("session removed", {observability::StringField("session", session->Id()), observability::DeviceField(session->DeviceId()),
                                     observability::StringField("role", relay::v1::Role_Name(session->Role()))});
  PublishGauges(device_count, controller_count);

  for (const auto& observer : Observers()) {
    if (session->Role() == relay::v1::ROLE_DEVICE) {
      observer->OnDeviceRemoved(session);
    } else {
      observer->OnControllerRemoved(session);
    }
  }

  return RemovedSession{session->Id(), session->Identity(), session->Role(), session->DeviceId()};
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

std::shared_ptr<Session> ConnectionRegistry::LookupDeviceSession(const std::string& device_id) const {
  std::shared_lock index(index_mutex_);
  auto             it = devices_.find(device_id);
  return it == devices_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Session>> ConnectionRegistry::LookupControllerSessions(const std::string& device_id) const {
  std::shared_lock                      index(index_mutex_);
  std::vector<std::shared_ptr<Session>> out;
  if (auto it = controllers_by_device_.find(device_id); it != controllers_by_device_.end()) {
    out.reserve(it->second.size());
    for (const auto& [id, session] : it->second) {
      out.push_back(session);
    }
  }
  return out;
}

bool ConnectionRegistry::IsCurrentDeviceSession(const Session& session) const {
  std::shared_lock index(index_mutex_);
  auto             it = devices_.find(session.DeviceId());
  return it != devices_.end() && it->second.get() == &session;
}

RegistryStats ConnectionRegistry::Stats() const {
  std::shared_lock index(index_mutex_);
  RegistryStats    stats;
  stats.device_sessions     = devices_.size();
  stats.controller_sessions = sessions_.size() - devices_.size();
  stats.online_devices.reserve(devices_.size());
  for (const auto& [device_id, session] : devices_) {
    stats.online_devices.push_back(device_id);
  }
  return stats;
}

// ---------------------------------------------------------------------------
// Bulk close
// ---------------------------------------------------------------------------

void ConnectionRegistry::CloseAll(relay::v1::CloseReason reason) {
  std::vector<std::shared_ptr<Session>> live;
  {
    std::shared_lock index(index_mutex_);
    live.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
      live.push_back(session);
    }
  }

  RELAY_LOG_INFO("closing all sessions", {observability::IntField("sessions", static_cast<std::int64_t>(live.size())),
                                          observability::StringField("reason", relay::v1::CloseReason_Name(reason))});
  for (const auto& session : live) {
    session->Close(reason);
  }
}

void ConnectionRegistry::CloseDevice(const std::string& device_id, relay::v1::CloseReason reason) {
  if (auto device = LookupDeviceSession(device_id)) {
    device->Close(reason);
  }
  for (const auto& controller : LookupControllerSessions(device_id)) {
    controller->Close(reason);
  }
}

} // namespace relay::registry
