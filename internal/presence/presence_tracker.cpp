#include "presence_tracker.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/command_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace relay::presence {

namespace {

google::protobuf::Timestamp FromMillis(uint64_t ms) {
  return util::ToProto(util::FromUnixMillis(ms));
}

} // namespace

PresenceTracker::PresenceTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::ConnectionRegistry> registry,
                                 std::shared_ptr<queue::CommandQueue> queue, util::ClockFn clock)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      queue_(std::move(queue)),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
  if (!repository_ || !registry_) {
    throw std::invalid_argument("PresenceTracker requires a repository and a registry");
  }
}

relay::v1::DeviceStatus PresenceTracker::ToDeviceStatus(const db::model::DeviceRecord& record) {
  relay::v1::DeviceStatus status;
  status.set_device_id(record.id);
  status.set_name(record.name);
  status.set_presence(record.presence);
  if (record.last_seen_ms > 0) {
    *status.mutable_last_seen() = FromMillis(record.last_seen_ms);
  }
  if (!record.status_json.empty()) {
    util::FromJson(record.status_json, status.mutable_report());
  }
  if (!record.info_json.empty()) {
    util::FromJson(record.info_json, status.mutable_info());
  }
  *status.mutable_settings() = util::ParseStruct(record.settings_json);
  status.set_paired(record.paired);
  return status;
}

PresenceTracker::Transition PresenceTracker::Persist(const std::string& device_id, std::optional<relay::v1::Presence> presence,
                                                     const relay::v1::StatusReport* report) {
  Transition transition;
  transition.last_seen_ms = util::ToUnixMillis(clock_());
  if (presence) {
    transition.presence = *presence;
  }
  if (report) {
    transition.report     = *report;
    transition.has_report = true;
  }

  try {
    auto tx     = repository_->Begin();
    auto device = repository_->GetDevice(*tx, device_id);
    if (!device) {
      RELAY_LOG_WARN("presence update for unknown device", {observability::DeviceField(device_id)});
      return transition;
    }

    if (presence) {
      device->presence = *presence;
    } else {
      transition.presence = device->presence;
    }
    device->last_seen_ms = transition.last_seen_ms;
    if (report) {
      device->status_json = util::ToJson(*report);
    } else if (!device->status_json.empty()) {
      util::FromJson(device->status_json, &transition.report);
      transition.has_report = true;
    }

    if (auto result = repository_->UpdateDevice(*tx, *device); !result) {
      RELAY_LOG_ERROR("presence persist failed", {observability::DeviceField(device_id), observability::StringField("error", result.message)});
      return transition;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("presence persist failed", {observability::DeviceField(device_id), observability::StringField("error", e.what())});
  }
  return transition;
}

void PresenceTracker::Broadcast(const std::string& device_id, const Transition& transition) const {
  relay::v1::ServerMessage message;
  message.set_device_id(device_id);
  auto* event = message.mutable_device_status();
  event->set_device_id(device_id);
  event->set_presence(transition.presence);
  *event->mutable_last_seen() = FromMillis(transition.last_seen_ms);
  if (transition.has_report) {
    *event->mutable_report() = transition.report;
  }

  for (const auto& controller : registry_->LookupControllerSessions(device_id)) {
    if (!controller->Send(message)) {
      RELAY_LOG_DEBUG("status broadcast skipped closed controller", {observability::StringField("session", controller->Id())});
    }
  }
}

// ---------------------------------------------------------------------------
// Registry events
// ---------------------------------------------------------------------------

void PresenceTracker::OnDeviceAdmitted(const std::shared_ptr<registry::Session>& session, bool superseded) {
  const auto transition = Persist(session->DeviceId(), relay::v1::PRESENCE_ONLINE, nullptr);
  Broadcast(session->DeviceId(), transition);
  RELAY_LOG_INFO("device online", {observability::DeviceField(session->DeviceId()), observability::BoolField("superseded", superseded)});

  if (queue_) {
    try {
      queue_->Drain(session->DeviceId());
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("command drain failed", {observability::DeviceField(session->DeviceId()), observability::StringField("error", e.what())});
    }
  }
}

void PresenceTracker::OnDeviceRemoved(const std::shared_ptr<registry::Session>& session) {
  const auto transition = Persist(session->DeviceId(), relay::v1::PRESENCE_OFFLINE, nullptr);
  Broadcast(session->DeviceId(), transition);
  RELAY_LOG_INFO("device offline", {observability::DeviceField(session->DeviceId())});
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

void PresenceTracker::RecordStatus(const std::string& device_id, const relay::v1::StatusReport& report) {
  Broadcast(device_id, Persist(device_id, std::nullopt, &report));
}

void PresenceTracker::Touch(const std::string& device_id) {
  Persist(device_id, std::nullopt, nullptr);
}

relay::v1::DeviceStatus PresenceTracker::Snapshot(const std::string& device_id) const {
  auto tx     = repository_->Begin();
  auto device = repository_->GetDevice(*tx, device_id);
  tx->Commit();
  if (!device) {
    throw util::NotFound("device not found: " + device_id);
  }
  return ToDeviceStatus(*device);
}

std::size_t PresenceTracker::ResetAllOffline() {
  std::size_t reset = 0;
  auto        tx    = repository_->Begin();
  for (auto& device : repository_->ListDevices(*tx)) {
    if (device.presence == relay::v1::PRESENCE_OFFLINE) continue;
    device.presence = relay::v1::PRESENCE_OFFLINE;
    db::ThrowIfError(repository_->UpdateDevice(*tx, device), "reset presence");
    ++reset;
  }
  tx->Commit();
  return reset;
}

} // namespace relay::presence
