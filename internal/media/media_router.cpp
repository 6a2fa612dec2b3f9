#include "media_router.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/connection_registry.hpp"

namespace relay::media {

MediaRouter::MediaRouter(std::shared_ptr<registry::ConnectionRegistry> registry) : registry_(std::move(registry)) {
  if (!registry_) {
    throw std::invalid_argument("MediaRouter requires a registry");
  }
}

std::size_t MediaRouter::FanOut(const registry::Session& session, std::string_view kind, const relay::v1::ServerMessage& message, SendFn send) {
  if (session.Role() != relay::v1::ROLE_DEVICE || !registry_->IsCurrentDeviceSession(session)) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    observability::Metrics::Instance().RecordFramesDropped(kind, 1);
    RELAY_LOG_DEBUG("media from stale session dropped", {observability::StringField("session", session.Id()),
                                                         observability::DeviceField(session.DeviceId()),
                                                         observability::StringField("kind", kind)});
    return 0;
  }
  published_.fetch_add(1, std::memory_order_relaxed);

  std::size_t queued = 0;
  uint64_t    lost   = 0;
  for (const auto& controller : registry_->LookupControllerSessions(session.DeviceId())) {
    switch (((*controller).*send)(message)) {
      case transport::MediaOutcome::kQueued:
        ++queued;
        break;
      case transport::MediaOutcome::kDisplacedOldest:
        ++queued;
        ++lost;
        break;
      case transport::MediaOutcome::kRejected:
        ++lost;
        break;
    }
  }

  relayed_.fetch_add(queued, std::memory_order_relaxed);
  if (lost > 0) {
    dropped_.fetch_add(lost, std::memory_order_relaxed);
    observability::Metrics::Instance().RecordFramesDropped(kind, lost);
    RELAY_LOG_DEBUG("media dropped for slow controllers", {observability::DeviceField(session.DeviceId()),
                                                           observability::StringField("kind", kind),
                                                           observability::IntField("dropped", static_cast<std::int64_t>(lost))});
  }
  return queued;
}

std::size_t MediaRouter::Publish(const registry::Session& session, const relay::v1::MediaFrame& frame) {
  relay::v1::ServerMessage message;
  message.set_device_id(session.DeviceId());
  *message.mutable_frame() = frame;
  return FanOut(session, "frame", message, &registry::Session::SendMedia);
}

std::size_t MediaRouter::Publish(const registry::Session& session, const relay::v1::AudioChunk& chunk) {
  relay::v1::ServerMessage message;
  message.set_device_id(session.DeviceId());
  *message.mutable_audio() = chunk;
  return FanOut(session, "audio", message, &registry::Session::SendMedia);
}

std::size_t MediaRouter::PublishLocation(const registry::Session& session, const relay::v1::LocationUpdate& location) {
  relay::v1::ServerMessage message;
  message.set_device_id(session.DeviceId());
  *message.mutable_location() = location;
  return FanOut(session, "location", message, &registry::Session::SendLatest);
}

MediaStats MediaRouter::Stats() const {
  MediaStats stats;
  stats.published = published_.load(std::memory_order_relaxed);
  stats.relayed   = relayed_.load(std::memory_order_relaxed);
  stats.dropped   = dropped_.load(std::memory_order_relaxed);
  stats.rejected  = rejected_.load(std::memory_order_relaxed);
  return stats;
}

} // namespace relay::media
