#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "internal/transport/transport.hpp"
#include "relay/v1/envelope.pb.h"

namespace relay::registry {
class ConnectionRegistry;
class Session;
} // namespace relay::registry

namespace relay::media {

struct MediaStats {
  uint64_t published = 0; // accepted from the current device session
  uint64_t relayed   = 0; // copies handed to controller transports
  uint64_t dropped   = 0; // copies lost to overflow or closed controllers
  uint64_t rejected  = 0; // frames from stale or superseded sessions
};

/*
  MediaRouter

  Fans live frames from the one device session out to every controller
  watching the device. Publish never blocks: each controller has its own
  bounded drop-oldest media lane, so a slow controller only loses its own
  frames. Nothing is persisted or retried.
*/
class MediaRouter {
 public:
  explicit MediaRouter(std::shared_ptr<registry::ConnectionRegistry> registry);

  // Returns the number of controllers the frame was queued for.
  std::size_t Publish(const registry::Session& session, const relay::v1::MediaFrame& frame);
  std::size_t Publish(const registry::Session& session, const relay::v1::AudioChunk& chunk);

  // Location stays ordered with control messages, but a controller holds
  // only its newest unsent fix; an older one is replaced and counted as
  // dropped.
  std::size_t PublishLocation(const registry::Session& session, const relay::v1::LocationUpdate& location);

  MediaStats Stats() const;

 private:
  using SendFn = transport::MediaOutcome (registry::Session::*)(relay::v1::ServerMessage);

  std::size_t FanOut(const registry::Session& session, std::string_view kind, const relay::v1::ServerMessage& message, SendFn send);

  std::shared_ptr<registry::ConnectionRegistry> registry_;

  std::atomic<uint64_t> published_{0};
  std::atomic<uint64_t> relayed_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> rejected_{0};
};

} // namespace relay::media
