#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/transport/transport.hpp"
#include "internal/util/time.hpp"
#include "relay/v1/types.pb.h"

namespace relay::registry {

/*
  One live connection as seen by the registry.

  Every outbound message is stamped with the next per-session sequence
  number and the watched device id before it reaches the transport.
*/
class Session {
 public:
  Session(std::string id, relay::v1::Role role, std::string identity, std::string device_id, std::shared_ptr<transport::Transport> transport,
          util::TimePoint connected_at);

  const std::string& Id() const {
    return id_;
  }
  relay::v1::Role Role() const {
    return role_;
  }
  // Device id for devices, controller id for controllers.
  const std::string& Identity() const {
    return identity_;
  }
  const std::string& DeviceId() const {
    return device_id_;
  }
  util::TimePoint ConnectedAt() const {
    return connected_at_;
  }

  bool Send(relay::v1::ServerMessage message);
  transport::MediaOutcome SendMedia(relay::v1::ServerMessage message);
  transport::MediaOutcome SendLatest(relay::v1::ServerMessage message);

  void Close(relay::v1::CloseReason reason, const std::string& detail = {});
  bool IsClosed() const;

  uint64_t LastSequence() const;

 private:
  void Stamp(relay::v1::ServerMessage& message);

  const std::string     id_;
  const relay::v1::Role role_;
  const std::string     identity_;
  const std::string     device_id_;
  const util::TimePoint connected_at_;

  std::shared_ptr<transport::Transport> transport_;

  mutable std::mutex send_mutex_;
  uint64_t           last_seq_ = 0;
};

} // namespace relay::registry
