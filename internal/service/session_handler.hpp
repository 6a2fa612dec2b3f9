#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "internal/auth/auth_gate.hpp"
#include "internal/service/service_context.hpp"
#include "internal/transport/transport.hpp"
#include "internal/util/time.hpp"
#include "relay/v1/envelope.pb.h"

namespace relay::registry {
class Session;
}

namespace relay::service {

struct SessionLimits {
  uint32_t max_malformed_per_minute = 20;
};

/*
  SessionHandler

  Per-connection state machine, driven by the reader thread:

    authenticated --register--> admitted --Disconnect()--> removed

  Everything before a register, any message the role may not send and
  anything missing a required field is malformed: dropped and counted.
  Exceeding the per-minute limit closes the session with PROTOCOL_ABUSE.
*/
class SessionHandler {
 public:
  SessionHandler(ServiceContext ctx, auth::Identity identity, std::shared_ptr<transport::Transport> transport, SessionLimits limits = {},
                 util::ClockFn clock = util::Now);
  ~SessionHandler();

  SessionHandler(const SessionHandler&)            = delete;
  SessionHandler& operator=(const SessionHandler&) = delete;

  // Returns false once the connection should stop reading.
  bool Handle(relay::v1::ClientMessage message);

  // Leaves the registry and closes the transport. Idempotent.
  void Disconnect(relay::v1::CloseReason reason = relay::v1::CLOSE_REASON_NORMAL);

  const std::shared_ptr<registry::Session>& Session() const {
    return session_;
  }
  const auth::Identity& Identity() const {
    return identity_;
  }

 private:
  void On(const relay::v1::RegisterRequest& message);
  void On(const relay::v1::StatusUpdate& message);
  void On(const relay::v1::SubmitCommand& message);
  void On(const relay::v1::CommandAck& message);
  void On(const relay::v1::MediaFrame& message);
  void On(const relay::v1::AudioChunk& message);
  void On(const relay::v1::LocationUpdate& message);
  void On(const relay::v1::Ping& message);

  void RegisterDevice(const relay::v1::RegisterRequest& message);
  void RegisterController(const relay::v1::RegisterRequest& message);

  void RequireRole(relay::v1::Role role, const char* kind) const;

  // Returns false when the malformed budget is exhausted.
  bool CountMalformed(const std::string& reason);

  // Closes a connection that never got a session.
  void Refuse(relay::v1::CloseReason reason, const std::string& detail);

  bool Closed() const;

  ServiceContext                        ctx_;
  auth::Identity                        identity_;
  std::shared_ptr<transport::Transport> transport_;
  SessionLimits                         limits_;
  util::ClockFn                         clock_;

  std::shared_ptr<registry::Session> session_;
  std::deque<util::TimePoint>        malformed_;
  bool                               disconnected_ = false;
};

} // namespace relay::service
