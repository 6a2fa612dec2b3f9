#include "session_handler.hpp"

#include <stdexcept>
#include <variant>

#include "internal/db/api/repository.hpp"
#include "internal/media/media_router.hpp"
#include "internal/observability/logging.hpp"
#include "internal/presence/presence_tracker.hpp"
#include "internal/protocol/inbound.hpp"
#include "internal/queue/command_queue.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace relay::service {

namespace {

constexpr auto kMalformedWindow = std::chrono::minutes(1);

} // namespace

SessionHandler::SessionHandler(ServiceContext ctx, auth::Identity identity, std::shared_ptr<transport::Transport> transport, SessionLimits limits,
                               util::ClockFn clock)
    : ctx_(std::move(ctx)),
      identity_(std::move(identity)),
      transport_(std::move(transport)),
      limits_(limits),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)) {
  if (!transport_) {
    throw std::invalid_argument("session handler requires a transport");
  }
  if (identity_.role != relay::v1::ROLE_DEVICE && identity_.role != relay::v1::ROLE_CONTROLLER) {
    throw std::invalid_argument("session handler requires a device or controller identity");
  }
}

SessionHandler::~SessionHandler() {
  try {
    Disconnect();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("session teardown failed", {observability::StringField("subject", identity_.subject), observability::StringField("error", e.what())});
  }
}

bool SessionHandler::Closed() const {
  return transport_->IsClosed() || disconnected_;
}

bool SessionHandler::Handle(relay::v1::ClientMessage message) {
  if (Closed()) {
    return false;
  }

  try {
    auto inbound = protocol::Decode(std::move(message));
    if (!session_ && !std::holds_alternative<relay::v1::RegisterRequest>(inbound)) {
      throw util::MalformedMessage(std::string(protocol::KindName(inbound)) + " before register");
    }
    std::visit([this](const auto& payload) { On(payload); }, inbound);
  } catch (const util::MalformedMessage& e) {
    return CountMalformed(e.what());
  } catch (const util::InvalidArgument& e) {
    return CountMalformed(e.what());
  } catch (const util::UnknownCommand& e) {
    RELAY_LOG_WARN("acknowledgment rejected", {observability::StringField("subject", identity_.subject), observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("message handling failed", {observability::StringField("subject", identity_.subject), observability::StringField("error", e.what())});
  }
  return !Closed();
}

bool SessionHandler::CountMalformed(const std::string& reason) {
  const auto now = clock_();
  while (!malformed_.empty() && now - malformed_.front() >= kMalformedWindow) {
    malformed_.pop_front();
  }
  malformed_.push_back(now);

  RELAY_LOG_DEBUG("malformed message dropped", {observability::StringField("subject", identity_.subject), observability::StringField("reason", reason),
                                                observability::IntField("count", static_cast<std::int64_t>(malformed_.size()))});

  if (malformed_.size() <= limits_.max_malformed_per_minute) {
    return true;
  }

  RELAY_LOG_WARN("protocol abuse, closing session", {observability::StringField("subject", identity_.subject),
                                                     observability::DeviceField(identity_.device_id)});
  if (session_) {
    session_->Close(relay::v1::CLOSE_REASON_PROTOCOL_ABUSE, "too many malformed messages");
  } else {
    Refuse(relay::v1::CLOSE_REASON_PROTOCOL_ABUSE, "too many malformed messages");
  }
  return false;
}

void SessionHandler::Refuse(relay::v1::CloseReason reason, const std::string& detail) {
  relay::v1::ServerMessage notice;
  notice.set_seq(1);
  notice.set_device_id(identity_.device_id);
  notice.mutable_closed()->set_reason(reason);
  notice.mutable_closed()->set_detail(detail);
  transport_->Close(std::move(notice));
}

void SessionHandler::Disconnect(relay::v1::CloseReason reason) {
  if (disconnected_) {
    return;
  }
  disconnected_ = true;

  if (session_) {
    ctx_.registry->Remove(session_);
    session_->Close(reason);
  } else if (!transport_->IsClosed()) {
    Refuse(reason, {});
  }
}

void SessionHandler::RequireRole(relay::v1::Role role, const char* kind) const {
  if (identity_.role != role) {
    throw util::MalformedMessage(std::string(kind) + " is not valid for " + relay::v1::Role_Name(identity_.role));
  }
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void SessionHandler::On(const relay::v1::RegisterRequest& message) {
  if (session_) {
    throw util::MalformedMessage("duplicate register");
  }
  if (identity_.role == relay::v1::ROLE_DEVICE) {
    RegisterDevice(message);
  } else {
    RegisterController(message);
  }
}

void SessionHandler::RegisterDevice(const relay::v1::RegisterRequest& message) {
  if (!message.device_id().empty() && message.device_id() != identity_.device_id) {
    throw util::MalformedMessage("register device_id does not match credentials");
  }
  if (!message.target_device_id().empty()) {
    throw util::MalformedMessage("devices do not watch other devices");
  }

  {
    auto tx     = ctx_.repository->Begin();
    auto device = ctx_.repository->GetDevice(*tx, identity_.device_id);
    if (!device || !device->paired) {
      tx->Rollback();
      Refuse(relay::v1::CLOSE_REASON_UNPAIRED, "device is not paired");
      return;
    }
    if (message.has_device_info()) {
      device->info_json = util::ToJson(message.device_info());
      if (auto result = ctx_.repository->UpdateDevice(*tx, *device); !result) {
        throw std::runtime_error("store device info: " + result.message);
      }
    }
    tx->Commit();
  }

  const auto pending = ctx_.queue->PendingCount(identity_.device_id);
  session_           = ctx_.registry->AdmitDevice(identity_.device_id, transport_, [&](registry::Session& session) {
    relay::v1::ServerMessage reply;
    auto*                    registered = reply.mutable_registered();
    registered->set_role(relay::v1::ROLE_DEVICE);
    registered->set_identity(identity_.subject);
    registered->set_device_id(identity_.device_id);
    registered->set_device_presence(relay::v1::PRESENCE_ONLINE);
    *registered->mutable_last_seen() = util::ToProto(clock_());
    registered->set_pending_commands(static_cast<uint32_t>(pending));
    session.Send(std::move(reply));
  });
}

void SessionHandler::RegisterController(const relay::v1::RegisterRequest& message) {
  if (!message.target_device_id().empty() && message.target_device_id() != identity_.device_id) {
    throw util::MalformedMessage("controller credentials are scoped to another device");
  }

  relay::v1::DeviceStatus status;
  try {
    status = ctx_.presence->Snapshot(identity_.device_id);
  } catch (const util::NotFound&) {
    Refuse(relay::v1::CLOSE_REASON_UNPAIRED, "device not found");
    return;
  }
  if (!status.paired()) {
    Refuse(relay::v1::CLOSE_REASON_UNPAIRED, "device is not paired");
    return;
  }

  const auto pending = ctx_.queue->PendingCount(identity_.device_id);
  session_           = ctx_.registry->AdmitController(identity_.subject, identity_.device_id, transport_, [&](registry::Session& session) {
    relay::v1::ServerMessage reply;
    auto*                    registered = reply.mutable_registered();
    registered->set_role(relay::v1::ROLE_CONTROLLER);
    registered->set_identity(identity_.subject);
    registered->set_device_id(identity_.device_id);
    registered->set_device_presence(status.presence());
    if (status.has_last_seen()) {
      *registered->mutable_last_seen() = status.last_seen();
    }
    registered->set_pending_commands(static_cast<uint32_t>(pending));
    session.Send(std::move(reply));
  });
}

// ---------------------------------------------------------------------------
// Steady state
// ---------------------------------------------------------------------------

void SessionHandler::On(const relay::v1::StatusUpdate& message) {
  RequireRole(relay::v1::ROLE_DEVICE, "status");
  if (!ctx_.registry->IsCurrentDeviceSession(*session_)) return;
  ctx_.presence->RecordStatus(identity_.device_id, message.report());
}

void SessionHandler::On(const relay::v1::SubmitCommand& message) {
  RequireRole(relay::v1::ROLE_CONTROLLER, "command");
  const auto command = ctx_.queue->Enqueue(identity_.device_id, message.action(), message.params());

  relay::v1::ServerMessage reply;
  auto*                    accepted = reply.mutable_command_accepted();
  accepted->set_command_id(command.id());
  accepted->set_status(command.status());
  accepted->set_queue_position(command.queue_position());
  session_->Send(std::move(reply));
}

void SessionHandler::On(const relay::v1::CommandAck& message) {
  RequireRole(relay::v1::ROLE_DEVICE, "command_ack");
  if (!ctx_.registry->IsCurrentDeviceSession(*session_)) {
    RELAY_LOG_DEBUG("ack from superseded session ignored", {observability::StringField("session", session_->Id()),
                                                            observability::StringField("command_id", message.command_id())});
    return;
  }
  const auto command = ctx_.queue->Acknowledge(identity_.device_id, message.command_id(), message.status(), message.error());

  relay::v1::ServerMessage event;
  auto*                    ack = event.mutable_command_ack();
  ack->set_device_id(identity_.device_id);
  ack->set_command_id(command.id());
  ack->set_status(command.status());
  ack->set_error(command.error());
  for (const auto& controller : ctx_.registry->LookupControllerSessions(identity_.device_id)) {
    controller->Send(event);
  }
}

void SessionHandler::On(const relay::v1::MediaFrame& message) {
  RequireRole(relay::v1::ROLE_DEVICE, "frame");
  ctx_.media->Publish(*session_, message);
}

void SessionHandler::On(const relay::v1::AudioChunk& message) {
  RequireRole(relay::v1::ROLE_DEVICE, "audio");
  ctx_.media->Publish(*session_, message);
}

void SessionHandler::On(const relay::v1::LocationUpdate& message) {
  RequireRole(relay::v1::ROLE_DEVICE, "location");
  ctx_.media->PublishLocation(*session_, message);
}

void SessionHandler::On(const relay::v1::Ping& message) {
  if (identity_.role == relay::v1::ROLE_DEVICE && ctx_.registry->IsCurrentDeviceSession(*session_)) {
    ctx_.presence->Touch(identity_.device_id);
  }

  relay::v1::ServerMessage reply;
  reply.mutable_pong()->set_nonce(message.nonce());
  *reply.mutable_pong()->mutable_server_time() = util::ToProto(clock_());
  session_->Send(std::move(reply));
}

} // namespace relay::service
