#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/auth/auth_gate.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/media/media_router.hpp"
#include "internal/presence/presence_tracker.hpp"
#include "internal/queue/command_queue.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/device_service.hpp"
#include "internal/service/pairing_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/session_handler.hpp"
#include "recording_transport.hpp"

namespace {

using relay::service::ServiceContext;
using relay::service::SessionHandler;
using relay::service::SessionLimits;
using relay::testing::RecordingTransport;
using relay::v1::ClientMessage;
using relay::v1::ServerMessage;

ServiceContext BuildServiceContext(relay::auth::AuthGate::CodeGenerator generator = {}) {
  ServiceContext ctx;
  ctx.repository = std::make_shared<relay::db::memory::MemoryRepository>();

  relay::auth::AuthOptions options;
  options.secret_key        = "session-handler-test-key";
  options.pbkdf2_iterations = 1000;
  ctx.auth     = std::make_shared<relay::auth::AuthGate>(ctx.repository, options, relay::util::Now, std::move(generator));
  ctx.registry = std::make_shared<relay::registry::ConnectionRegistry>();
  ctx.queue    = std::make_shared<relay::queue::CommandQueue>(ctx.repository, ctx.registry);
  ctx.presence = std::make_shared<relay::presence::PresenceTracker>(ctx.repository, ctx.registry, ctx.queue);
  ctx.media    = std::make_shared<relay::media::MediaRouter>(ctx.registry);
  ctx.registry->AddObserver(ctx.presence);
  return ctx;
}

struct PairedDevice {
  std::string           device_id;
  relay::auth::Identity device;
  relay::auth::Identity controller;
};

PairedDevice Pair(ServiceContext& ctx, const std::string& claim_id) {
  relay::service::PairingService pairing(ctx);

  relay::v1::CreatePairingCodeRequest create;
  create.mutable_claim()->set_claim_id(claim_id);
  create.mutable_claim()->set_name("living room phone");
  const auto code = pairing.CreatePairingCode(create).code();

  relay::v1::RedeemPairingCodeRequest redeem;
  redeem.set_code(code);
  const auto redeemed = pairing.RedeemPairingCode(redeem);

  relay::v1::RegisterControllerRequest controller;
  controller.set_device_id(redeemed.device_id());
  controller.set_name("tablet");
  const auto registered = pairing.RegisterController(controller);

  PairedDevice out;
  out.device_id  = redeemed.device_id();
  out.device     = ctx.auth->VerifyAccessToken(redeemed.tokens().access_token());
  out.controller = ctx.auth->VerifyAccessToken(registered.tokens().access_token());
  return out;
}

// Never reports itself closed, like a connection whose handler is still
// dispatching a message when the registry replaces its session.
class StayOpenTransport final : public relay::transport::Transport {
 public:
  bool Send(ServerMessage) override {
    return true;
  }
  relay::transport::MediaOutcome SendMedia(ServerMessage) override {
    return relay::transport::MediaOutcome::kQueued;
  }
  relay::transport::MediaOutcome SendLatest(ServerMessage) override {
    return relay::transport::MediaOutcome::kQueued;
  }
  void Close(ServerMessage) override {
  }
  bool IsClosed() const override {
    return false;
  }
};

ClientMessage Register(const std::string& device_id = {}) {
  ClientMessage message;
  message.mutable_register_()->set_device_id(device_id);
  return message;
}

ClientMessage Ack(const std::string& command_id, relay::v1::CommandStatus status) {
  ClientMessage message;
  message.mutable_command_ack()->set_command_id(command_id);
  message.mutable_command_ack()->set_status(status);
  return message;
}

void TestPairQueueReconnectComplete() {
  auto ctx    = BuildServiceContext([] { return std::string("AB12CD"); });
  auto paired = Pair(ctx, "install-ab12cd");

  relay::service::PairingService pairing(ctx);
  relay::v1::LookupPairingRequest lookup;
  lookup.set_code("AB12CD");
  assert(pairing.LookupPairing(lookup).device_id() == paired.device_id);

  // Device registers, then drops.
  auto first_transport = std::make_shared<RecordingTransport>();
  {
    SessionHandler device(ctx, paired.device, first_transport);
    assert(device.Handle(Register(paired.device_id)));
    const auto registered = first_transport->Of(ServerMessage::kRegistered);
    assert(registered.size() == 1);
    assert(registered[0].registered().role() == relay::v1::ROLE_DEVICE);
    assert(registered[0].registered().device_id() == paired.device_id);
    assert(ctx.presence->Snapshot(paired.device_id).presence() == relay::v1::PRESENCE_ONLINE);
  }
  assert(first_transport->CloseReason() == relay::v1::CLOSE_REASON_NORMAL);
  assert(ctx.presence->Snapshot(paired.device_id).presence() == relay::v1::PRESENCE_OFFLINE);

  // Controller connects and queues a command for the offline device.
  auto           controller_transport = std::make_shared<RecordingTransport>();
  SessionHandler controller(ctx, paired.controller, controller_transport);
  ClientMessage  watch;
  watch.mutable_register_()->set_target_device_id(paired.device_id);
  assert(controller.Handle(watch));
  const auto controller_registered = controller_transport->Of(ServerMessage::kRegistered);
  assert(controller_registered.size() == 1);
  assert(controller_registered[0].registered().device_presence() == relay::v1::PRESENCE_OFFLINE);

  ClientMessage submit;
  submit.mutable_command()->set_action("start_camera");
  assert(controller.Handle(submit));
  const auto accepted = controller_transport->Of(ServerMessage::kCommandAccepted);
  assert(accepted.size() == 1);
  assert(accepted[0].command_accepted().status() == relay::v1::COMMAND_STATUS_PENDING);
  assert(accepted[0].command_accepted().queue_position() == 1);
  const auto command_id = accepted[0].command_accepted().command_id();

  // Reconnect: the queued command is delivered right after registration.
  auto           device_transport = std::make_shared<RecordingTransport>();
  SessionHandler device(ctx, paired.device, device_transport);
  assert(device.Handle(Register()));

  const auto messages = device_transport->Messages();
  assert(messages.size() == 2);
  assert(messages[0].has_registered());
  assert(messages[0].registered().pending_commands() == 1);
  assert(messages[1].has_command());
  assert(messages[1].command().command_id() == command_id);
  assert(messages[1].command().action() == "start_camera");
  assert(ctx.queue->Get(command_id).status() == relay::v1::COMMAND_STATUS_DELIVERED);

  assert(device.Handle(Ack(command_id, relay::v1::COMMAND_STATUS_EXECUTING)));
  assert(device.Handle(Ack(command_id, relay::v1::COMMAND_STATUS_COMPLETED)));
  assert(ctx.queue->Get(command_id).status() == relay::v1::COMMAND_STATUS_COMPLETED);

  const auto acks = controller_transport->Of(ServerMessage::kCommandAck);
  assert(acks.size() == 2);
  assert(acks[0].command_ack().status() == relay::v1::COMMAND_STATUS_EXECUTING);
  assert(acks[1].command_ack().status() == relay::v1::COMMAND_STATUS_COMPLETED);

  // The controller joined after the first drop and only sees the reconnect.
  const auto statuses = controller_transport->Of(ServerMessage::kDeviceStatus);
  assert(statuses.size() == 1);
  assert(statuses[0].device_status().presence() == relay::v1::PRESENCE_ONLINE);
}

void TestMessagesBeforeRegisterAreMalformed() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-abuse");

  SessionLimits limits;
  limits.max_malformed_per_minute = 3;

  auto           transport = std::make_shared<RecordingTransport>();
  SessionHandler handler(ctx, paired.device, transport, limits);

  ClientMessage ping;
  ping.mutable_ping()->set_nonce(1);
  assert(handler.Handle(ping));
  assert(handler.Handle(ping));
  assert(handler.Handle(ClientMessage{}));
  assert(!transport->IsClosed());
  assert(transport->Messages().empty());

  assert(!handler.Handle(ping));
  assert(transport->CloseReason() == relay::v1::CLOSE_REASON_PROTOCOL_ABUSE);
  assert(!handler.Handle(Register()));
}

void TestRoleViolationsAreDroppedNotFatal() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-roles");

  auto           transport = std::make_shared<RecordingTransport>();
  SessionHandler controller(ctx, paired.controller, transport);
  assert(controller.Handle(Register()));

  ClientMessage frame;
  frame.mutable_frame()->set_payload("jpeg");
  assert(controller.Handle(frame));
  assert(controller.Handle(Ack("c1", relay::v1::COMMAND_STATUS_COMPLETED)));
  assert(!transport->IsClosed());

  ClientMessage ping;
  ping.mutable_ping()->set_nonce(99);
  assert(controller.Handle(ping));
  const auto pongs = transport->Of(ServerMessage::kPong);
  assert(pongs.size() == 1);
  assert(pongs[0].pong().nonce() == 99);
}

void TestUnknownAckKeepsSessionOpen() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-unknown-ack");

  auto           transport = std::make_shared<RecordingTransport>();
  SessionHandler device(ctx, paired.device, transport);
  assert(device.Handle(Register()));
  assert(device.Handle(Ack("no-such-command", relay::v1::COMMAND_STATUS_EXECUTING)));
  assert(!transport->IsClosed());
}

void TestSupersededSessionCannotAcknowledge() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-superseded-ack");

  SessionHandler old_device(ctx, paired.device, std::make_shared<StayOpenTransport>());
  assert(old_device.Handle(Register()));

  const auto command = ctx.queue->Enqueue(paired.device_id, "start_camera", google::protobuf::Struct{});
  assert(ctx.queue->Get(command.id()).status() == relay::v1::COMMAND_STATUS_DELIVERED);

  auto           new_transport = std::make_shared<RecordingTransport>();
  SessionHandler new_device(ctx, paired.device, new_transport);
  assert(new_device.Handle(Register()));
  assert(ctx.registry->LookupDeviceSession(paired.device_id) == new_device.Session());

  assert(old_device.Handle(Ack(command.id(), relay::v1::COMMAND_STATUS_COMPLETED)));
  assert(ctx.queue->Get(command.id()).status() == relay::v1::COMMAND_STATUS_DELIVERED);

  assert(new_device.Handle(Ack(command.id(), relay::v1::COMMAND_STATUS_EXECUTING)));
  assert(ctx.queue->Get(command.id()).status() == relay::v1::COMMAND_STATUS_EXECUTING);
}

void TestMismatchedRegisterIsRejected() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-mismatch");

  auto           transport = std::make_shared<RecordingTransport>();
  SessionHandler device(ctx, paired.device, transport);
  assert(device.Handle(Register("someone-else")));
  assert(device.Session() == nullptr);
  assert(ctx.registry->LookupDeviceSession(paired.device_id) == nullptr);

  assert(device.Handle(Register(paired.device_id)));
  assert(device.Session() != nullptr);
  // A second register is malformed and changes nothing.
  assert(device.Handle(Register(paired.device_id)));
  assert(transport->Count(ServerMessage::kRegistered) == 1);
}

void TestUnpairedDeviceIsRefused() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-unpaired");

  relay::service::DeviceService devices(ctx);
  relay::v1::UnpairDeviceRequest unpair;
  unpair.set_device_id(paired.device_id);
  devices.UnpairDevice(paired.controller, unpair);

  auto           transport = std::make_shared<RecordingTransport>();
  SessionHandler device(ctx, paired.device, transport);
  assert(!device.Handle(Register()));
  assert(transport->CloseReason() == relay::v1::CLOSE_REASON_UNPAIRED);
}

void TestUnpairClosesLiveSessions() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-live-unpair");

  auto           device_transport = std::make_shared<RecordingTransport>();
  SessionHandler device(ctx, paired.device, device_transport);
  assert(device.Handle(Register()));

  auto           controller_transport = std::make_shared<RecordingTransport>();
  SessionHandler controller(ctx, paired.controller, controller_transport);
  assert(controller.Handle(Register()));

  relay::service::DeviceService devices(ctx);
  relay::v1::UnpairDeviceRequest unpair;
  devices.UnpairDevice(paired.controller, unpair);

  assert(device_transport->CloseReason() == relay::v1::CLOSE_REASON_UNPAIRED);
  assert(controller_transport->CloseReason() == relay::v1::CLOSE_REASON_UNPAIRED);

  ClientMessage ping;
  ping.mutable_ping()->set_nonce(1);
  assert(!device.Handle(ping));
}

void TestStatusAndMediaReachController() {
  auto ctx    = BuildServiceContext();
  auto paired = Pair(ctx, "install-media");

  auto           controller_transport = std::make_shared<RecordingTransport>();
  SessionHandler controller(ctx, paired.controller, controller_transport);
  assert(controller.Handle(Register()));

  auto           device_transport = std::make_shared<RecordingTransport>();
  SessionHandler device(ctx, paired.device, device_transport);
  assert(device.Handle(Register()));

  ClientMessage status;
  status.mutable_status()->mutable_report()->set_battery(17);
  assert(device.Handle(status));

  ClientMessage frame;
  frame.mutable_frame()->set_sequence(1);
  frame.mutable_frame()->set_payload("jpeg");
  assert(device.Handle(frame));

  ClientMessage location;
  location.mutable_location()->set_latitude(48.1);
  assert(device.Handle(location));

  const auto statuses = controller_transport->Of(ServerMessage::kDeviceStatus);
  assert(statuses.size() == 2);
  assert(statuses[1].device_status().report().battery() == 17);
  assert(controller_transport->Count(ServerMessage::kFrame) == 1);
  assert(controller_transport->Count(ServerMessage::kLocation) == 1);

  device.Disconnect();
  assert(ctx.presence->Snapshot(paired.device_id).presence() == relay::v1::PRESENCE_OFFLINE);
  assert(controller_transport->Of(ServerMessage::kDeviceStatus).size() == 3);
}

} // namespace

int main() {
  TestPairQueueReconnectComplete();
  TestMessagesBeforeRegisterAreMalformed();
  TestRoleViolationsAreDroppedNotFatal();
  TestUnknownAckKeepsSessionOpen();
  TestSupersededSessionCannotAcknowledge();
  TestMismatchedRegisterIsRejected();
  TestUnpairedDeviceIsRefused();
  TestUnpairClosesLiveSessions();
  TestStatusAndMediaReachController();

  std::cout << "relay_unit_session_handler: pass\n";
  return 0;
}
