#include "gateway_server.hpp"

#include <chrono>
#include <memory>

#include "bearer.hpp"
#include "grpc_error.hpp"
#include "internal/auth/auth_gate.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/transport/outbox.hpp"
#include "internal/transport/outbox_writer.hpp"

namespace relay::grpc {

using namespace relay::v1;

namespace {

// How long a closing connection waits for its writer before cancelling
// the stream under a peer that stopped reading.
constexpr auto kCloseGrace = std::chrono::seconds(2);

} // namespace

GatewayServer::GatewayServer(relay::service::ServiceContext ctx, relay::service::SessionLimits limits, std::size_t media_buffer_frames)
    : ctx_(std::move(ctx)), limits_(limits), media_buffer_frames_(media_buffer_frames) {
}

::grpc::Status GatewayServer::Connect(::grpc::ServerContext* context, ::grpc::ServerReaderWriter<ServerMessage, ClientMessage>* stream) {
  relay::auth::Identity identity;
  try {
    identity = ctx_.auth->VerifyAccessToken(BearerToken(*context));
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("connection refused", {observability::StringField("peer", context->peer()), observability::StringField("error", e.what())});
    return ToStatus(e);
  }

  observability::SpanScope span("RelayGateway.Connect", identity.device_id);
  span.SetAttribute("relay.role", Role_Name(identity.role));
  RELAY_LOG_INFO("connection opened", {observability::StringField("subject", identity.subject), observability::StringField("role", Role_Name(identity.role)),
                                       observability::StringField("peer", context->peer())});

  auto outbox = std::make_shared<relay::transport::Outbox>(media_buffer_frames_);
  relay::service::SessionHandler handler(ctx_, identity, outbox, limits_);

  relay::transport::OutboxWriter writer(outbox, {[stream](const ServerMessage& message) { return stream->Write(message); },
                                                 [context] { return context->IsCancelled(); }, [context] { context->TryCancel(); }});

  ClientMessage inbound;
  while (stream->Read(&inbound)) {
    if (!handler.Handle(std::move(inbound))) break;
    inbound.Clear();
  }

  handler.Disconnect();
  if (!writer.Stop(kCloseGrace)) {
    RELAY_LOG_WARN("peer stopped reading, stream cancelled", {observability::StringField("subject", identity.subject),
                                                              observability::StringField("peer", context->peer())});
  }

  RELAY_LOG_INFO("connection closed", {observability::StringField("subject", identity.subject), observability::StringField("role", Role_Name(identity.role))});
  return ::grpc::Status::OK;
}

} // namespace relay::grpc
