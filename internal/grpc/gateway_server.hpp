#pragma once

#include <cstddef>

#include <grpcpp/grpcpp.h>

#include "internal/service/service_context.hpp"
#include "internal/service/session_handler.hpp"
#include "relay/v1/relay_gateway.grpc.pb.h"

namespace relay::grpc {

/*
  RelayGateway.Connect

  One synchronous bidi stream per connection. The handler thread reads and
  dispatches inbound messages; an OutboxWriter drains the session outbox
  onto the stream. The access token is checked before anything is read.
*/
class GatewayServer final : public relay::v1::RelayGateway::Service {
 public:
  GatewayServer(relay::service::ServiceContext ctx, relay::service::SessionLimits limits, std::size_t media_buffer_frames);

  ::grpc::Status Connect(::grpc::ServerContext* context,
                         ::grpc::ServerReaderWriter<relay::v1::ServerMessage, relay::v1::ClientMessage>* stream) override;

 private:
  relay::service::ServiceContext ctx_;
  relay::service::SessionLimits  limits_;
  std::size_t                    media_buffer_frames_;
};

} // namespace relay::grpc
