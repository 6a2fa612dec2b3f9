#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/registry/connection_registry.hpp"

namespace relay::runtime {

namespace {

constexpr auto kShutdownGrace = std::chrono::seconds(5);

} // namespace

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
               std::shared_ptr<relay::registry::ConnectionRegistry> registry)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), registry_(std::move(registry)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  // TLS is terminated in front of the relay.
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  RELAY_LOG_INFO("relay listening", {relay::observability::StringField("bind_address", bind_address_)});
}

void Server::Stop() {
  if (!grpc_server_) return;

  if (registry_) {
    registry_->CloseAll(relay::v1::CLOSE_REASON_SHUTDOWN);
  }
  grpc_server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
  grpc_server_.reset();
}

} // namespace relay::runtime
