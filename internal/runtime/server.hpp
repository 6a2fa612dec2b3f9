#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace relay::registry {
class ConnectionRegistry;
}

namespace relay::runtime {

/*
  gRPC listener lifecycle. Stop() closes every live session with SHUTDOWN
  so streaming handlers return before the server drains.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::shared_ptr<relay::registry::ConnectionRegistry> registry);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::shared_ptr<relay::registry::ConnectionRegistry> registry_;
  std::unique_ptr<::grpc::Server> grpc_server_;
};

} // namespace relay::runtime
