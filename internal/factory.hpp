#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/service_context.hpp"

namespace relay::queue {
class CommandExpirySweeper;
}

namespace relay::factory {

/*
  Application

  Everything the server needs for the lifetime of the process. The
  registry is kept so shutdown can close every live session.
*/
struct Application {
  relay::service::ServiceContext                                   context;
  std::vector<std::unique_ptr<::grpc::Service>>                    grpc_services;
  std::vector<std::shared_ptr<relay::queue::CommandExpirySweeper>> background_workers;
};

/*
  Build

  Composition root: the ONLY place that knows concrete repository types.
  Hydrates command queues, resets stale presence and starts the expiry
  sweeper.
*/
Application Build(const relay::runtime::config::RuntimeConfig& config);

} // namespace relay::factory
