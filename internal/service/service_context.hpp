#pragma once

#include <memory>

namespace relay::db {
class Repository;
}
namespace relay::auth {
class AuthGate;
}
namespace relay::registry {
class ConnectionRegistry;
}
namespace relay::presence {
class PresenceTracker;
}
namespace relay::queue {
class CommandQueue;
}
namespace relay::media {
class MediaRouter;
}

namespace relay::service {

/*
  Dependency container shared by all services and session handlers.
*/
struct ServiceContext {
  std::shared_ptr<relay::db::Repository>               repository;
  std::shared_ptr<relay::auth::AuthGate>               auth;
  std::shared_ptr<relay::registry::ConnectionRegistry> registry;
  std::shared_ptr<relay::presence::PresenceTracker>    presence;
  std::shared_ptr<relay::queue::CommandQueue>          queue;
  std::shared_ptr<relay::media::MediaRouter>           media;
};

} // namespace relay::service
