#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/auth/auth_gate.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/device_server.hpp"
#include "internal/grpc/gateway_server.hpp"
#include "internal/grpc/pairing_server.hpp"
#include "internal/media/media_router.hpp"
#include "internal/observability/logging.hpp"
#include "internal/presence/presence_tracker.hpp"
#include "internal/queue/command_expiry_sweeper.hpp"
#include "internal/queue/command_queue.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/device_service.hpp"
#include "internal/service/pairing_service.hpp"
#include "internal/util/time.hpp"
#if RELAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if RELAY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace relay::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const relay::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELAY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    RELAY_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELAY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(pool);
    RELAY_LOG_INFO("repository ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RELAY_LOG_WARN("no database configured, state is kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

auth::AuthOptions ToAuthOptions(const relay::runtime::config::AuthConfig& config) {
  using std::chrono::duration_cast;
  using std::chrono::seconds;

  auth::AuthOptions options;
  options.secret_key        = config.secret_key();
  options.access_ttl        = duration_cast<seconds>(util::FromProto(config.access_token_ttl(), options.access_ttl));
  options.refresh_ttl       = duration_cast<seconds>(util::FromProto(config.refresh_token_ttl(), options.refresh_ttl));
  options.pairing_ttl       = duration_cast<seconds>(util::FromProto(config.pairing_code_ttl(), options.pairing_ttl));
  if (config.pbkdf2_iterations() > 0) {
    options.pbkdf2_iterations = config.pbkdf2_iterations();
  }
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const relay::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto auth     = std::make_shared<auth::AuthGate>(repository, ToAuthOptions(config.auth()));
  auto registry = std::make_shared<registry::ConnectionRegistry>();
  auto queue    = std::make_shared<queue::CommandQueue>(repository, registry);
  auto presence = std::make_shared<presence::PresenceTracker>(repository, registry, queue);
  auto media    = std::make_shared<media::MediaRouter>(registry);
  registry->AddObserver(presence);

  const auto reset = presence->ResetAllOffline();
  queue->Hydrate();
  RELAY_LOG_INFO("stale presence cleared", {observability::IntField("devices", static_cast<std::int64_t>(reset))});

  // ------------------------------------------------------------------
  // Command expiry
  // ------------------------------------------------------------------
  const auto command_ttl    = util::FromProto(config.queue().command_ttl(), std::chrono::hours(24));
  const auto sweep_interval = util::FromProto(config.queue().sweep_interval(), std::chrono::seconds(30));
  auto       sweeper        = std::make_shared<queue::CommandExpirySweeper>(queue, command_ttl, sweep_interval);
  sweeper->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.auth       = auth;
  ctx.registry   = registry;
  ctx.presence   = presence;
  ctx.queue      = queue;
  ctx.media      = media;

  auto pairing_service = std::make_shared<service::PairingService>(ctx);
  auto device_service  = std::make_shared<service::DeviceService>(ctx);

  service::SessionLimits limits;
  limits.max_malformed_per_minute = config.server().max_malformed_per_minute();

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::PairingServer>(pairing_service));
  app.grpc_services.push_back(std::make_unique<grpc::DeviceServer>(device_service, auth));
  app.grpc_services.push_back(std::make_unique<grpc::GatewayServer>(ctx, limits, config.media().buffer_frames()));

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(sweeper);
  app.context = std::move(ctx);

  return app;
}

} // namespace relay::factory
