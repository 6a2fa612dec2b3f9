#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/media/media_router.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/command_expiry_sweeper.hpp"
#include "internal/queue/command_queue.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/runtime/server.hpp"

namespace {

using relay::observability::IntField;
using relay::observability::StringField;

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

// relay-server <config.yaml> | --config <config.yaml>; RELAY_CONFIG when no argument is given.
std::optional<std::string> ConfigPath(int argc, char** argv) {
  if (argc == 2) return std::string(argv[1]);
  if (argc == 3 && std::string(argv[1]) == "--config") return std::string(argv[2]);
  if (argc == 1) {
    if (const char* path = std::getenv("RELAY_CONFIG")) return std::string(path);
  }
  return std::nullopt;
}

void ShutdownObservability() {
  relay::observability::ShutdownLogging();
  relay::observability::ShutdownMetrics();
  relay::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPath(argc, argv);
  if (!config_path) {
    std::cerr << "Usage: relay-server <config.yaml> | relay-server --config <config.yaml>\n"
              << "       (or set RELAY_CONFIG)" << std::endl;
    return 1;
  }

  try {
    auto config = relay::config::ConfigLoader::LoadFromYaml(*config_path);

    relay::observability::InitializeTracing(config);
    relay::observability::InitializeMetrics(config);
    relay::observability::InitializeLogging(config);

    // Hydrates queued commands and marks every device offline.
    auto app = relay::factory::Build(config);

    relay::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services), app.context.registry);

    // Handlers go in before Start() so an early SIGTERM still shuts down cleanly.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RELAY_LOG_INFO("relay ready", {StringField("config", *config_path),
                                   IntField("pending_commands", static_cast<std::int64_t>(app.context.queue->PendingCount()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELAY_LOG_INFO("relay stopping", {IntField("device_sessions", static_cast<std::int64_t>(app.context.registry->Stats().device_sessions))});

    for (const auto& worker : app.background_workers) {
      worker->Stop();
    }
    // Closes every live session with SHUTDOWN before the listener drains.
    server.Stop();

    const auto media = app.context.media->Stats();
    RELAY_LOG_INFO("relay stopped", {IntField("media_published", static_cast<std::int64_t>(media.published)),
                                     IntField("media_relayed", static_cast<std::int64_t>(media.relayed)),
                                     IntField("media_dropped", static_cast<std::int64_t>(media.dropped))});
    ShutdownObservability();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("relay failed", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
