#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#if MARKET_GRPC
#include "internal/runtime/server.hpp"
#endif

using market::factory::Build;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: market-indexer <config.yaml> OR market-indexer --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = market::config::ConfigLoader::LoadFromYaml(config_path);
    market::config::ConfigLoader::Validate(config);

    market::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Queries must never see an empty model after startup.
    if (!app.cache_rebuild->RebuildNow()) {
      MARKET_LOG_WARN("Initial snapshot failed, serving an empty model until the next rebuild");
    }

    // Register signal handlers before starting anything to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    for (auto& task : app.tasks) {
      task->Start();
    }

#if MARKET_GRPC
    std::unique_ptr<market::runtime::Server> server;
    if (!config.server().bind_address().empty()) {
      server = std::make_unique<market::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
      server->Start();
    }
#endif

    MARKET_LOG_INFO("Market indexer started");

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MARKET_LOG_INFO("Shutting down market indexer");

#if MARKET_GRPC
    if (server) server->Stop();
#endif
    for (auto it = app.tasks.rbegin(); it != app.tasks.rend(); ++it) {
      (*it)->Stop();
    }
    market::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    MARKET_LOG_CRITICAL("Fatal error", {market::observability::StringField("error", e.what())});
    market::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
