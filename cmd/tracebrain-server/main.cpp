#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/trace_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

using tracebrain::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  tracebrain::observability::ShutdownLogging();
  tracebrain::observability::ShutdownMetrics();
  tracebrain::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: tracebrain-server <config.yaml> OR tracebrain-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tracebrain::config::ConfigLoader::LoadFromYaml(config_path);

    tracebrain::observability::InitializeTracing(config);
    tracebrain::observability::InitializeMetrics(config);
    tracebrain::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = tracebrain::factory::Build(config);

    const auto default_deadline = tracebrain::util::ToMillis(config.server().default_deadline(), std::chrono::seconds(30));

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<tracebrain::grpc::TraceServer>(app.service, default_deadline));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TRACEBRAIN_LOG_INFO("TraceBrain started", {tracebrain::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TRACEBRAIN_LOG_INFO("Shutting down TraceBrain");

    server.Stop();
    app.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    TRACEBRAIN_LOG_ERROR("Fatal error", {tracebrain::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
