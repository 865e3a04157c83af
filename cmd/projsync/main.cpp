#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using projsync::runtime::Server;

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
    std::cerr << "Usage: projsync <config.yaml> OR projsync --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = projsync::config::ConfigLoader::LoadFromYaml(config_path);

    projsync::observability::InitializeTracing(config);
    projsync::observability::InitializeMetrics(config);
    projsync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = projsync::factory::Build(config);
    app.Start();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50051") : config.server().bind_address();
    Server     server(bind_address, projsync::runtime::BuildGrpcServices(app));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PROJSYNC_LOG_INFO("projsync started", {projsync::observability::StringField("bind_address", bind_address),
                                           projsync::observability::StringField("mode", projsync::model::ToString(app.synchronizer->Mode()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PROJSYNC_LOG_INFO("Shutting down projsync");

    server.Stop();
    app.Stop();
    projsync::observability::ShutdownLogging();
    projsync::observability::ShutdownMetrics();
    projsync::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PROJSYNC_LOG_ERROR("Fatal error", {projsync::observability::StringField("error", e.what())});
    projsync::observability::ShutdownLogging();
    projsync::observability::ShutdownMetrics();
    projsync::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
