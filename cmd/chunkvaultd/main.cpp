#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using chunkvault::factory::Build;
using chunkvault::runtime::Server;

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
    std::cerr << "Usage: chunkvaultd <config.yaml> OR chunkvaultd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chunkvault::config::ConfigLoader::LoadFromYaml(config_path);

    chunkvault::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CHUNKVAULT_LOG_INFO("chunkvaultd started", {chunkvault::observability::StringField("bind_address", config.server().bind_address()),
                                                chunkvault::observability::UintField("endpoints", config.endpoints().urls_size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CHUNKVAULT_LOG_INFO("Shutting down chunkvaultd");

    server.Stop();
    chunkvault::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CHUNKVAULT_LOG_ERROR("Fatal error", {chunkvault::observability::StringField("error", e.what())});
    chunkvault::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
