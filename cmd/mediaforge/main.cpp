#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/media_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using mediaforge::runtime::Server;

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
    std::cerr << "Usage: mediaforge <config.yaml> OR mediaforge --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = mediaforge::config::ConfigLoader::LoadFromYaml(config_path);
    mediaforge::observability::InitializeLogging(config);

    const auto settings = mediaforge::config::Settings::Resolve(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = mediaforge::factory::Build(settings);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<mediaforge::grpc::MediaServer>(app.service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(settings.bind_address, settings.max_message_bytes, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    MEDIAFORGE_LOG_INFO("mediaforge started", {mediaforge::observability::StringField("bind_address", settings.bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MEDIAFORGE_LOG_INFO("Shutting down mediaforge");

    server.Stop();
    app.Shutdown();
    mediaforge::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    MEDIAFORGE_LOG_ERROR("Fatal error", {mediaforge::observability::StringField("error", e.what())});
    mediaforge::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
