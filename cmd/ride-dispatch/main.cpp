#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/dispatch_server.hpp"
#include "internal/grpc/driver_server.hpp"
#include "internal/grpc/ride_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using ridedispatch::factory::BuildRuntime;
using ridedispatch::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  ridedispatch::observability::ShutdownLogging();
  ridedispatch::observability::ShutdownMetrics();
  ridedispatch::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: ride-dispatch <config.yaml> OR ride-dispatch --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ridedispatch::config::ConfigLoader::LoadFromYaml(config_path);

    ridedispatch::observability::InitializeTracing(config);
    ridedispatch::observability::InitializeMetrics(config);
    ridedispatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto deps = BuildRuntime(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<ridedispatch::grpc::DispatchServer>(deps.dispatch_service));
    services.push_back(std::make_unique<ridedispatch::grpc::RideServer>(deps.ride_service));
    services.push_back(std::make_unique<ridedispatch::grpc::DriverServer>(deps.driver_service));
    services.push_back(std::make_unique<ridedispatch::grpc::AdminServer>(deps.admin_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    deps.Start(config);
    server.Start();
    RIDEDISPATCH_LOG_INFO("ride dispatch started",
                          {ridedispatch::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RIDEDISPATCH_LOG_INFO("shutting down ride dispatch");

    // Streams end once the hub closes; the server can then drain.
    deps.subscriptions->CloseAll();
    server.Stop();
    deps.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    RIDEDISPATCH_LOG_ERROR("fatal error", {ridedispatch::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
