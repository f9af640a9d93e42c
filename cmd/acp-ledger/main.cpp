#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/application.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

using acp::runtime::Server;

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
    std::cerr << "Usage: acp-ledger <config.yaml> OR acp-ledger --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = acp::config::ConfigLoader::LoadFromYaml(config_path);

    acp::observability::InitializeLogging(config);

    auto app = acp::runtime::BuildApplication(config, std::make_shared<acp::util::SystemClock>());

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Handlers go in before Start so an early signal is not lost.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ACP_LOG_INFO("ACP ledger started", {acp::observability::StringField("bind_address", config.server().bind_address()),
                                        acp::observability::StringField("token", config.token().symbol())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ACP_LOG_INFO("Shutting down ACP ledger");

    server.Stop();
    acp::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ACP_LOG_ERROR("Fatal error", {acp::observability::StringField("error", e.what())});
    acp::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
