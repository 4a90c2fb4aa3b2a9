#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runs/run_store.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

std::string DatabaseLabel(const foreman::runtime::config::RuntimeConfig& config) {
  if (config.database().has_sqlite()) return "sqlite:" + config.database().sqlite().path();
  if (config.database().has_postgres()) return "postgres";
  return "memory";
}

void ShutdownObservability() {
  foreman::observability::ShutdownLogging();
  foreman::observability::ShutdownMetrics();
  foreman::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: foreman <config.yaml> OR foreman --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = foreman::config::ConfigLoader::LoadFromYaml(config_path);

    foreman::observability::InitializeTracing(config);
    foreman::observability::InitializeMetrics(config);
    foreman::observability::InitializeLogging(config);

    // reconciles runs a previous daemon left live
    auto app = foreman::factory::Build(config);

    const auto resumable = app.runs->Resumable().size();
    FOREMAN_LOG_INFO("Run history ready", {foreman::observability::StringField("database", DatabaseLabel(config)),
                                           foreman::observability::IntField("resumable_runs", static_cast<int64_t>(resumable))});

    foreman::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    // handlers go in before Start so an early signal is not lost
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FOREMAN_LOG_INFO("foreman started", {foreman::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FOREMAN_LOG_INFO("Shutting down foreman");

    // stop accepting RPCs first, then stop pipelines and workers
    server.Stop();
    app.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    FOREMAN_LOG_ERROR("Fatal error", {foreman::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
