#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/build_orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/workspace/workspace_pool.hpp"

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
    std::cerr << "Usage: fwbuildd <config.yaml> OR fwbuildd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fwbuild::config::ConfigLoader::LoadFromYaml(config_path);
    fwbuild::config::ConfigLoader::Validate(config);

    fwbuild::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fwbuild::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.orchestrator->Start();
    FWBUILD_LOG_INFO("fwbuildd started", {fwbuild::observability::IntField("workspaces", app.workspaces->Capacity()),
                                          fwbuild::observability::IntField("max_in_flight", config.queue().max_in_flight())});

    while (g_running) {
      if (app.orchestrator->WaitForFailure(std::chrono::seconds(1))) break;
    }

    const bool failed = app.orchestrator->Failed();
    FWBUILD_LOG_INFO("Shutting down fwbuildd", {fwbuild::observability::BoolField("failed", failed)});

    app.orchestrator->Stop();

    if (failed) {
      FWBUILD_LOG_ERROR("Status store failed", {fwbuild::observability::StringField("error", app.orchestrator->FailureReason())});
      fwbuild::observability::ShutdownLogging();
      return 2;
    }
    fwbuild::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FWBUILD_LOG_ERROR("Fatal error", {fwbuild::observability::StringField("error", e.what())});
    fwbuild::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
