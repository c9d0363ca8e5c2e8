#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

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
    std::cerr << "Usage: snapshot-manager <config.yaml> OR snapshot-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = snapshot::config::ConfigLoader::LoadFromYaml(config_path);

    snapshot::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = snapshot::factory::Build(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.supervisor->Start();
    SNAPSHOT_LOG_INFO("Snapshot manager started",
                      {snapshot::observability::BoolField("start_camera_workers", config.supervisor().start_camera_workers()),
                       snapshot::observability::IntField("event_handlers", config.event_handlers_size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SNAPSHOT_LOG_INFO("Shutting down snapshot manager", {snapshot::observability::IntField("workers", static_cast<std::int64_t>(app.supervisor->Size()))});

    app.supervisor->Shutdown();
    snapshot::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SNAPSHOT_LOG_ERROR("Fatal error", {snapshot::observability::StringField("error", e.what())});
    snapshot::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
