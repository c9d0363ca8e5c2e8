#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "internal/catalog/memory_catalog.hpp"
#include "internal/catalog/sqlite/sqlite_catalog.hpp"
#include "internal/catalog/sqlite/sqlite_db.hpp"
#include "internal/events/logging_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/streaming/logging_streamer_control.hpp"
#include "internal/worker/polling_worker.hpp"

namespace snapshot::factory {

namespace {

std::shared_ptr<catalog::CameraCatalog> BuildCatalog(const snapshot::runtime::config::RuntimeConfig& config) {
  const auto& catalog_config = config.catalog();

  if (catalog_config.has_sqlite()) {
    auto db     = std::make_shared<catalog::sqlite::SqliteDB>(catalog_config.sqlite().path());
    auto sqlite = std::make_shared<catalog::sqlite::SqliteCatalog>(std::move(db));
    sqlite->EnsureSchema();
    SNAPSHOT_LOG_INFO("Using SQLite camera catalog", {observability::StringField("path", catalog_config.sqlite().path())});
    return sqlite;
  }

  auto cameras = catalog_config.has_memory() ? catalog::MemoryCatalog::CamerasFromConfig(catalog_config.memory())
                                             : std::vector<model::Camera>{};
  SNAPSHOT_LOG_INFO("Using in-memory camera catalog", {observability::IntField("cameras", static_cast<std::int64_t>(cameras.size()))});
  return std::make_shared<catalog::MemoryCatalog>(std::move(cameras));
}

std::shared_ptr<events::EventHandler> DefaultHandler(events::HandlerKind kind) {
  return std::make_shared<events::LoggingHandler>(kind);
}

} // namespace

supervisor::SupervisorOptions OptionsFromConfig(const snapshot::runtime::config::RuntimeConfig& config) {
  const auto& supervisor = config.supervisor();

  supervisor::SupervisorOptions options;
  options.start_camera_workers = supervisor.start_camera_workers();
  if (supervisor.max_restarts() > 0) {
    options.max_restarts = supervisor.max_restarts();
  }
  if (supervisor.max_seconds() > 0) {
    options.max_seconds = std::chrono::seconds(supervisor.max_seconds());
  }
  options.restart_backoff = std::chrono::milliseconds(supervisor.restart_backoff_ms());
  return options;
}

Application Build(const snapshot::runtime::config::RuntimeConfig& config, Collaborators collaborators) {
  Application app;

  // ------------------------------------------------------------------
  // External collaborators
  // ------------------------------------------------------------------
  app.catalog = collaborators.catalog ? std::move(collaborators.catalog) : BuildCatalog(config);

  std::shared_ptr<worker::CaptureSource> capture = std::move(collaborators.capture_source);
  if (!capture) capture = std::make_shared<worker::NullCaptureSource>();

  std::shared_ptr<streaming::StreamerControl> streamer = std::move(collaborators.streamer);
  if (!streamer) streamer = std::make_shared<streaming::LoggingStreamerControl>();

  events::EventHandlerPipeline::HandlerFactory handler_factory = std::move(collaborators.handler_factory);
  if (!handler_factory) handler_factory = DefaultHandler;

  // ------------------------------------------------------------------
  // Handler pipeline, fixed for the lifetime of the process
  // ------------------------------------------------------------------
  std::vector<std::string> handler_names(config.event_handlers().begin(), config.event_handlers().end());
  auto pipeline = events::EventHandlerPipeline::Build(handler_names, handler_factory);

  // ------------------------------------------------------------------
  // Supervisor
  // ------------------------------------------------------------------
  app.supervisor = std::make_shared<supervisor::WorkerSupervisor>(OptionsFromConfig(config), std::move(pipeline),
                                                                  worker::MakePollingWorkerFactory(std::move(capture)), app.catalog,
                                                                  std::move(streamer));
  return app;
}

} // namespace snapshot::factory
