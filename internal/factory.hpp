#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/catalog/camera_catalog.hpp"
#include "internal/events/event_handler_pipeline.hpp"
#include "internal/streaming/streamer_control.hpp"
#include "internal/supervisor/worker_supervisor.hpp"
#include "internal/worker/capture_source.hpp"

namespace snapshot::factory {

/*
  Collaborators provided by the deployment. Anything left empty is
  replaced by the local stand-in (logging handlers, null capture,
  logging streamer).
*/
struct Collaborators {
  events::EventHandlerPipeline::HandlerFactory handler_factory;
  std::shared_ptr<worker::CaptureSource>       capture_source;
  std::shared_ptr<streaming::StreamerControl>  streamer;
  std::shared_ptr<catalog::CameraCatalog>      catalog;
};

/*
  Application

  Owns all long-lived objects used by the process.
*/
struct Application {
  std::shared_ptr<catalog::CameraCatalog>       catalog;
  std::shared_ptr<supervisor::WorkerSupervisor> supervisor;
};

supervisor::SupervisorOptions OptionsFromConfig(const snapshot::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete catalog, handler
  and capture types. The supervisor is returned not yet started.
*/
Application Build(const snapshot::runtime::config::RuntimeConfig& config, Collaborators collaborators = {});

} // namespace snapshot::factory
