#include "logging_handler.hpp"

#include "internal/observability/logging.hpp"

namespace snapshot::events {

using snapshot::observability::CameraField;
using snapshot::observability::IntField;
using snapshot::observability::StringField;

namespace {

std::string_view EventName(WorkerEventType type) {
  switch (type) {
    case WorkerEventType::kSnapshotCaptured:
      return "snapshot_captured";
    case WorkerEventType::kCaptureFailed:
      return "capture_failed";
    case WorkerEventType::kConfigUpdated:
      return "config_updated";
  }
  return "unknown";
}

} // namespace

LoggingHandler::LoggingHandler(HandlerKind kind) : kind_(kind) {
}

std::string_view LoggingHandler::Name() const {
  return ToString(kind_);
}

void LoggingHandler::HandleEvent(const WorkerEvent& event) {
  SNAPSHOT_LOG_DEBUG("Worker event",
                     {CameraField(event.camera_exid), StringField("handler", Name()), StringField("event", EventName(event.type)),
                      IntField("bytes", static_cast<std::int64_t>(event.image.size()))});
}

} // namespace snapshot::events
