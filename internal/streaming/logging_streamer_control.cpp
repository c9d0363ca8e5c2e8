#include "logging_streamer_control.hpp"

#include "internal/observability/logging.hpp"

namespace snapshot::streaming {

void LoggingStreamerControl::RestartStreamer(const std::string& camera_exid) {
  SNAPSHOT_LOG_INFO("Streamer restart requested", {snapshot::observability::CameraField(camera_exid)});
}

} // namespace snapshot::streaming
