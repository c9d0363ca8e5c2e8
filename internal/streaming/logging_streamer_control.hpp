#pragma once

#include "streamer_control.hpp"

namespace snapshot::streaming {

// Used when no streaming subsystem runs next to the supervisor.
class LoggingStreamerControl final : public StreamerControl {
 public:
  void RestartStreamer(const std::string& camera_exid) override;
};

} // namespace snapshot::streaming
