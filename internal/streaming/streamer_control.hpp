#pragma once

#include <string>

namespace snapshot::streaming {

/*
  Handle on the live-streaming subsystem. The supervisor asks it to
  restart a camera's stream after the camera's configuration changed.
  Fire-and-forget: failures are the streaming side's concern.
*/
class StreamerControl {
 public:
  virtual ~StreamerControl() = default;

  virtual void RestartStreamer(const std::string& camera_exid) = 0;
};

} // namespace snapshot::streaming
