#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include "camera.hpp"

namespace snapshot::model {

/*
  Derives the polling cadence of a worker from the camera's cloud
  recording settings. All functions are total and deterministic.
*/
class CloudRecordingPolicy {
 public:
  static constexpr std::chrono::milliseconds kDefaultSleep{1000};
  // Floor for very high frequencies, the loop never polls without pausing.
  static constexpr std::chrono::milliseconds kMinSleep{1};

  static Schedule                  ScheduleFor(const std::optional<CloudRecording>& recording);
  static std::chrono::milliseconds SleepFor(const std::optional<CloudRecording>& recording);

  // Cameras polled once a minute start with a per-camera jitter of 1..60s
  // so they do not all fire together after a bulk start.
  static std::chrono::milliseconds InitialSleepFor(const std::optional<CloudRecording>& recording, std::string_view camera_exid);

  static Schedule ContinuousSchedule();
};

} // namespace snapshot::model
