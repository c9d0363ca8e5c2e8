#include "cloud_recording_policy.hpp"

#include <algorithm>
#include <cstdint>

namespace snapshot::model {

namespace {

bool IsInactive(const CloudRecording& recording) {
  return recording.status == "off" || recording.status == "paused";
}

// FNV-1a, stable across runs and platforms unlike std::hash.
std::uint64_t StableHash(std::string_view value) {
  std::uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : value) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

} // namespace

Schedule CloudRecordingPolicy::ContinuousSchedule() {
  Schedule schedule;
  for (const char* day : {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"}) {
    schedule[day] = {"00:00-23:59"};
  }
  return schedule;
}

Schedule CloudRecordingPolicy::ScheduleFor(const std::optional<CloudRecording>& recording) {
  if (!recording || IsInactive(*recording)) {
    return {};
  }
  if (recording->status == "on") {
    return ContinuousSchedule();
  }
  return recording->schedule;
}

std::chrono::milliseconds CloudRecordingPolicy::SleepFor(const std::optional<CloudRecording>& recording) {
  if (!recording || IsInactive(*recording)) {
    return kDefaultSleep;
  }
  const int frequency = recording->frequency < 1 ? 1 : recording->frequency;
  return std::max(std::chrono::milliseconds(60000 / frequency), kMinSleep);
}

std::chrono::milliseconds CloudRecordingPolicy::InitialSleepFor(const std::optional<CloudRecording>& recording, std::string_view camera_exid) {
  if (!recording || recording->status == "off" || recording->frequency > 1) {
    return kDefaultSleep;
  }
  const auto seconds = static_cast<std::int64_t>(StableHash(camera_exid) % 60) + 1;
  return std::chrono::seconds(seconds);
}

} // namespace snapshot::model
