#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace snapshot::events {

enum class WorkerEventType : std::uint8_t {
  kSnapshotCaptured = 0,
  kCaptureFailed    = 1,
  kConfigUpdated    = 2,
};

/*
  Emitted by a worker and delivered to every handler of the pipeline.
*/
struct WorkerEvent {
  WorkerEventType                       type = WorkerEventType::kSnapshotCaptured;
  std::string                           camera_exid;
  std::chrono::system_clock::time_point timestamp;
  std::vector<std::uint8_t>             image;
  std::string                           error;
};

} // namespace snapshot::events
