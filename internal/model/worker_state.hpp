#pragma once

#include <cstdint>
#include <string_view>

namespace snapshot::model {

enum class WorkerState : std::uint8_t {
  kStarting   = 0,
  kRunning    = 1,
  kCrashed    = 2,
  kRestarting = 3,
  kStopped    = 4,
};

constexpr bool IsTerminal(WorkerState state) {
  return state == WorkerState::kStopped;
}

constexpr bool CanTransition(WorkerState from, WorkerState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == WorkerState::kStopped) {
    return true;
  }

  switch (from) {
    case WorkerState::kStarting:
      return to == WorkerState::kRunning || to == WorkerState::kCrashed;
    case WorkerState::kRunning:
      return to == WorkerState::kCrashed;
    case WorkerState::kCrashed:
      return to == WorkerState::kRestarting;
    case WorkerState::kRestarting:
      return to == WorkerState::kRunning || to == WorkerState::kCrashed;
    case WorkerState::kStopped:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(WorkerState state) {
  switch (state) {
    case WorkerState::kStarting:
      return "starting";
    case WorkerState::kRunning:
      return "running";
    case WorkerState::kCrashed:
      return "crashed";
    case WorkerState::kRestarting:
      return "restarting";
    case WorkerState::kStopped:
      return "stopped";
  }
  return "unknown";
}

} // namespace snapshot::model
