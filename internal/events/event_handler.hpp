#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "worker_event.hpp"

namespace snapshot::events {

enum class HandlerKind : std::uint8_t {
  kBroadcast       = 0,
  kCache           = 1,
  kPersistence     = 2,
  kPollControl     = 3,
  kStorage         = 4,
  kStats           = 5,
  kMotionDetection = 6,
};

std::string_view           ToString(HandlerKind kind);
std::optional<HandlerKind> HandlerKindFromString(std::string_view name);

/*
  A side-effect consumer of worker events.

  Implementations live outside this repository (broadcast, database,
  storage...). HandleEvent runs on the worker's thread.
*/
class EventHandler {
 public:
  virtual ~EventHandler() = default;

  virtual std::string_view Name() const                         = 0;
  virtual void             HandleEvent(const WorkerEvent& event) = 0;
};

struct HandlerRef {
  HandlerKind                   kind;
  std::shared_ptr<EventHandler> handler;
};

} // namespace snapshot::events
