#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/events/event_handler.hpp"
#include "internal/model/camera.hpp"

namespace snapshot::resolver {

struct WorkerSettings {
  std::int64_t              camera_id = 0;
  std::string               camera_exid;
  std::string               vendor_exid;
  model::Schedule           schedule;
  std::string               timezone;
  std::string               url;
  std::string               auth;
  std::chrono::milliseconds sleep{0};
  std::chrono::milliseconds initial_sleep{0};

  bool operator==(const WorkerSettings&) const = default;
};

/*
  Everything a worker needs to run for one camera.

  Produced fresh by ConfigResolver on every start and update; never
  modified after it has been handed to a worker.
*/
struct WorkerConfig {
  std::string                     identity;
  std::vector<events::HandlerRef> handlers;
  WorkerSettings                  settings;
};

} // namespace snapshot::resolver
