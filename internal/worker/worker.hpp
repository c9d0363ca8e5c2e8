#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/events/event_manager.hpp"
#include "internal/resolver/worker_config.hpp"

namespace snapshot::worker {

/*
  Contract between the supervisor and one camera worker.

  A worker polls its camera on its own thread and reports events through
  the EventManager it was given. It must not emit before Start().
  UpdateConfig swaps settings in place; identity and subscriptions stay.
  A run that ends with an error is reported once through the crash
  callback; Stop() never reports.
*/
class Worker {
 public:
  virtual ~Worker() = default;

  virtual const std::string& Identity() const = 0;

  virtual void Start() = 0;
  virtual void Stop()  = 0;

  // Throws util::InvalidState if the config names another identity.
  virtual void UpdateConfig(const resolver::WorkerConfig& config) = 0;

  virtual resolver::WorkerSettings Settings() const = 0;
  virtual bool                     Running() const  = 0;
};

using CrashCallback = std::function<void(const std::string& identity, std::uint64_t generation, const std::string& reason)>;

struct WorkerContext {
  std::shared_ptr<events::EventManager> events;
  // Distinguishes successive incarnations of the same identity.
  std::uint64_t generation = 0;
  CrashCallback on_crash;
};

using WorkerFactory = std::function<std::shared_ptr<Worker>(const resolver::WorkerConfig&, WorkerContext)>;

} // namespace snapshot::worker
