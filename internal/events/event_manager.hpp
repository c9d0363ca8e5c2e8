#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "event_handler.hpp"
#include "event_handler_pipeline.hpp"

namespace snapshot::events {

/*
  Per-worker fan-out of events to its subscribed handlers.

  Subscriptions are made by the supervisor before the worker is started
  and are kept across worker restarts. Notify delivers synchronously, in
  subscription order. A throwing handler is logged and the remaining
  handlers still see the event.
*/
class EventManager {
 public:
  explicit EventManager(std::string camera_exid);

  void SubscribeAll(const EventHandlerPipeline& pipeline);

  void Notify(const WorkerEvent& event);

  std::vector<HandlerKind> Subscriptions() const;

  std::uint64_t Delivered() const {
    return delivered_.load();
  }

  std::uint64_t HandlerFailures() const {
    return handler_failures_.load();
  }

 private:
  std::string camera_exid_;

  mutable std::mutex      mutex_;
  std::vector<HandlerRef> handlers_;

  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> handler_failures_{0};
};

} // namespace snapshot::events
