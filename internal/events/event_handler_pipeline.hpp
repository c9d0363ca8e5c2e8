#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "event_handler.hpp"

namespace snapshot::events {

/*
  The ordered list of enabled handlers, fixed at process startup.

  Every worker subscribes to exactly this list, in this order. Handlers may
  depend on the order (persistence before cache invalidation). The
  pipeline is immutable once built and safe to share between threads.
*/
class EventHandlerPipeline {
 public:
  using HandlerFactory = std::function<std::shared_ptr<EventHandler>(HandlerKind)>;

  EventHandlerPipeline() = default;
  explicit EventHandlerPipeline(std::vector<HandlerRef> handlers);

  // Throws util::InvalidConfig on unknown or repeated names, or when the
  // factory returns no handler.
  static EventHandlerPipeline Build(const std::vector<std::string>& names, const HandlerFactory& factory);

  const std::vector<HandlerRef>& Handlers() const {
    return handlers_;
  }

  std::size_t Size() const {
    return handlers_.size();
  }

  bool Contains(HandlerKind kind) const;

 private:
  std::vector<HandlerRef> handlers_;
};

} // namespace snapshot::events
