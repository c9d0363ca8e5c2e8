#include "event_manager.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace snapshot::events {

using snapshot::observability::CameraField;
using snapshot::observability::StringField;

EventManager::EventManager(std::string camera_exid) : camera_exid_(std::move(camera_exid)) {
}

void EventManager::SubscribeAll(const EventHandlerPipeline& pipeline) {
  std::lock_guard lock(mutex_);
  for (const auto& ref : pipeline.Handlers()) {
    handlers_.push_back(ref);
  }
}

void EventManager::Notify(const WorkerEvent& event) {
  std::vector<HandlerRef> handlers;
  {
    std::lock_guard lock(mutex_);
    handlers = handlers_;
  }

  for (const auto& ref : handlers) {
    try {
      ref.handler->HandleEvent(event);
    } catch (const std::exception& e) {
      ++handler_failures_;
      SNAPSHOT_LOG_ERROR("Event handler failed", {CameraField(camera_exid_), StringField("handler", ToString(ref.kind)), StringField("error", e.what())});
    } catch (...) {
      ++handler_failures_;
      SNAPSHOT_LOG_ERROR("Event handler failed", {CameraField(camera_exid_), StringField("handler", ToString(ref.kind)), StringField("error", "unknown exception")});
    }
  }
  ++delivered_;
}

std::vector<HandlerKind> EventManager::Subscriptions() const {
  std::lock_guard lock(mutex_);
  std::vector<HandlerKind> kinds;
  kinds.reserve(handlers_.size());
  for (const auto& ref : handlers_) {
    kinds.push_back(ref.kind);
  }
  return kinds;
}

} // namespace snapshot::events
