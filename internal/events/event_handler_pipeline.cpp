#include "event_handler_pipeline.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "internal/util/errors.hpp"

namespace snapshot::events {

namespace {

struct KindName {
  HandlerKind      kind;
  std::string_view name;
};

constexpr std::array<KindName, 7> kKindNames = {{
    {HandlerKind::kBroadcast, "broadcast"},
    {HandlerKind::kCache, "cache"},
    {HandlerKind::kPersistence, "persistence"},
    {HandlerKind::kPollControl, "poll_control"},
    {HandlerKind::kStorage, "storage"},
    {HandlerKind::kStats, "stats"},
    {HandlerKind::kMotionDetection, "motion_detection"},
}};

} // namespace

std::string_view ToString(HandlerKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.kind == kind) return entry.name;
  }
  return "unknown";
}

std::optional<HandlerKind> HandlerKindFromString(std::string_view name) {
  for (const auto& entry : kKindNames) {
    if (entry.name == name) return entry.kind;
  }
  return std::nullopt;
}

EventHandlerPipeline::EventHandlerPipeline(std::vector<HandlerRef> handlers) : handlers_(std::move(handlers)) {
}

EventHandlerPipeline EventHandlerPipeline::Build(const std::vector<std::string>& names, const HandlerFactory& factory) {
  std::vector<HandlerRef> handlers;
  handlers.reserve(names.size());

  for (const auto& name : names) {
    auto kind = HandlerKindFromString(name);
    if (!kind) {
      throw util::InvalidConfig("unknown event handler: " + name);
    }

    const bool duplicate = std::any_of(handlers.begin(), handlers.end(), [&](const HandlerRef& ref) { return ref.kind == *kind; });
    if (duplicate) {
      throw util::InvalidConfig("event handler listed twice: " + name);
    }

    auto handler = factory(*kind);
    if (!handler) {
      throw util::InvalidConfig("no implementation for event handler: " + name);
    }

    handlers.push_back(HandlerRef{*kind, std::move(handler)});
  }

  return EventHandlerPipeline(std::move(handlers));
}

bool EventHandlerPipeline::Contains(HandlerKind kind) const {
  return std::any_of(handlers_.begin(), handlers_.end(), [&](const HandlerRef& ref) { return ref.kind == kind; });
}

} // namespace snapshot::events
