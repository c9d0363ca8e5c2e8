#pragma once

#include "event_handler.hpp"

namespace snapshot::events {

/*
  Default stand-in for a handler whose implementation is provided by
  another service. Records each event at debug level.
*/
class LoggingHandler final : public EventHandler {
 public:
  explicit LoggingHandler(HandlerKind kind);

  std::string_view Name() const override;
  void             HandleEvent(const WorkerEvent& event) override;

 private:
  HandlerKind kind_;
};

} // namespace snapshot::events
