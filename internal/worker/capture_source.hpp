#pragma once

#include <cstdint>
#include <vector>

#include "internal/resolver/worker_config.hpp"

namespace snapshot::worker {

/*
  Fetches one snapshot from a camera. Throws on failure, which ends the
  worker's run and lets the supervisor restart it.
*/
class CaptureSource {
 public:
  virtual ~CaptureSource() = default;

  virtual std::vector<std::uint8_t> Capture(const resolver::WorkerSettings& settings) = 0;
};

// Placeholder used when no capture backend is linked in.
class NullCaptureSource final : public CaptureSource {
 public:
  std::vector<std::uint8_t> Capture(const resolver::WorkerSettings&) override {
    return {};
  }
};

} // namespace snapshot::worker
