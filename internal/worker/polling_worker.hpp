#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "capture_source.hpp"
#include "worker.hpp"

namespace snapshot::worker {

/*
  Thread-per-camera polling loop.

    initial_sleep -> capture -> emit -> sleep -> capture ...

  Sleeps are interruptible: Stop() and UpdateConfig() wake the loop, so a
  new config takes effect after at most one in-flight Capture call.

  Must be owned by a shared_ptr. The running thread holds a reference, so
  a handler may stop its own worker from inside an event callback.
*/
class PollingWorker final : public Worker, public std::enable_shared_from_this<PollingWorker> {
 public:
  PollingWorker(const resolver::WorkerConfig& config, WorkerContext context, std::shared_ptr<CaptureSource> source);
  ~PollingWorker() override;

  PollingWorker(const PollingWorker&)            = delete;
  PollingWorker& operator=(const PollingWorker&) = delete;

  const std::string& Identity() const override {
    return identity_;
  }

  void Start() override;
  void Stop() override;
  void UpdateConfig(const resolver::WorkerConfig& config) override;

  resolver::WorkerSettings Settings() const override;
  bool                     Running() const override {
    return running_.load();
  }

  std::uint64_t Captures() const {
    return captures_.load();
  }

 private:
  void Run();
  void Emit(events::WorkerEventType type, std::vector<std::uint8_t> image = {}, std::string error = {});
  void ReportCrash(const std::string& reason);

  // false when the loop should exit
  bool SleepFor(std::chrono::milliseconds duration, std::uint64_t seen_version);

  const std::string              identity_;
  WorkerContext                  context_;
  std::shared_ptr<CaptureSource> source_;

  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  resolver::WorkerSettings settings_;
  std::uint64_t            config_version_ = 0;
  bool                     stop_requested_ = false;

  std::thread                thread_;
  std::atomic<bool>          running_{false};
  std::atomic<std::uint64_t> captures_{0};
};

// Factory wiring PollingWorker to a shared capture source.
WorkerFactory MakePollingWorkerFactory(std::shared_ptr<CaptureSource> source);

} // namespace snapshot::worker
