#include "internal/worker/polling_worker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/events/event_handler_pipeline.hpp"
#include "internal/events/event_manager.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using snapshot::events::EventHandler;
using snapshot::events::EventHandlerPipeline;
using snapshot::events::EventManager;
using snapshot::events::HandlerKind;
using snapshot::events::HandlerRef;
using snapshot::events::WorkerEvent;
using snapshot::events::WorkerEventType;
using snapshot::resolver::WorkerConfig;
using snapshot::resolver::WorkerSettings;
using snapshot::worker::CaptureSource;
using snapshot::worker::PollingWorker;
using snapshot::worker::WorkerContext;

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return predicate();
}

class ScriptedSource final : public CaptureSource {
 public:
  // Throws on the call numbered `fail_on` (1-based), 0 never fails.
  explicit ScriptedSource(int fail_on = 0) : fail_on_(fail_on) {
  }

  std::vector<std::uint8_t> Capture(const WorkerSettings& settings) override {
    const int call = ++calls_;
    {
      std::lock_guard lock(mutex_);
      urls_.push_back(settings.url);
    }
    if (fail_on_ != 0 && call >= fail_on_) {
      throw snapshot::util::CaptureFailed("connection refused");
    }
    return {0xFF, 0xD8, 0xFF};
  }

  int Calls() const {
    return calls_.load();
  }

  std::string LastUrl() const {
    std::lock_guard lock(mutex_);
    return urls_.empty() ? std::string{} : urls_.back();
  }

 private:
  int                      fail_on_;
  std::atomic<int>         calls_{0};
  mutable std::mutex       mutex_;
  std::vector<std::string> urls_;
};

class EventRecorder final : public EventHandler {
 public:
  std::string_view Name() const override {
    return "recorder";
  }

  void HandleEvent(const WorkerEvent& event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::size_t Count(WorkerEventType type) const {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& event : events_) {
      if (event.type == type) ++count;
    }
    return count;
  }

  std::vector<WorkerEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<WorkerEvent> events_;
};

WorkerConfig MakeConfig(const std::string& identity, const std::string& url, std::chrono::milliseconds sleep) {
  WorkerConfig config;
  config.identity               = identity;
  config.settings.camera_exid   = identity;
  config.settings.url           = url;
  config.settings.sleep         = sleep;
  config.settings.initial_sleep = 0ms;
  return config;
}

std::shared_ptr<EventManager> MakeEvents(const std::string& identity, const std::shared_ptr<EventRecorder>& recorder) {
  auto events = std::make_shared<EventManager>(identity);
  events->SubscribeAll(EventHandlerPipeline(std::vector<HandlerRef>{{HandlerKind::kBroadcast, recorder}}));
  return events;
}

void TestCapturesAndEmitsSnapshots() {
  auto recorder = std::make_shared<EventRecorder>();
  auto source   = std::make_shared<ScriptedSource>();

  WorkerContext context;
  context.events     = MakeEvents("cam1", recorder);
  context.generation = 1;

  auto worker = std::make_shared<PollingWorker>(MakeConfig("cam1", "http://10.0.0.1/live", 5ms), context, source);
  assert(recorder->Count(WorkerEventType::kSnapshotCaptured) == 0);

  worker->Start();
  assert(WaitUntil([&] { return recorder->Count(WorkerEventType::kSnapshotCaptured) >= 3; }));
  assert(worker->Running());

  worker->Stop();
  assert(!worker->Running());

  const auto events = recorder->Events();
  assert(events.front().camera_exid == "cam1");
  assert(events.front().image.size() == 3);
  assert(worker->Captures() >= 3);
}

void TestUpdateConfigAppliesInPlace() {
  auto recorder = std::make_shared<EventRecorder>();
  auto source   = std::make_shared<ScriptedSource>();

  WorkerContext context;
  context.events = MakeEvents("cam1", recorder);

  // long sleep: only the update can wake the loop for a second capture
  auto worker = std::make_shared<PollingWorker>(MakeConfig("cam1", "http://10.0.0.1/live", 1h), context, source);
  worker->Start();
  assert(WaitUntil([&] { return source->Calls() == 1; }));

  worker->UpdateConfig(MakeConfig("cam1", "http://10.0.0.2/live", 1h));

  assert(WaitUntil([&] { return source->Calls() == 2; }));
  assert(source->LastUrl() == "http://10.0.0.2/live");
  assert(worker->Identity() == "cam1");
  assert(worker->Settings().url == "http://10.0.0.2/live");
  assert(WaitUntil([&] { return recorder->Count(WorkerEventType::kConfigUpdated) == 1; }));

  worker->Stop();
}

void TestUpdateForAnotherIdentityIsRejected() {
  auto recorder = std::make_shared<EventRecorder>();

  WorkerContext context;
  context.events = MakeEvents("cam1", recorder);

  auto worker = std::make_shared<PollingWorker>(MakeConfig("cam1", "http://10.0.0.1/live", 1h), context, std::make_shared<ScriptedSource>());

  bool threw = false;
  try {
    worker->UpdateConfig(MakeConfig("cam2", "http://10.0.0.2/live", 1h));
  } catch (const snapshot::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(worker->Settings().url == "http://10.0.0.1/live");
}

void TestCaptureFailureReportsCrashOnce() {
  auto recorder = std::make_shared<EventRecorder>();
  auto source   = std::make_shared<ScriptedSource>(2);

  std::mutex               mutex;
  std::vector<std::string> crashes;

  WorkerContext context;
  context.events     = MakeEvents("cam-flaky", recorder);
  context.generation = 7;
  context.on_crash   = [&](const std::string& identity, std::uint64_t generation, const std::string& reason) {
    std::lock_guard lock(mutex);
    crashes.push_back(identity + "#" + std::to_string(generation) + ":" + reason);
  };

  auto worker = std::make_shared<PollingWorker>(MakeConfig("cam-flaky", "http://10.0.0.3/live", 1ms), context, source);
  worker->Start();

  assert(WaitUntil([&] {
    std::lock_guard lock(mutex);
    return !crashes.empty();
  }));
  assert(WaitUntil([&] { return !worker->Running(); }));
  worker->Stop();

  std::lock_guard lock(mutex);
  assert(crashes.size() == 1);
  assert(crashes.front() == "cam-flaky#7:connection refused");
  assert(recorder->Count(WorkerEventType::kSnapshotCaptured) == 1);
  assert(recorder->Count(WorkerEventType::kCaptureFailed) == 1);
}

class NonStandardThrowingSource final : public CaptureSource {
 public:
  std::vector<std::uint8_t> Capture(const WorkerSettings&) override {
    throw 42;
  }
};

void TestNonStandardExceptionIsReportedAsCrash() {
  auto recorder = std::make_shared<EventRecorder>();

  std::mutex               mutex;
  std::vector<std::string> crashes;

  WorkerContext context;
  context.events     = MakeEvents("cam-odd", recorder);
  context.generation = 3;
  context.on_crash   = [&](const std::string& identity, std::uint64_t generation, const std::string& reason) {
    std::lock_guard lock(mutex);
    crashes.push_back(identity + "#" + std::to_string(generation) + ":" + reason);
  };

  // a healthy neighbour keeps polling while the other worker fails
  auto healthy_recorder = std::make_shared<EventRecorder>();
  WorkerContext healthy_context;
  healthy_context.events = MakeEvents("cam-ok", healthy_recorder);

  auto failing = std::make_shared<PollingWorker>(MakeConfig("cam-odd", "http://10.0.0.5/live", 1ms), context,
                                                 std::make_shared<NonStandardThrowingSource>());
  auto healthy = std::make_shared<PollingWorker>(MakeConfig("cam-ok", "http://10.0.0.6/live", 1ms), healthy_context,
                                                 std::make_shared<ScriptedSource>());
  healthy->Start();
  failing->Start();

  assert(WaitUntil([&] {
    std::lock_guard lock(mutex);
    return !crashes.empty();
  }));
  assert(WaitUntil([&] { return !failing->Running(); }));
  failing->Stop();

  const auto before = healthy_recorder->Count(WorkerEventType::kSnapshotCaptured);
  assert(WaitUntil([&] { return healthy_recorder->Count(WorkerEventType::kSnapshotCaptured) > before; }));
  assert(healthy->Running());
  healthy->Stop();

  std::lock_guard lock(mutex);
  assert(crashes.size() == 1);
  assert(crashes.front() == "cam-odd#3:unknown exception");
  assert(recorder->Count(WorkerEventType::kCaptureFailed) == 1);
  assert(recorder->Events().back().error == "unknown exception");
}

void TestWorkerThreadKeepsWorkerAlive() {
  auto recorder = std::make_shared<EventRecorder>();
  auto source   = std::make_shared<ScriptedSource>();

  WorkerContext context;
  context.events = MakeEvents("cam1", recorder);

  std::weak_ptr<PollingWorker> observer;
  {
    auto worker = std::make_shared<PollingWorker>(MakeConfig("cam1", "http://10.0.0.1/live", 1ms), context, source);
    observer    = worker;
    worker->Start();
    assert(WaitUntil([&] { return source->Calls() >= 1; }));
  }

  // the last outside reference is gone, the running loop still owns the worker
  assert(!observer.expired());
  auto worker = observer.lock();
  assert(worker);
  worker->Stop();
  worker.reset();
  assert(WaitUntil([&] { return observer.expired(); }));
}

void TestStopInterruptsSleepWithoutReportingACrash() {
  auto recorder = std::make_shared<EventRecorder>();
  bool crashed  = false;

  WorkerContext context;
  context.events   = MakeEvents("cam-idle", recorder);
  context.on_crash = [&](const std::string&, std::uint64_t, const std::string&) { crashed = true; };

  auto config                   = MakeConfig("cam-idle", "http://10.0.0.4/live", 1h);
  config.settings.initial_sleep = 1h;
  auto worker = std::make_shared<PollingWorker>(config, context, std::make_shared<ScriptedSource>());
  worker->Start();

  const auto started = std::chrono::steady_clock::now();
  worker->Stop();
  assert(std::chrono::steady_clock::now() - started < 1s);
  assert(!crashed);
  assert(recorder->Events().empty());
}

void TestWorkerRequiresCollaborators() {
  bool threw = false;
  try {
    (void)std::make_shared<PollingWorker>(MakeConfig("cam1", "http://10.0.0.1/live", 1ms), WorkerContext{}, std::make_shared<ScriptedSource>());
  } catch (const snapshot::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCapturesAndEmitsSnapshots();
  TestUpdateConfigAppliesInPlace();
  TestUpdateForAnotherIdentityIsRejected();
  TestCaptureFailureReportsCrashOnce();
  TestNonStandardExceptionIsReportedAsCrash();
  TestWorkerThreadKeepsWorkerAlive();
  TestStopInterruptsSleepWithoutReportingACrash();
  TestWorkerRequiresCollaborators();

  std::cout << "snapshot_manager_unit_polling_worker: pass\n";
  return 0;
}
