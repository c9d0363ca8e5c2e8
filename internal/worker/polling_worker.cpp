#include "polling_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::worker {

using snapshot::observability::CameraField;
using snapshot::observability::IntField;
using snapshot::observability::StringField;

PollingWorker::PollingWorker(const resolver::WorkerConfig& config, WorkerContext context, std::shared_ptr<CaptureSource> source)
    : identity_(config.identity), context_(std::move(context)), source_(std::move(source)), settings_(config.settings) {
  if (!context_.events) {
    throw util::InvalidState("worker " + identity_ + " created without an event manager");
  }
  if (!source_) {
    throw util::InvalidState("worker " + identity_ + " created without a capture source");
  }
}

PollingWorker::~PollingWorker() {
  Stop();
}

void PollingWorker::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) {
    throw util::InvalidState("worker " + identity_ + " already started");
  }
  stop_requested_ = false;
  running_        = true;
  thread_         = std::thread([self = shared_from_this()] { self->Run(); });
}

void PollingWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
    return;
  }
  thread_.join();
}

void PollingWorker::UpdateConfig(const resolver::WorkerConfig& config) {
  if (config.identity != identity_) {
    throw util::InvalidState("config for " + config.identity + " delivered to worker " + identity_);
  }

  {
    std::lock_guard lock(mutex_);
    settings_ = config.settings;
    ++config_version_;
  }
  cv_.notify_all();
}

resolver::WorkerSettings PollingWorker::Settings() const {
  std::lock_guard lock(mutex_);
  return settings_;
}

void PollingWorker::Emit(events::WorkerEventType type, std::vector<std::uint8_t> image, std::string error) {
  events::WorkerEvent event;
  event.type        = type;
  event.camera_exid = identity_;
  event.timestamp   = std::chrono::system_clock::now();
  event.image       = std::move(image);
  event.error       = std::move(error);
  context_.events->Notify(event);
}

bool PollingWorker::SleepFor(std::chrono::milliseconds duration, std::uint64_t seen_version) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, duration, [&] { return stop_requested_ || config_version_ != seen_version; });
  return !stop_requested_;
}

void PollingWorker::Run() {
  std::uint64_t applied_version = 0;
  std::chrono::milliseconds initial_sleep{0};
  {
    std::lock_guard lock(mutex_);
    applied_version = config_version_;
    initial_sleep   = settings_.initial_sleep;
  }

  SNAPSHOT_LOG_DEBUG("Worker started", {CameraField(identity_), IntField("generation", static_cast<std::int64_t>(context_.generation))});

  try {
    if (!SleepFor(initial_sleep, applied_version)) {
      running_ = false;
      return;
    }

    while (true) {
      resolver::WorkerSettings settings;
      std::uint64_t            version = 0;
      {
        std::lock_guard lock(mutex_);
        if (stop_requested_) break;
        settings = settings_;
        version  = config_version_;
      }

      if (version != applied_version) {
        applied_version = version;
        SNAPSHOT_LOG_INFO("Worker applied new configuration", {CameraField(identity_), StringField("url", settings.url)});
        Emit(events::WorkerEventType::kConfigUpdated);
      }

      auto image = source_->Capture(settings);
      ++captures_;
      Emit(events::WorkerEventType::kSnapshotCaptured, std::move(image));

      if (!SleepFor(settings.sleep, applied_version)) break;
    }
  } catch (const std::exception& e) {
    ReportCrash(e.what());
    return;
  } catch (...) {
    ReportCrash("unknown exception");
    return;
  }

  running_ = false;
  SNAPSHOT_LOG_DEBUG("Worker stopped", {CameraField(identity_)});
}

void PollingWorker::ReportCrash(const std::string& reason) {
  running_ = false;
  SNAPSHOT_LOG_ERROR("Worker crashed", {CameraField(identity_), StringField("error", reason)});
  Emit(events::WorkerEventType::kCaptureFailed, {}, reason);
  if (context_.on_crash) {
    context_.on_crash(identity_, context_.generation, reason);
  }
}

WorkerFactory MakePollingWorkerFactory(std::shared_ptr<CaptureSource> source) {
  return [source = std::move(source)](const resolver::WorkerConfig& config, WorkerContext context) -> std::shared_ptr<Worker> {
    return std::make_shared<PollingWorker>(config, std::move(context), source);
  };
}

} // namespace snapshot::worker
