#include "worker_supervisor.hpp"

#include <exception>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/resolver/config_resolver.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::supervisor {

using snapshot::model::WorkerState;
using snapshot::observability::CameraField;
using snapshot::observability::IntField;
using snapshot::observability::StringField;
using snapshot::resolver::ConfigResolver;

namespace {

void Transition(WorkerEntry& entry, WorkerState to) {
  if (!model::CanTransition(entry.state, to)) {
    throw util::InvalidState("worker " + entry.identity + " cannot go from " + std::string(model::ToString(entry.state)) + " to " +
                             std::string(model::ToString(to)));
  }
  entry.state = to;
}

} // namespace

WorkerSupervisor::WorkerSupervisor(SupervisorOptions options, events::EventHandlerPipeline pipeline, worker::WorkerFactory factory,
                                   std::shared_ptr<catalog::CameraCatalog> catalog, std::shared_ptr<streaming::StreamerControl> streamer)
    : options_(std::move(options)),
      pipeline_(std::move(pipeline)),
      factory_(std::move(factory)),
      catalog_(std::move(catalog)),
      streamer_(std::move(streamer)) {
  if (!factory_) {
    throw util::InvalidState("worker supervisor requires a worker factory");
  }
}

WorkerSupervisor::~WorkerSupervisor() {
  Shutdown();
}

void WorkerSupervisor::Start() {
  if (started_.exchange(true)) {
    throw util::InvalidState("worker supervisor already started");
  }

  monitor_thread_ = std::thread(&WorkerSupervisor::MonitorLoop, this);

  if (!options_.start_camera_workers) {
    SNAPSHOT_LOG_INFO("Camera worker bootstrap disabled");
    return;
  }

  {
    std::lock_guard lock(bootstrap_mutex_);
    bootstrap_done_ = false;
  }
  bootstrap_thread_ = std::thread(&WorkerSupervisor::RunBootstrap, this);
}

void WorkerSupervisor::Shutdown() {
  if (shutting_down_.exchange(true)) return;

  if (bootstrap_thread_.joinable()) bootstrap_thread_.join();

  restarts_.Shutdown();
  if (monitor_thread_.joinable()) monitor_thread_.join();

  // Workers are stopped outside their entry locks: a handler running on a
  // worker thread may be waiting for one of them.
  std::vector<std::shared_ptr<worker::Worker>> workers;
  for (const auto& entry : registry_.Entries()) {
    std::lock_guard lock(entry->mutex);
    if (entry->removed) continue;
    entry->removed = true;
    Transition(*entry, WorkerState::kStopped);
    if (entry->worker) workers.push_back(std::move(entry->worker));
  }
  registry_.Clear();

  for (const auto& worker : workers) {
    worker->Stop();
  }
}

void WorkerSupervisor::RunBootstrap() {
  try {
    const auto started = InitiateWorkers();
    SNAPSHOT_LOG_INFO("Camera worker bootstrap finished", {IntField("started", static_cast<std::int64_t>(started))});
  } catch (const std::exception& e) {
    SNAPSHOT_LOG_ERROR("Camera worker bootstrap failed", {StringField("error", e.what())});
  } catch (...) {
    SNAPSHOT_LOG_ERROR("Camera worker bootstrap failed", {StringField("error", "unknown exception")});
  }

  {
    std::lock_guard lock(bootstrap_mutex_);
    bootstrap_done_ = true;
  }
  bootstrap_cv_.notify_all();
}

bool WorkerSupervisor::WaitForBootstrap(std::chrono::milliseconds timeout) {
  std::unique_lock lock(bootstrap_mutex_);
  return bootstrap_cv_.wait_for(lock, timeout, [&] { return bootstrap_done_; });
}

std::size_t WorkerSupervisor::InitiateWorkers() {
  SNAPSHOT_LOG_INFO("Initiate workers for snapshot recording");
  if (!catalog_) {
    throw util::CatalogUnavailable("no camera catalog configured");
  }

  std::size_t started = 0;
  for (const auto& camera : catalog_->ListAll()) {
    if (shutting_down_) break;
    if (StartWorker(camera) == StartOutcome::kStarted) ++started;
  }
  return started;
}

StartOutcome WorkerSupervisor::StartWorker(const std::optional<model::Camera>& camera) {
  if (!camera) return StartOutcome::kAbsent;
  if (shutting_down_) return StartOutcome::kShuttingDown;

  auto resolved = ConfigResolver::Resolve(*camera, pipeline_);
  if (!resolved) {
    ++skipped_starts_;
    SNAPSHOT_LOG_WARN("Skipping camera worker as the host is invalid",
                      {CameraField(camera->exid), StringField("reason", resolved.Error().message), StringField("url", resolved.Error().value)});
    return StartOutcome::kSkipped;
  }

  const auto& config = resolved.Config();
  auto        claim  = registry_.TryClaim(config.identity);
  if (!claim) {
    SNAPSHOT_LOG_DEBUG("Worker already started", {CameraField(config.identity)});
    return StartOutcome::kAlreadyStarted;
  }

  auto& entry = *claim->entry;
  SNAPSHOT_LOG_DEBUG("Starting worker", {CameraField(config.identity)});

  entry.config = config;
  entry.events = std::make_shared<events::EventManager>(config.identity);
  entry.events->SubscribeAll(pipeline_);

  try {
    SpawnLocked(entry);
  } catch (const std::exception& e) {
    SNAPSHOT_LOG_ERROR("Failed to start worker", {CameraField(config.identity), StringField("error", e.what())});
    RemoveLocked(claim->entry);
    return StartOutcome::kFailed;
  } catch (...) {
    SNAPSHOT_LOG_ERROR("Failed to start worker", {CameraField(config.identity), StringField("error", "unknown exception")});
    RemoveLocked(claim->entry);
    return StartOutcome::kFailed;
  }

  return StartOutcome::kStarted;
}

UpdateOutcome WorkerSupervisor::UpdateWorker(const std::string& identity, const model::Camera& camera) {
  auto resolved = ConfigResolver::Resolve(camera, pipeline_);
  if (!resolved) {
    SNAPSHOT_LOG_INFO("Skipping camera worker update as the host is invalid",
                      {CameraField(identity), StringField("reason", resolved.Error().message), StringField("url", resolved.Error().value)});
    return UpdateOutcome::kSkipped;
  }

  // The identity is fixed for the worker's lifetime, even if the
  // camera's exid changed underneath it.
  auto config     = resolved.Config();
  config.identity = identity;

  auto entry = registry_.Find(identity);
  if (!entry) {
    SNAPSHOT_LOG_WARN("No worker to update", {CameraField(identity)});
    return UpdateOutcome::kNotFound;
  }

  SNAPSHOT_LOG_INFO("Updating worker", {CameraField(identity)});

  if (streamer_) {
    try {
      streamer_->RestartStreamer(camera.exid);
    } catch (const std::exception& e) {
      SNAPSHOT_LOG_WARN("Streamer restart failed", {CameraField(camera.exid), StringField("error", e.what())});
    }
  }

  std::lock_guard lock(entry->mutex);
  if (entry->removed) return UpdateOutcome::kNotFound;

  entry->config = config;
  // A crashed worker picks the new config up when it is restarted.
  if (entry->worker && entry->state == WorkerState::kRunning) {
    entry->worker->UpdateConfig(entry->config);
  }
  return UpdateOutcome::kUpdated;
}

bool WorkerSupervisor::StopWorker(const std::string& identity) {
  auto entry = registry_.Find(identity);
  if (!entry) return false;

  std::shared_ptr<worker::Worker> retired;
  {
    std::lock_guard lock(entry->mutex);
    if (entry->removed) return false;

    SNAPSHOT_LOG_INFO("Stopping worker", {CameraField(identity), StringField("state", model::ToString(entry->state))});
    retired = RemoveLocked(entry);
  }

  // May run on the worker's own thread when a handler stops its camera.
  if (retired) retired->Stop();
  return true;
}

void WorkerSupervisor::SpawnLocked(WorkerEntry& entry) {
  ++entry.generation;

  worker::WorkerContext context;
  context.events     = entry.events;
  context.generation = entry.generation;
  context.on_crash   = [this](const std::string& identity, std::uint64_t generation, const std::string& reason) {
    OnWorkerCrash(identity, generation, reason);
  };

  auto worker = factory_(entry.config, std::move(context));
  if (!worker) {
    throw util::InvalidState("worker factory returned no worker for " + entry.identity);
  }

  entry.worker = std::move(worker);
  entry.worker->Start();
  Transition(entry, WorkerState::kRunning);
}

std::shared_ptr<worker::Worker> WorkerSupervisor::RemoveLocked(const std::shared_ptr<WorkerEntry>& entry) {
  entry->removed = true;
  Transition(*entry, WorkerState::kStopped);
  registry_.Erase(entry->identity, entry);
  return std::move(entry->worker);
}

void WorkerSupervisor::OnWorkerCrash(const std::string& identity, std::uint64_t generation, const std::string& reason) {
  // Runs on the crashing worker's thread: only queue, never take the entry lock.
  RestartTask task;
  task.identity   = identity;
  task.generation = generation;
  task.reason     = reason;
  task.not_before = RestartTask::Clock::now() + options_.restart_backoff;

  if (!restarts_.Enqueue(std::move(task))) {
    SNAPSHOT_LOG_DEBUG("Dropping restart during shutdown", {CameraField(identity)});
  }
}

void WorkerSupervisor::MonitorLoop() {
  while (auto task = restarts_.Dequeue()) {
    try {
      HandleRestart(*task);
    } catch (const std::exception& e) {
      SNAPSHOT_LOG_ERROR("Restart handling failed", {CameraField(task->identity), StringField("error", e.what())});
    } catch (...) {
      SNAPSHOT_LOG_ERROR("Restart handling failed", {CameraField(task->identity), StringField("error", "unknown exception")});
    }
  }
}

bool WorkerSupervisor::RestartBudgetExhaustedLocked(WorkerEntry& entry) {
  const auto now = std::chrono::steady_clock::now();
  entry.restart_times.push_back(now);
  while (!entry.restart_times.empty() && now - entry.restart_times.front() > options_.max_seconds) {
    entry.restart_times.pop_front();
  }
  return entry.restart_times.size() > options_.max_restarts;
}

void WorkerSupervisor::HandleRestart(const RestartTask& task) {
  auto entry = registry_.Find(task.identity);
  if (!entry) return;

  std::lock_guard lock(entry->mutex);
  if (entry->removed || entry->generation != task.generation || shutting_down_) return;

  Transition(*entry, WorkerState::kCrashed);

  if (RestartBudgetExhaustedLocked(*entry)) {
    SNAPSHOT_LOG_ERROR("Restart budget exhausted, stopping worker",
                       {CameraField(entry->identity), IntField("restarts", static_cast<std::int64_t>(entry->restarts)),
                        StringField("reason", task.reason)});
    // crashed: its thread runs no more handlers, so joining here is safe
    if (auto retired = RemoveLocked(entry)) retired->Stop();
    return;
  }

  Transition(*entry, WorkerState::kRestarting);
  if (entry->worker) entry->worker->Stop();
  ++entry->restarts;

  SNAPSHOT_LOG_WARN("Restarting worker", {CameraField(entry->identity), IntField("restarts", static_cast<std::int64_t>(entry->restarts)),
                                          StringField("reason", task.reason)});

  try {
    SpawnLocked(*entry);
  } catch (const std::exception& e) {
    Transition(*entry, WorkerState::kCrashed);
    SNAPSHOT_LOG_ERROR("Worker restart failed", {CameraField(entry->identity), StringField("error", e.what())});
    OnWorkerCrash(entry->identity, entry->generation, e.what());
  } catch (...) {
    Transition(*entry, WorkerState::kCrashed);
    SNAPSHOT_LOG_ERROR("Worker restart failed", {CameraField(entry->identity), StringField("error", "unknown exception")});
    OnWorkerCrash(entry->identity, entry->generation, "unknown exception");
  }
}

std::shared_ptr<worker::Worker> WorkerSupervisor::Find(const std::string& identity) const {
  auto entry = registry_.Find(identity);
  if (!entry) return nullptr;
  std::lock_guard lock(entry->mutex);
  return entry->removed ? nullptr : entry->worker;
}

std::optional<model::WorkerState> WorkerSupervisor::StateOf(const std::string& identity) const {
  auto entry = registry_.Find(identity);
  if (!entry) return std::nullopt;
  std::lock_guard lock(entry->mutex);
  return entry->state;
}

std::optional<std::uint64_t> WorkerSupervisor::RestartCount(const std::string& identity) const {
  auto entry = registry_.Find(identity);
  if (!entry) return std::nullopt;
  std::lock_guard lock(entry->mutex);
  return entry->restarts;
}

std::vector<std::string> WorkerSupervisor::Identities() const {
  return registry_.Identities();
}

std::size_t WorkerSupervisor::Size() const {
  return registry_.Size();
}

} // namespace snapshot::supervisor
