#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/camera_catalog.hpp"
#include "internal/events/event_handler_pipeline.hpp"
#include "internal/model/camera.hpp"
#include "internal/model/worker_state.hpp"
#include "internal/streaming/streamer_control.hpp"
#include "internal/worker/worker.hpp"
#include "restart_queue.hpp"
#include "worker_registry.hpp"

namespace snapshot::supervisor {

struct SupervisorOptions {
  // Run InitiateWorkers on a background thread from Start().
  bool start_camera_workers = false;

  // Restart intensity: more than max_restarts crashes of one identity
  // within max_seconds stops that identity.
  std::uint32_t             max_restarts = 1'000'000;
  std::chrono::seconds      max_seconds{5};
  std::chrono::milliseconds restart_backoff{0};
};

enum class StartOutcome {
  kStarted,
  kAbsent,         // no camera given
  kSkipped,        // configuration could not be resolved
  kAlreadyStarted, // identity already supervised; running worker kept
  kFailed,         // the worker could not be created
  kShuttingDown,
};

enum class UpdateOutcome {
  kUpdated,
  kSkipped,  // configuration could not be resolved; old config kept
  kNotFound, // identity not supervised
};

/*
  WorkerSupervisor

  Owns one polling worker per camera, keyed by the camera's external id.
  Each worker is subscribed to the process-wide handler pipeline before it
  starts. A crashing worker is restarted on its own with the latest config
  and the same subscriptions; other identities are never touched.

  Registry mutations for one identity are serialized by that identity's
  entry lock. Different identities proceed in parallel.
*/
class WorkerSupervisor {
 public:
  WorkerSupervisor(SupervisorOptions options, events::EventHandlerPipeline pipeline, worker::WorkerFactory factory,
                   std::shared_ptr<catalog::CameraCatalog> catalog, std::shared_ptr<streaming::StreamerControl> streamer);
  ~WorkerSupervisor();

  WorkerSupervisor(const WorkerSupervisor&)            = delete;
  WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

  // Starts the restart monitor, then the bulk bootstrap if enabled.
  void Start();
  void Shutdown();

  StartOutcome  StartWorker(const std::optional<model::Camera>& camera);
  UpdateOutcome UpdateWorker(const std::string& identity, const model::Camera& camera);
  bool          StopWorker(const std::string& identity);

  // Starts a worker for every catalog camera. Returns how many were
  // started. util::CatalogUnavailable propagates.
  std::size_t InitiateWorkers();

  // true once the background bootstrap has finished (or was never enabled).
  bool WaitForBootstrap(std::chrono::milliseconds timeout);

  std::shared_ptr<worker::Worker>   Find(const std::string& identity) const;
  std::optional<model::WorkerState> StateOf(const std::string& identity) const;
  std::optional<std::uint64_t>      RestartCount(const std::string& identity) const;
  std::vector<std::string>          Identities() const;
  std::size_t                       Size() const;

  std::uint64_t SkippedStarts() const {
    return skipped_starts_.load();
  }

  const events::EventHandlerPipeline& Pipeline() const {
    return pipeline_;
  }

 private:
  void OnWorkerCrash(const std::string& identity, std::uint64_t generation, const std::string& reason);
  void MonitorLoop();
  void HandleRestart(const RestartTask& task);
  void RunBootstrap();

  // entry->mutex must be held
  void SpawnLocked(WorkerEntry& entry);
  bool RestartBudgetExhaustedLocked(WorkerEntry& entry);
  // Unregisters the entry and hands back its worker; the caller stops it.
  std::shared_ptr<worker::Worker> RemoveLocked(const std::shared_ptr<WorkerEntry>& entry);

  const SupervisorOptions                     options_;
  const events::EventHandlerPipeline          pipeline_;
  worker::WorkerFactory                       factory_;
  std::shared_ptr<catalog::CameraCatalog>     catalog_;
  std::shared_ptr<streaming::StreamerControl> streamer_;

  WorkerRegistry registry_;
  RestartQueue   restarts_;

  std::atomic<bool>          started_{false};
  std::atomic<bool>          shutting_down_{false};
  std::atomic<std::uint64_t> skipped_starts_{0};

  std::thread monitor_thread_;
  std::thread bootstrap_thread_;

  std::mutex              bootstrap_mutex_;
  std::condition_variable bootstrap_cv_;
  bool                    bootstrap_done_ = true;
};

} // namespace snapshot::supervisor
