#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/events/event_manager.hpp"
#include "internal/model/worker_state.hpp"
#include "internal/resolver/worker_config.hpp"
#include "internal/worker/worker.hpp"

namespace snapshot::supervisor {

/*
  Supervisor-side record of one camera identity.

  All fields except `identity` are guarded by `mutex`, which serializes
  start, update, crash-restart and stop for this identity only.
*/
struct WorkerEntry {
  explicit WorkerEntry(std::string id) : identity(std::move(id)) {
  }

  const std::string identity;

  std::mutex mutex;

  resolver::WorkerConfig                config;
  std::shared_ptr<worker::Worker>       worker;
  std::shared_ptr<events::EventManager> events;
  model::WorkerState                    state      = model::WorkerState::kStarting;
  std::uint64_t                         generation = 0;
  std::uint64_t                         restarts   = 0;
  // Restart instants inside the current intensity window.
  std::deque<std::chrono::steady_clock::time_point> restart_times;
  // Set once the entry has left the registry; late restarts must ignore it.
  bool removed = false;
};

/*
  identity -> WorkerEntry

  The map is the only state shared by all identities. Lookups take a
  shared lock; inserts and erases take it exclusively and never block on
  a per-identity mutex that someone else may hold.
*/
class WorkerRegistry {
 public:
  struct Claim {
    std::shared_ptr<WorkerEntry> entry;
    std::unique_lock<std::mutex> lock;
  };

  // Publishes a new entry with its mutex already held by the caller, or
  // nullopt if the identity is taken.
  std::optional<Claim> TryClaim(const std::string& identity);

  std::shared_ptr<WorkerEntry> Find(const std::string& identity) const;

  // Erases only if the registered entry is still `expected`.
  bool Erase(const std::string& identity, const std::shared_ptr<WorkerEntry>& expected);

  std::vector<std::shared_ptr<WorkerEntry>> Entries() const;
  std::vector<std::string>                  Identities() const;
  std::size_t                               Size() const;

  void Clear();

 private:
  mutable std::shared_mutex                                     mutex_;
  std::unordered_map<std::string, std::shared_ptr<WorkerEntry>> entries_;
};

} // namespace snapshot::supervisor
