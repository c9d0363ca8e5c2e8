#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace snapshot::supervisor {

/*
  A pending restart of one crashed worker incarnation.
*/
struct RestartTask {
  using Clock = std::chrono::steady_clock;

  std::string       identity;
  std::uint64_t     generation = 0;
  std::string       reason;
  Clock::time_point not_before{};
};

/*
  Thread-safe blocking queue of restart requests, ordered by due time.

  Workers push from their own thread when they crash; the supervisor's
  monitor thread pops. Enqueue never blocks on supervisor state.
*/
class RestartQueue {
 public:
  // false after Shutdown()
  bool Enqueue(RestartTask task);

  // blocking wait until the earliest task is due; nullopt after Shutdown()
  std::optional<RestartTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  struct LaterFirst {
    bool operator()(const RestartTask& a, const RestartTask& b) const {
      return a.not_before > b.not_before;
    }
  };

  mutable std::mutex                                                   mutex_;
  std::condition_variable                                              cv_;
  std::priority_queue<RestartTask, std::vector<RestartTask>, LaterFirst> queue_;
  bool                                                                 shutdown_ = false;
};

} // namespace snapshot::supervisor
