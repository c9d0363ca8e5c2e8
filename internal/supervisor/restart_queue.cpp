#include "restart_queue.hpp"

#include <utility>

namespace snapshot::supervisor {

bool RestartQueue::Enqueue(RestartTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<RestartTask> RestartQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  while (true) {
    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
    if (shutdown_) return std::nullopt;

    const auto due = queue_.top().not_before;
    if (due <= RestartTask::Clock::now()) break;

    // woken early by shutdown or by a task due sooner
    cv_.wait_until(lock, due);
  }

  RestartTask task = queue_.top();
  queue_.pop();
  return task;
}

void RestartQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t RestartQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace snapshot::supervisor
