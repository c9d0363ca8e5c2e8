#include "worker_registry.hpp"

#include <algorithm>

namespace snapshot::supervisor {

std::optional<WorkerRegistry::Claim> WorkerRegistry::TryClaim(const std::string& identity) {
  std::unique_lock lock(mutex_);

  if (entries_.count(identity) != 0) return std::nullopt;

  auto entry = std::make_shared<WorkerEntry>(identity);
  // Fresh and unpublished, so this cannot block.
  std::unique_lock entry_lock(entry->mutex);
  entries_.emplace(identity, entry);

  return Claim{std::move(entry), std::move(entry_lock)};
}

std::shared_ptr<WorkerEntry> WorkerRegistry::Find(const std::string& identity) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(identity);
  return it == entries_.end() ? nullptr : it->second;
}

bool WorkerRegistry::Erase(const std::string& identity, const std::shared_ptr<WorkerEntry>& expected) {
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(identity);
  if (it == entries_.end() || it->second != expected) return false;
  entries_.erase(it);
  return true;
}

std::vector<std::shared_ptr<WorkerEntry>> WorkerRegistry::Entries() const {
  std::shared_lock lock(mutex_);

  std::vector<std::shared_ptr<WorkerEntry>> result;
  result.reserve(entries_.size());
  for (const auto& [identity, entry] : entries_) {
    result.push_back(entry);
  }
  return result;
}

std::vector<std::string> WorkerRegistry::Identities() const {
  std::vector<std::string> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& [identity, entry] : entries_) {
      result.push_back(identity);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::size_t WorkerRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void WorkerRegistry::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
}

} // namespace snapshot::supervisor
