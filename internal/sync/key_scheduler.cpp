#include "key_scheduler.hpp"

namespace projsync::sync {

void KeyScheduler::Enqueue(SyncTask task) {
  {
    std::lock_guard lock(mutex_);
    const auto key   = task.event.Key();
    auto&      queue = queues_[key];
    const bool idle  = queue.empty() && !claimed_.contains(key);
    queue.push_back(std::move(task));
    ++queued_;
    if (idle) {
      ready_.push_back(key);
    }
  }
  cv_.notify_one();
}

std::optional<SyncTask> KeyScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !ready_.empty(); });

  if (ready_.empty()) return std::nullopt;

  const auto key = ready_.front();
  ready_.pop_front();
  claimed_.insert(key);

  auto it   = queues_.find(key);
  auto task = std::move(it->second.front());
  it->second.pop_front();
  if (it->second.empty()) {
    queues_.erase(it);
  }
  --queued_;
  return task;
}

void KeyScheduler::Complete(model::RowKey key) {
  bool ready = false;
  {
    std::lock_guard lock(mutex_);
    claimed_.erase(key);
    if (queues_.contains(key)) {
      ready_.push_back(key);
      ready = true;
    }
  }
  if (ready) {
    cv_.notify_one();
  }
}

bool KeyScheduler::AnyQueued(model::RowKey key, const std::function<bool(const SyncTask&)>& pred) const {
  std::lock_guard lock(mutex_);
  auto            it = queues_.find(key);
  if (it == queues_.end()) return false;
  for (const auto& task : it->second) {
    if (pred(task)) return true;
  }
  return false;
}

std::size_t KeyScheduler::Queued() const {
  std::lock_guard lock(mutex_);
  return queued_;
}

std::size_t KeyScheduler::InFlight() const {
  std::lock_guard lock(mutex_);
  return claimed_.size();
}

void KeyScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace projsync::sync
