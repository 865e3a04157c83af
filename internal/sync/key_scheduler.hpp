#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "sync_task.hpp"

namespace projsync::sync {

/*
  Thread-safe blocking queue with per-key FIFO.

  A key is claimed by the worker that dequeues it and stays claimed until
  Complete(). Tasks for a claimed key wait in its queue, so each key is
  handled by one worker at a time while different keys run concurrently.
*/
class KeyScheduler {
 public:
  void Enqueue(SyncTask task);

  // blocking wait; claims the task's key
  std::optional<SyncTask> Dequeue();

  // Releases the key claimed by Dequeue().
  void Complete(model::RowKey key);

  // true if a task still queued for key satisfies pred
  bool AnyQueued(model::RowKey key, const std::function<bool(const SyncTask&)>& pred) const;

  std::size_t Queued() const;
  std::size_t InFlight() const;

  // Workers drain what is queued, then Dequeue() returns nullopt.
  void Shutdown();

 private:
  mutable std::mutex                                       mutex_;
  std::condition_variable                                  cv_;
  std::unordered_map<model::RowKey, std::deque<SyncTask>>  queues_;
  std::deque<model::RowKey>                                ready_;
  std::unordered_set<model::RowKey>                        claimed_;
  std::size_t                                              queued_   = 0;
  bool                                                     shutdown_ = false;
};

} // namespace projsync::sync
