#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace projsync::sync {

/*
  Single thread firing callbacks after a delay.

  Pending() counts scheduled callbacks plus the one running, so a caller
  waiting for quiescence never misses a retry between timer and queue.
*/
class RetryTimer {
 public:
  RetryTimer();
  ~RetryTimer();

  RetryTimer(const RetryTimer&)            = delete;
  RetryTimer& operator=(const RetryTimer&) = delete;

  void Schedule(std::chrono::milliseconds delay, std::function<void()> fn);

  std::size_t Pending() const;

  // Drops callbacks that have not fired yet.
  void Stop();

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    Clock::time_point     due;
    uint64_t              id;
    std::function<void()> fn;

    bool operator>(const Entry& other) const {
      return due != other.due ? due > other.due : id > other.id;
    }
  };

  void Run();

  mutable std::mutex                                               mutex_;
  std::condition_variable                                          cv_;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> entries_;
  uint64_t                                                         next_id_ = 0;
  std::size_t                                                      firing_  = 0;
  bool                                                             stopped_ = false;
  std::thread                                                      thread_;
};

} // namespace projsync::sync
