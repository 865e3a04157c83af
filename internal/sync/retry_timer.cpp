#include "retry_timer.hpp"

#include "internal/observability/logging.hpp"

namespace projsync::sync {

RetryTimer::RetryTimer() : thread_(&RetryTimer::Run, this) {
}

RetryTimer::~RetryTimer() {
  Stop();
}

void RetryTimer::Schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
  {
    std::lock_guard lock(mutex_);
    if (stopped_) return;
    entries_.push(Entry{Clock::now() + delay, next_id_++, std::move(fn)});
  }
  cv_.notify_one();
}

std::size_t RetryTimer::Pending() const {
  std::lock_guard lock(mutex_);
  return entries_.size() + firing_;
}

void RetryTimer::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (stopped_ && !thread_.joinable()) return;
    stopped_ = true;
    entries_ = {};
  }
  cv_.notify_all();
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void RetryTimer::Run() {
  std::unique_lock lock(mutex_);
  while (!stopped_) {
    if (entries_.empty()) {
      cv_.wait(lock, [&] { return stopped_ || !entries_.empty(); });
      continue;
    }

    const auto due = entries_.top().due;
    if (Clock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }

    auto fn = entries_.top().fn;
    entries_.pop();
    ++firing_;
    lock.unlock();
    try {
      fn();
    } catch (const std::exception& e) {
      PROJSYNC_LOG_ERROR("retry callback failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
    --firing_;
  }
}

} // namespace projsync::sync
