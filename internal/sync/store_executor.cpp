#include "store_executor.hpp"

#include <stdexcept>

namespace projsync::sync {

StoreExecutor::StoreExecutor(std::size_t threads) {
  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&StoreExecutor::Run, this);
  }
}

StoreExecutor::~StoreExecutor() {
  Stop();
}

void StoreExecutor::Post(std::function<void()> job) {
  {
    std::lock_guard lock(mutex_);
    if (stopped_) {
      throw std::runtime_error("store executor stopped");
    }
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void StoreExecutor::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void StoreExecutor::Run() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopped_ || !jobs_.empty(); });
      if (jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    // packaged_task stores exceptions in the future
    job();
  }
}

} // namespace projsync::sync
