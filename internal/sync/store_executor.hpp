#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace projsync::sync {

/*
  Fixed pool that runs projection store writes.

  Sync workers hand writes here and wait on the future with a deadline,
  so a stuck store turns into a timeout instead of a stuck worker. A
  write that outlives its deadline still finishes here.
*/
class StoreExecutor {
 public:
  explicit StoreExecutor(std::size_t threads);
  ~StoreExecutor();

  StoreExecutor(const StoreExecutor&)            = delete;
  StoreExecutor& operator=(const StoreExecutor&) = delete;

  template <typename Fn>
  auto Submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using R   = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut  = task->get_future();
    Post([task] { (*task)(); });
    return fut;
  }

  // Runs what is queued, then joins.
  void Stop();

 private:
  void Post(std::function<void()> job);
  void Run();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::deque<std::function<void()>> jobs_;
  bool                              stopped_ = false;
  std::vector<std::thread>          threads_;
};

} // namespace projsync::sync
