#pragma once

#include <functional>
#include <thread>

#include "key_scheduler.hpp"

namespace projsync::sync {

/*
  Background worker pulling tasks off the key scheduler.

  Each task runs through the handler, then its key is released so the
  next event for that key can be picked up.
*/
class SyncWorker {
 public:
  using Handler = std::function<void(SyncTask)>;

  SyncWorker(KeyScheduler& scheduler, Handler handler);
  ~SyncWorker();

  SyncWorker(const SyncWorker&)            = delete;
  SyncWorker& operator=(const SyncWorker&) = delete;

  void Start();

  // Returns once the scheduler is shut down and drained.
  void Join();

 private:
  void Run();

  KeyScheduler& scheduler_;
  Handler       handler_;
  std::thread   thread_;
};

} // namespace projsync::sync
