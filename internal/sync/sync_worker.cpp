#include "sync_worker.hpp"

#include "internal/observability/logging.hpp"

namespace projsync::sync {

SyncWorker::SyncWorker(KeyScheduler& scheduler, Handler handler) : scheduler_(scheduler), handler_(std::move(handler)) {
}

SyncWorker::~SyncWorker() {
  Join();
}

void SyncWorker::Start() {
  thread_ = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void SyncWorker::Run() {
  for (;;) {
    auto task = scheduler_.Dequeue();
    if (!task) break;

    const auto key = task->event.Key();
    try {
      handler_(std::move(*task));
    } catch (const std::exception& e) {
      PROJSYNC_LOG_ERROR("sync task failed", {observability::IntField("key", key), observability::StringField("error", e.what())});
    }
    scheduler_.Complete(key);
  }
}

} // namespace projsync::sync
