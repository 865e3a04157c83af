#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace projsync::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, std::chrono::milliseconds lock_timeout, Access access)
    : repo_(repo), lock_(repo.write_mutex_, std::defer_lock) {
  if (access == Access::kReadOnly) {
    snapshot_ = repo_.Snapshot();
    return;
  }
  if (!lock_.try_lock_for(lock_timeout)) {
    throw util::StoreUnavailable("memory store lock not acquired within " + std::to_string(lock_timeout.count()) + "ms");
  }
  working_ = *repo_.Snapshot(); // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (snapshot_) {
    throw std::logic_error("write in a read-only memory transaction");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (committed_) {
    throw std::logic_error("transaction already finished");
  }
  committed_ = true;
  if (snapshot_) {
    snapshot_.reset();
    return;
  }
  repo_.Publish(std::move(working_));
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  committed_ = true;
  snapshot_.reset();
  if (lock_.owns_lock()) {
    lock_.unlock();
  }
}

} // namespace projsync::db::memory
