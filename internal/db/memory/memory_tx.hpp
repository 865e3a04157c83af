#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace projsync::db::memory {

/*
  Read-write transaction = exclusive lock + snapshot copy.
  Read-only transaction = shared committed snapshot, no lock.

  The repository lock is held for the whole read-write transaction, so
  commit never conflicts. Readers never wait on it.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  enum class Access { kReadWrite, kReadOnly };

  MemoryTransaction(MemoryRepository& repo, std::chrono::milliseconds lock_timeout, Access access);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Throws std::logic_error in a read-only transaction.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return snapshot_ ? *snapshot_ : working_;
  }

 private:
  MemoryRepository&                              repo_;
  std::unique_lock<std::timed_mutex>             lock_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  MemoryRepository::State                        working_;
  bool                                           committed_ = false;
};

} // namespace projsync::db::memory
