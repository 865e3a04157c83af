#include "sqlite_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::chrono::milliseconds lock_timeout)
    : db_(std::move(db)), lock_(db_->WriteMutex(), std::defer_lock) {
  if (!lock_.try_lock_for(lock_timeout)) {
    throw util::StoreUnavailable("sqlite write lock not acquired within " + std::to_string(lock_timeout.count()) + "ms");
  }
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const std::exception& e) {
    throw util::StoreUnavailable(std::string("sqlite begin failed: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      PROJSYNC_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  committed_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace projsync::db::sqlite
