#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace projsync::db::sqlite {

/*
  SQLite transaction wrapper.

  Takes the connection's write mutex, then BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::chrono::milliseconds lock_timeout);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>          db_;
  std::unique_lock<std::timed_mutex> lock_;
  bool                               committed_ = false;
};

}
