#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace projsync::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; WriteMutex() serializes
  them so a BEGIN IMMEDIATE block is never interleaved with another
  thread's statements. Another process holding the file lock is waited
  on for busy_timeout, after which statements throw StoreUnavailable.

  The schema version lives in PRAGMA user_version.
*/
class SqliteDB : public sql::MigrationExecutor {
 public:
  static constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};

  explicit SqliteDB(std::string path, bool wal_mode = true, std::chrono::milliseconds busy_timeout = kDefaultBusyTimeout);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::timed_mutex& WriteMutex() {
    return write_mutex_;
  }

  // Execute a SQL string. Lock contention throws util::StoreUnavailable.
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Number of schema entries applied to this file.
  std::size_t SchemaVersion();

  // Apply schema entries past SchemaVersion() in one transaction.
  // Returns the resulting version.
  std::size_t Migrate();

 private:
  void Configure(bool wal_mode, std::chrono::milliseconds busy_timeout);

  sqlite3*         db_ = nullptr;
  std::string      path_;
  std::timed_mutex write_mutex_;
};

} // namespace projsync::db::sqlite
