#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projsync::db::sqlite {

namespace {

bool IsContention(int rc) {
  const int primary = rc & 0xFF;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc == SQLITE_OK) return;
  const std::string msg = std::string(what) + ": " + sqlite3_errmsg(db);
  if (IsContention(rc)) throw util::StoreUnavailable(msg);
  throw std::runtime_error(msg);
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("sqlite open '" + path_ + "': " + msg);
  }

  try {
    Configure(wal_mode, busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (IsContention(rc)) throw util::StoreUnavailable("sqlite busy: " + msg);
    throw std::runtime_error(msg);
  }
}

std::size_t SqliteDB::SchemaVersion() {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr), db_, "sqlite user_version");
  std::size_t version = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return version;
}

std::size_t SqliteDB::Migrate() {
  std::lock_guard lock(write_mutex_);

  const auto from = SchemaVersion();
  const auto& schema = sql::SqliteSchema();
  if (from == schema.size()) return from;

  Exec("BEGIN IMMEDIATE;");
  std::size_t to = from;
  try {
    to = sql::RunMigrations(*this, schema, from);
    // PRAGMA takes no bound parameters.
    Exec("PRAGMA user_version=" + std::to_string(to) + ";");
    Exec("COMMIT;");
  } catch (...) {
    try {
      Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      PROJSYNC_LOG_WARN("sqlite migration rollback failed", {observability::StringField("error", e.what())});
    }
    throw;
  }

  PROJSYNC_LOG_INFO("sqlite schema migrated", {observability::StringField("path", path_),
                                               observability::IntField("from_version", static_cast<int64_t>(from)),
                                               observability::IntField("to_version", static_cast<int64_t>(to))});
  return to;
}

void SqliteDB::Configure(bool wal_mode, std::chrono::milliseconds busy_timeout) {
  // WAL lets readers proceed while a writer holds the lock; :memory: ignores it
  if (wal_mode && path_ != ":memory:") {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; stat history cascades on cluster delete
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace projsync::db::sqlite
