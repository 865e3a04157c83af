#include "internal/db/sqlite/sqlite_db.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace projsync;
using db::sqlite::SqliteDB;

std::string TempDbPath(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return (std::filesystem::temp_directory_path() / ("projsync_sqlite_db_" + name + "_" + std::to_string(stamp) + ".db")).string();
}

void RemoveDb(const std::string& path) {
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path + suffix);
  }
}

void TestMigrateRecordsSchemaVersion() {
  const auto path   = TempDbPath("migrate");
  const auto target = db::sql::SqliteSchema().size();
  {
    SqliteDB db(path);
    assert(db.SchemaVersion() == 0);
    assert(db.Migrate() == target);
    assert(db.SchemaVersion() == target);
    assert(db.Migrate() == target);
  }
  {
    // Reopening keeps the version, so nothing reruns.
    SqliteDB db(path);
    assert(db.SchemaVersion() == target);
    assert(db.Migrate() == target);
  }
  RemoveDb(path);
}

void TestNewerSchemaIsRefused() {
  const auto path = TempDbPath("newer");
  {
    SqliteDB db(path);
    db.Exec("PRAGMA user_version=999;");
    bool threw = false;
    try {
      db.Migrate();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
    assert(db.SchemaVersion() == 999);
  }
  RemoveDb(path);
}

void TestLockHeldByAnotherConnectionIsUnavailable() {
  const auto path = TempDbPath("busy");
  {
    auto holder = std::make_shared<SqliteDB>(path);
    holder->Migrate();
    auto waiter = std::make_shared<SqliteDB>(path, false, std::chrono::milliseconds(10));

    holder->Exec("BEGIN IMMEDIATE;");

    bool unavailable = false;
    try {
      waiter->Exec("BEGIN IMMEDIATE;");
    } catch (const util::StoreUnavailable&) {
      unavailable = true;
    }
    assert(unavailable);

    // A repository transaction on the waiting connection reports the same.
    db::sqlite::SqliteRepository repo(waiter);
    unavailable = false;
    try {
      auto tx = repo.Begin(std::chrono::milliseconds(10));
    } catch (const util::StoreUnavailable&) {
      unavailable = true;
    }
    assert(unavailable);

    holder->Exec("COMMIT;");
    auto tx = repo.Begin(std::chrono::milliseconds(10));
    tx->Rollback();
  }
  RemoveDb(path);
}

} // namespace

int main() {
  TestMigrateRecordsSchemaVersion();
  TestNewerSchemaIsRefused();
  TestLockHeldByAnotherConnectionIsUnavailable();

  std::cout << "projsync_unit_sqlite_db: pass\n";
  return 0;
}
