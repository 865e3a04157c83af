#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace projsync::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order, starting after the first `applied` entries,
  and returns the schema version reached (the number of entries).
  Backends persist that version so a restart only runs new entries.
  Every statement is still idempotent (CREATE ... IF NOT EXISTS).
*/

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql, std::size_t applied = 0);

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace projsync::db::sql
