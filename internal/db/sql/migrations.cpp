#include "migrations.hpp"

#include <stdexcept>

namespace projsync::db::sql {

std::size_t RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql, std::size_t applied) {
  if (applied > ordered_sql.size()) {
    throw std::runtime_error("schema version " + std::to_string(applied) + " is newer than this build (" +
                             std::to_string(ordered_sql.size()) + ")");
  }
  for (std::size_t i = applied; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration " + std::to_string(i) + " failed: " + e.what());
    }
  }
  return ordered_sql.size();
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS projsync_sequence (id INTEGER PRIMARY KEY CHECK (id = 1), next_value INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO projsync_sequence(id, next_value) VALUES(1, 1);",
      "CREATE TABLE IF NOT EXISTS clusters (cluster_id INTEGER PRIMARY KEY AUTOINCREMENT, cluster_name TEXT NOT NULL UNIQUE, environment TEXT, region TEXT, owner TEXT, description TEXT, is_active INTEGER NOT NULL DEFAULT 1, last_updated_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS base_rows (cluster_id INTEGER PRIMARY KEY, columns TEXT NOT NULL, version INTEGER NOT NULL, derived TEXT, derived_version INTEGER, derived_synced_at_ms INTEGER);",
      "CREATE TABLE IF NOT EXISTS cluster_stat_history (cluster_id INTEGER NOT NULL REFERENCES clusters(cluster_id) ON DELETE CASCADE, timestamp_ms INTEGER NOT NULL, stats TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS cluster_stat_history_cluster_ts ON cluster_stat_history(cluster_id, timestamp_ms);",
      "CREATE TABLE IF NOT EXISTS derived_view (cluster_id INTEGER PRIMARY KEY, attributes TEXT NOT NULL, version INTEGER NOT NULL, synced_at_ms INTEGER NOT NULL) WITHOUT ROWID;",
      "CREATE TABLE IF NOT EXISTS derived_summary (cluster_id INTEGER PRIMARY KEY, attributes TEXT NOT NULL, version INTEGER NOT NULL, synced_at_ms INTEGER NOT NULL, deleted_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS derived_summary_deleted ON derived_summary(deleted_at_ms) WHERE deleted_at_ms IS NOT NULL;",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE SEQUENCE IF NOT EXISTS projsync_sequence START 1;",
      "CREATE TABLE IF NOT EXISTS clusters (cluster_id BIGSERIAL PRIMARY KEY, cluster_name TEXT NOT NULL UNIQUE, environment TEXT, region TEXT, owner TEXT, description TEXT, is_active BOOLEAN NOT NULL DEFAULT TRUE, last_updated_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS base_rows (cluster_id BIGINT PRIMARY KEY, columns JSONB NOT NULL, version BIGINT NOT NULL, derived JSONB, derived_version BIGINT, derived_synced_at_ms BIGINT);",
      "CREATE TABLE IF NOT EXISTS cluster_stat_history (cluster_id BIGINT NOT NULL REFERENCES clusters(cluster_id) ON DELETE CASCADE, timestamp_ms BIGINT NOT NULL, stats JSONB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS cluster_stat_history_cluster_ts ON cluster_stat_history(cluster_id, timestamp_ms);",
      "CREATE TABLE IF NOT EXISTS derived_view (cluster_id BIGINT PRIMARY KEY, attributes JSONB NOT NULL, version BIGINT NOT NULL, synced_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS derived_summary (cluster_id BIGINT PRIMARY KEY, attributes JSONB NOT NULL, version BIGINT NOT NULL, synced_at_ms BIGINT NOT NULL, deleted_at_ms BIGINT);",
      "CREATE INDEX IF NOT EXISTS derived_summary_deleted ON derived_summary(deleted_at_ms) WHERE deleted_at_ms IS NOT NULL;",
  };
  return kSchema;
}

} // namespace projsync::db::sql
