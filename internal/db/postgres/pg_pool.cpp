#include "pg_pool.hpp"

#include <utility>

#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projsync::db::postgres {

namespace {

struct StatementDef {
  const char* name;
  const char* sql;
};

constexpr StatementDef kStatements[] = {
    {"get_base_row", "SELECT cluster_id, columns::text, version FROM base_rows WHERE cluster_id=$1"},
    {"insert_base_row", "INSERT INTO base_rows(cluster_id,columns,version) VALUES($1,$2::jsonb,$3) ON CONFLICT (cluster_id) DO NOTHING"},
    {"update_base_row", "UPDATE base_rows SET columns=$2::jsonb, version=$3 WHERE cluster_id=$1"},
    {"delete_base_row", "DELETE FROM base_rows WHERE cluster_id=$1"},
    {"next_sequence", "SELECT nextval('projsync_sequence')"},
    {"get_summary", "SELECT cluster_id,attributes::text,version,synced_at_ms,deleted_at_ms FROM derived_summary WHERE cluster_id=$1"},
    {"upsert_summary",
     "INSERT INTO derived_summary(cluster_id,attributes,version,synced_at_ms) VALUES($1,$2::jsonb,$3,$4) "
     "ON CONFLICT(cluster_id) DO UPDATE SET attributes=EXCLUDED.attributes, version=EXCLUDED.version, "
     "synced_at_ms=EXCLUDED.synced_at_ms, deleted_at_ms=NULL"},
    // An existing tombstone keeps its deleted_at so retention counts from the first delete.
    {"tombstone_summary",
     "INSERT INTO derived_summary(cluster_id,attributes,version,synced_at_ms,deleted_at_ms) VALUES($1,'{}'::jsonb,$2,$3,$3) "
     "ON CONFLICT (cluster_id) DO UPDATE SET version=EXCLUDED.version, "
     "deleted_at_ms=COALESCE(derived_summary.deleted_at_ms, EXCLUDED.deleted_at_ms)"},
    {"purge_summary_tombstones", "DELETE FROM derived_summary WHERE deleted_at_ms IS NOT NULL AND deleted_at_ms<$1"},
};

class WorkExecutor final : public sql::MigrationExecutor {
 public:
  explicit WorkExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire(std::chrono::milliseconds wait) {
  const auto deadline = std::chrono::steady_clock::now() + wait;

  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();
      return Open();
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
    if (!ready) {
      throw util::StoreUnavailable("postgres pool exhausted: no connection free within " + std::to_string(wait.count()) + "ms (" +
                                   std::to_string(max_connections_) + " open)");
    }
  }
}

std::size_t PgPool::LiveConnections() {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

std::shared_ptr<pqxx::connection> PgPool::Open() {
  // The slot is already counted; give it back on failure.
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const pqxx::broken_connection& e) {
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw util::StoreUnavailable(std::string("postgres connection failed: ") + e.what());
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

std::size_t PgPool::Migrate() {
  // Pooled connections prepare statements against the schema, so migrate
  // on a dedicated connection first.
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS projsync_schema_version (id INTEGER PRIMARY KEY CHECK (id = 1), version BIGINT NOT NULL)");
  // Concurrent starters apply each entry once.
  tx.exec("LOCK TABLE projsync_schema_version IN EXCLUSIVE MODE");

  auto        current = tx.exec("SELECT version FROM projsync_schema_version WHERE id=1");
  std::size_t from    = current.empty() ? 0 : current[0][0].as<std::size_t>();

  WorkExecutor executor(tx);
  const auto   to = sql::RunMigrations(executor, sql::PostgresSchema(), from);
  tx.exec_params("INSERT INTO projsync_schema_version(id,version) VALUES(1,$1) ON CONFLICT (id) DO UPDATE SET version=EXCLUDED.version",
                 static_cast<int64_t>(to));
  tx.commit();

  if (to != from) {
    PROJSYNC_LOG_INFO("postgres schema migrated",
                      {observability::IntField("from_version", static_cast<int64_t>(from)), observability::IntField("to_version", static_cast<int64_t>(to))});
  }
  return to;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  for (const auto& statement : kStatements) {
    conn.prepare(statement.name, statement.sql);
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  if (owned) {
    PROJSYNC_LOG_WARN("dropping closed postgres connection");
  }
  cv_.notify_one();
}

} // namespace projsync::db::postgres
