#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <limits>
#include <string>
#include <stdexcept>

#include "internal/model/codec.hpp"
#include "internal/util/time.hpp"

namespace projsync::db::sqlite {

using projsync::db::ErrorCode;
using projsync::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  Statement(sqlite3* db, const std::string& sql) : Statement(db, sql.c_str()) {
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

  // Reads need a statement; failing to prepare one is not a missing row.
  sqlite3_stmt* Require() const {
    if (!st_) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    return st_;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ToMillis(projsync::model::TimePoint tp) {
  return static_cast<int64_t>(util::ToUnixMillis(tp));
}

// Column layout: key, attributes, version, synced_at_ms
projsync::model::DerivedRow ReadDerived(sqlite3_stmt* st) {
  projsync::model::DerivedRow row;
  row.key            = ColI64(st, 0);
  row.attributes     = projsync::model::ColumnsFromJson(ColText(st, 1));
  row.version        = ColU64(st, 2);
  row.last_synced_at = util::FromUnixMillis(ColI64(st, 3));
  return row;
}

const char* UpsertSql(ProjectionTable table) {
  switch (table) {
    case ProjectionTable::kInline:
      return "UPDATE base_rows SET derived=?2, derived_version=?3, derived_synced_at_ms=?4 WHERE cluster_id=?1;";
    case ProjectionTable::kIndexedView:
      return "INSERT INTO derived_view(cluster_id,attributes,version,synced_at_ms) VALUES(?1,?2,?3,?4) "
             "ON CONFLICT(cluster_id) DO UPDATE SET attributes=excluded.attributes, version=excluded.version, "
             "synced_at_ms=excluded.synced_at_ms;";
    case ProjectionTable::kSummary:
      return "INSERT INTO derived_summary(cluster_id,attributes,version,synced_at_ms,deleted_at_ms) VALUES(?1,?2,?3,?4,NULL) "
             "ON CONFLICT(cluster_id) DO UPDATE SET attributes=excluded.attributes, version=excluded.version, "
             "synced_at_ms=excluded.synced_at_ms, deleted_at_ms=NULL;";
  }
  return "";
}

const char* GetSql(ProjectionTable table) {
  switch (table) {
    case ProjectionTable::kInline:
      return "SELECT cluster_id,derived,derived_version,derived_synced_at_ms,NULL FROM base_rows "
             "WHERE cluster_id=? AND derived_version IS NOT NULL;";
    case ProjectionTable::kIndexedView:
      return "SELECT cluster_id,attributes,version,synced_at_ms,NULL FROM derived_view WHERE cluster_id=?;";
    case ProjectionTable::kSummary:
      return "SELECT cluster_id,attributes,version,synced_at_ms,deleted_at_ms FROM derived_summary WHERE cluster_id=?;";
  }
  return "";
}

// An open end bound includes the largest key.
std::string ScanSql(ProjectionTable table, bool end_bounded) {
  const std::string upper = end_bounded ? "cluster_id<?2" : "cluster_id<=?2";
  switch (table) {
    case ProjectionTable::kInline:
      return "SELECT cluster_id,derived,derived_version,derived_synced_at_ms FROM base_rows "
             "WHERE derived_version IS NOT NULL AND cluster_id>=?1 AND " + upper + " ORDER BY cluster_id LIMIT ?3;";
    case ProjectionTable::kIndexedView:
      return "SELECT cluster_id,attributes,version,synced_at_ms FROM derived_view "
             "WHERE cluster_id>=?1 AND " + upper + " ORDER BY cluster_id LIMIT ?3;";
    case ProjectionTable::kSummary:
      return "SELECT cluster_id,attributes,version,synced_at_ms FROM derived_summary "
             "WHERE deleted_at_ms IS NULL AND cluster_id>=?1 AND " + upper + " ORDER BY cluster_id LIMIT ?3;";
  }
  return "";
}

const char* RemoveSql(ProjectionTable table) {
  switch (table) {
    case ProjectionTable::kInline:
      return "UPDATE base_rows SET derived=NULL, derived_version=NULL, derived_synced_at_ms=NULL WHERE cluster_id=?;";
    case ProjectionTable::kIndexedView:
      return "DELETE FROM derived_view WHERE cluster_id=?;";
    case ProjectionTable::kSummary:
      return "DELETE FROM derived_summary WHERE cluster_id=?;";
  }
  return "";
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(std::chrono::milliseconds lock_timeout) {
  return std::make_unique<SqliteTransaction>(db_, lock_timeout);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::Ping() {
  Statement st(db_->Handle(), "SELECT 1;");
  if (!st) return Translate(db_->Handle(), sqlite3_errcode(db_->Handle()));
  return Translate(db_->Handle(), sqlite3_step(st.get()));
}

Result SqliteRepository::NextSequence(Transaction& t, uint64_t& sequence) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE projsync_sequence SET next_value=next_value+1 WHERE id=1 RETURNING next_value-1;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);
  sequence = ColU64(st.get(), 0);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Base relation
// ------------------------------------------------------------------

Result SqliteRepository::InsertBaseRow(Transaction& t, const model::BaseRowRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO base_rows(cluster_id,columns,version) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.row.key);
  BindText(st.get(), 2, projsync::model::ColumnsToJson(r.row.columns));
  BindU64(st.get(), 3, r.version);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  return Translate(db, rc);
}

Result SqliteRepository::UpdateBaseRow(Transaction& t, const model::BaseRowRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE base_rows SET columns=?, version=? WHERE cluster_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, projsync::model::ColumnsToJson(r.row.columns));
  BindU64(st.get(), 2, r.version);
  BindI64(st.get(), 3, r.row.key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::DeleteBaseRow(Transaction& t, int64_t key) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM base_rows WHERE cluster_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, key);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BaseRowRecord> SqliteRepository::GetBaseRow(Transaction& t, int64_t key) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT cluster_id,columns,version FROM base_rows WHERE cluster_id=?;");
  BindI64(st.Require(), 1, key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::BaseRowRecord r;
  r.row.key     = ColI64(st.get(), 0);
  r.row.columns = projsync::model::ColumnsFromJson(ColText(st.get(), 1));
  r.version     = ColU64(st.get(), 2);
  return r;
}

std::vector<int64_t> SqliteRepository::ListBaseKeys(Transaction& t, std::optional<int64_t> after, std::size_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT cluster_id FROM base_rows WHERE cluster_id>? ORDER BY cluster_id LIMIT ?;");
  BindI64(st.Require(), 1, after.value_or(std::numeric_limits<int64_t>::min()));
  BindU64(st.get(), 2, limit);

  std::vector<int64_t> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ColI64(st.get(), 0));
  }
  return out;
}

// ------------------------------------------------------------------
// Clusters
// ------------------------------------------------------------------

std::optional<model::ClusterRecord> SqliteRepository::FindClusterByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT cluster_id,cluster_name,environment,region,owner,description,is_active,last_updated_ms "
               "FROM clusters WHERE cluster_name=?;");
  BindText(st.Require(), 1, name);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ClusterRecord r;
  r.cluster_id      = ColI64(st.get(), 0);
  r.cluster_name    = ColText(st.get(), 1);
  r.environment     = ColOptText(st.get(), 2);
  r.region          = ColOptText(st.get(), 3);
  r.owner           = ColOptText(st.get(), 4);
  r.description     = ColOptText(st.get(), 5);
  r.is_active       = sqlite3_column_int(st.get(), 6) != 0;
  r.last_updated_ms = ColU64(st.get(), 7);
  return r;
}

Result SqliteRepository::UpsertCluster(Transaction& t, model::ClusterRecord& r) {
  auto* db = TX(t).Handle();

  if (r.last_updated_ms == 0) {
    r.last_updated_ms = util::ToUnixMillis(util::Now());
  }

  Statement st(db,
               "INSERT INTO clusters(cluster_name,environment,region,owner,description,is_active,last_updated_ms) "
               "VALUES(?,?,?,?,?,?,?) "
               "ON CONFLICT(cluster_name) DO UPDATE SET environment=excluded.environment, region=excluded.region, "
               "owner=excluded.owner, description=excluded.description, is_active=excluded.is_active, "
               "last_updated_ms=excluded.last_updated_ms "
               "RETURNING cluster_id;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.cluster_name);
  BindOptText(st.get(), 2, r.environment);
  BindOptText(st.get(), 3, r.region);
  BindOptText(st.get(), 4, r.owner);
  BindOptText(st.get(), 5, r.description);
  sqlite3_bind_int(st.get(), 6, r.is_active ? 1 : 0);
  BindU64(st.get(), 7, r.last_updated_ms);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);
  r.cluster_id = ColI64(st.get(), 0);
  return Result::Ok();
}

Result SqliteRepository::DeleteCluster(Transaction& t, int64_t cluster_id) {
  auto* db = TX(t).Handle();

  Statement history(db, "DELETE FROM cluster_stat_history WHERE cluster_id=?;");
  if (!history) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(history.get(), 1, cluster_id);
  if (auto r = Translate(db, sqlite3_step(history.get())); !r) return r;

  Statement st(db, "DELETE FROM clusters WHERE cluster_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, cluster_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::AppendClusterStat(Transaction& t, const model::ClusterStatRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO cluster_stat_history(cluster_id,timestamp_ms,stats) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.cluster_id);
  BindI64(st.get(), 2, r.timestamp_ms);
  BindText(st.get(), 3, projsync::model::ColumnsToJson(r.values));
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ClusterStatRecord> SqliteRepository::ListClusterStats(Transaction& t, int64_t cluster_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT cluster_id,timestamp_ms,stats FROM cluster_stat_history WHERE cluster_id=? ORDER BY rowid;");
  BindI64(st.Require(), 1, cluster_id);

  std::vector<model::ClusterStatRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::ClusterStatRecord r;
    r.cluster_id   = ColI64(st.get(), 0);
    r.timestamp_ms = ColI64(st.get(), 1);
    r.values       = projsync::model::ColumnsFromJson(ColText(st.get(), 2));
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDerived(Transaction& t, ProjectionTable table, const projsync::model::DerivedRow& row) {
  auto* db = TX(t).Handle();

  Statement st(db, UpsertSql(table));
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, row.key);
  BindText(st.get(), 2, projsync::model::ColumnsToJson(row.attributes));
  BindU64(st.get(), 3, row.version);
  BindI64(st.get(), 4, ToMillis(row.last_synced_at));

  int rc = sqlite3_step(st.get());
  if (table == ProjectionTable::kInline && rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound);
  }
  return Translate(db, rc);
}

std::optional<model::DerivedRowRecord> SqliteRepository::GetDerived(Transaction& t, ProjectionTable table, int64_t key) {
  auto* db = TX(t).Handle();

  Statement st(db, GetSql(table));
  BindI64(st.Require(), 1, key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::DerivedRowRecord r;
  r.row = ReadDerived(st.get());
  if (sqlite3_column_type(st.get(), 4) != SQLITE_NULL) {
    r.deleted_at = util::FromUnixMillis(ColI64(st.get(), 4));
  }
  return r;
}

Result SqliteRepository::RemoveDerived(Transaction& t, ProjectionTable table, int64_t key) {
  auto* db = TX(t).Handle();

  Statement st(db, RemoveSql(table));
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, key);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::TombstoneDerived(Transaction& t, int64_t key, uint64_t version, projsync::model::TimePoint at) {
  auto* db = TX(t).Handle();

  // An absent key still gets a tombstone so older upserts stay rejected.
  Statement st(db,
               "INSERT INTO derived_summary(cluster_id,attributes,version,synced_at_ms,deleted_at_ms) VALUES(?1,'{}',?2,?3,?3) "
               "ON CONFLICT(cluster_id) DO UPDATE SET version=excluded.version, "
               "deleted_at_ms=COALESCE(derived_summary.deleted_at_ms, excluded.deleted_at_ms);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, key);
  BindU64(st.get(), 2, version);
  BindI64(st.get(), 3, ToMillis(at));
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<projsync::model::DerivedRow> SqliteRepository::ScanDerived(Transaction& t, ProjectionTable table,
                                                                       const projsync::model::KeyRange& range,
                                                                       std::optional<int64_t> after, std::size_t limit) {
  auto* db = TX(t).Handle();

  int64_t lower = range.begin.value_or(std::numeric_limits<int64_t>::min());
  if (after && *after >= lower) {
    if (*after == std::numeric_limits<int64_t>::max()) return {};
    lower = *after + 1;
  }
  const int64_t upper = range.end.value_or(std::numeric_limits<int64_t>::max());

  Statement st(db, ScanSql(table, range.end.has_value()));
  BindI64(st.Require(), 1, lower);
  BindI64(st.get(), 2, upper);
  BindU64(st.get(), 3, limit);

  std::vector<projsync::model::DerivedRow> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadDerived(st.get()));
  }
  return out;
}

Result SqliteRepository::PurgeTombstones(Transaction& t, projsync::model::TimePoint older_than, uint64_t& purged) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM derived_summary WHERE deleted_at_ms IS NOT NULL AND deleted_at_ms<?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, ToMillis(older_than));

  int rc = sqlite3_step(st.get());
  purged = rc == SQLITE_DONE ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
  return Translate(db, rc);
}

} // namespace projsync::db::sqlite
