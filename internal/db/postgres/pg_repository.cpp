#include "pg_repository.hpp"

#include <limits>

#include "internal/model/codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace projsync::db::postgres {

namespace {

constexpr std::chrono::milliseconds kPingWait{1000};

const char* TableName(ProjectionTable table) {
  return table == ProjectionTable::kIndexedView ? "derived_view" : "derived_summary";
}

int64_t ToMillis(projsync::model::TimePoint tp) {
  return static_cast<int64_t>(util::ToUnixMillis(tp));
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

// Column layout: key, attributes, version, synced_at_ms
projsync::model::DerivedRow ReadDerived(const pqxx::row& row) {
  projsync::model::DerivedRow r;
  r.key            = row[0].as<int64_t>();
  r.attributes     = projsync::model::ColumnsFromJson(row[1].c_str());
  r.version        = row[2].as<uint64_t>();
  r.last_synced_at = util::FromUnixMillis(row[3].as<int64_t>());
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(std::chrono::milliseconds lock_timeout) {
  return std::make_unique<PgTransaction>(pool_, lock_timeout);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const util::StoreUnavailable*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e); sql && sql->sqlstate() == "55P03") {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::Ping() {
  try {
    auto                 conn = pool_->Acquire(kPingWait);
    pqxx::nontransaction tx(*conn);
    tx.exec("SELECT 1");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::NextSequence(Transaction& t, uint64_t& sequence) {
  try {
    auto res = TX(t).Work().exec_prepared("next_sequence");
    sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Base relation
// ------------------------------------------------------------------

Result PgRepository::InsertBaseRow(Transaction& t, const model::BaseRowRecord& r) {
  try {
    // A raised unique violation would abort the caller's transaction.
    auto res = TX(t).Work().exec_prepared("insert_base_row", r.row.key, projsync::model::ColumnsToJson(r.row.columns), r.version);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateBaseRow(Transaction& t, const model::BaseRowRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_base_row", r.row.key, projsync::model::ColumnsToJson(r.row.columns), r.version);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteBaseRow(Transaction& t, int64_t key) {
  try {
    TX(t).Work().exec_prepared("delete_base_row", key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BaseRowRecord> PgRepository::GetBaseRow(Transaction& t, int64_t key) {
  auto res = TX(t).Work().exec_prepared("get_base_row", key);
  if (res.empty()) return std::nullopt;

  model::BaseRowRecord r;
  r.row.key     = res[0][0].as<int64_t>();
  r.row.columns = projsync::model::ColumnsFromJson(res[0][1].c_str());
  r.version     = res[0][2].as<uint64_t>();
  return r;
}

std::vector<int64_t> PgRepository::ListBaseKeys(Transaction& t, std::optional<int64_t> after, std::size_t limit) {
  auto res = TX(t).Work().exec_params("SELECT cluster_id FROM base_rows WHERE cluster_id>$1 ORDER BY cluster_id LIMIT $2;",
                                      after.value_or(std::numeric_limits<int64_t>::min()), static_cast<int64_t>(limit));

  std::vector<int64_t> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(row[0].as<int64_t>());
  }
  return out;
}

// ------------------------------------------------------------------
// Clusters
// ------------------------------------------------------------------

std::optional<model::ClusterRecord> PgRepository::FindClusterByName(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_params(
      "SELECT cluster_id,cluster_name,environment,region,owner,description,is_active,last_updated_ms FROM clusters WHERE cluster_name=$1;", name);
  if (res.empty()) return std::nullopt;

  const auto&          row = res[0];
  model::ClusterRecord r;
  r.cluster_id      = row[0].as<int64_t>();
  r.cluster_name    = row[1].c_str();
  r.environment     = OptText(row[2]);
  r.region          = OptText(row[3]);
  r.owner           = OptText(row[4]);
  r.description     = OptText(row[5]);
  r.is_active       = row[6].as<bool>();
  r.last_updated_ms = row[7].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertCluster(Transaction& t, model::ClusterRecord& r) {
  try {
    if (r.last_updated_ms == 0) {
      r.last_updated_ms = util::ToUnixMillis(util::Now());
    }
    auto res = TX(t).Work().exec_params(
        "INSERT INTO clusters(cluster_name,environment,region,owner,description,is_active,last_updated_ms) VALUES($1,$2,$3,$4,$5,$6,$7) "
        "ON CONFLICT(cluster_name) DO UPDATE SET environment=EXCLUDED.environment, region=EXCLUDED.region, owner=EXCLUDED.owner, "
        "description=EXCLUDED.description, is_active=EXCLUDED.is_active, last_updated_ms=EXCLUDED.last_updated_ms RETURNING cluster_id;",
        r.cluster_name, r.environment, r.region, r.owner, r.description, r.is_active, r.last_updated_ms);
    r.cluster_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteCluster(Transaction& t, int64_t cluster_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM clusters WHERE cluster_id=$1;", cluster_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AppendClusterStat(Transaction& t, const model::ClusterStatRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO cluster_stat_history(cluster_id,timestamp_ms,stats) VALUES($1,$2,$3::jsonb);", r.cluster_id,
                             r.timestamp_ms, projsync::model::ColumnsToJson(r.values));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ClusterStatRecord> PgRepository::ListClusterStats(Transaction& t, int64_t cluster_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT cluster_id,timestamp_ms,stats::text FROM cluster_stat_history WHERE cluster_id=$1 ORDER BY ctid;", cluster_id);

  std::vector<model::ClusterStatRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ClusterStatRecord r;
    r.cluster_id   = row[0].as<int64_t>();
    r.timestamp_ms = row[1].as<int64_t>();
    r.values       = projsync::model::ColumnsFromJson(row[2].c_str());
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

Result PgRepository::UpsertDerived(Transaction& t, ProjectionTable table, const projsync::model::DerivedRow& row) {
  try {
    auto& work = TX(t).Work();
    auto  json = projsync::model::ColumnsToJson(row.attributes);

    if (table == ProjectionTable::kInline) {
      auto res = work.exec_params(
          "UPDATE base_rows SET derived=$2::jsonb, derived_version=$3, derived_synced_at_ms=$4 WHERE cluster_id=$1;", row.key, json,
          row.version, ToMillis(row.last_synced_at));
      if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
      return Result::Ok();
    }

    if (table == ProjectionTable::kSummary) {
      work.exec_prepared("upsert_summary", row.key, json, row.version, ToMillis(row.last_synced_at));
      return Result::Ok();
    }

    work.exec_params("INSERT INTO derived_view(cluster_id,attributes,version,synced_at_ms) VALUES($1,$2::jsonb,$3,$4) "
                     "ON CONFLICT(cluster_id) DO UPDATE SET attributes=EXCLUDED.attributes, version=EXCLUDED.version, "
                     "synced_at_ms=EXCLUDED.synced_at_ms;",
                     row.key, json, row.version, ToMillis(row.last_synced_at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DerivedRowRecord> PgRepository::GetDerived(Transaction& t, ProjectionTable table, int64_t key) {
  auto&        work = TX(t).Work();
  pqxx::result res;
  switch (table) {
    case ProjectionTable::kInline:
      res = work.exec_params(
          "SELECT cluster_id,derived::text,derived_version,derived_synced_at_ms,NULL FROM base_rows WHERE cluster_id=$1 AND derived_version IS NOT NULL;",
          key);
      break;
    case ProjectionTable::kIndexedView:
      res = work.exec_params("SELECT cluster_id,attributes::text,version,synced_at_ms,NULL FROM derived_view WHERE cluster_id=$1;", key);
      break;
    case ProjectionTable::kSummary:
      res = work.exec_prepared("get_summary", key);
      break;
  }
  if (res.empty()) return std::nullopt;

  model::DerivedRowRecord r;
  r.row = ReadDerived(res[0]);
  if (!res[0][4].is_null()) {
    r.deleted_at = util::FromUnixMillis(res[0][4].as<int64_t>());
  }
  return r;
}

Result PgRepository::RemoveDerived(Transaction& t, ProjectionTable table, int64_t key) {
  try {
    auto& work = TX(t).Work();
    if (table == ProjectionTable::kInline) {
      work.exec_params("UPDATE base_rows SET derived=NULL, derived_version=NULL, derived_synced_at_ms=NULL WHERE cluster_id=$1;", key);
    } else {
      work.exec_params("DELETE FROM " + std::string(TableName(table)) + " WHERE cluster_id=$1;", key);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TombstoneDerived(Transaction& t, int64_t key, uint64_t version, projsync::model::TimePoint at) {
  try {
    TX(t).Work().exec_prepared("tombstone_summary", key, version, ToMillis(at));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<projsync::model::DerivedRow> PgRepository::ScanDerived(Transaction& t, ProjectionTable table,
                                                                   const projsync::model::KeyRange& range, std::optional<int64_t> after,
                                                                   std::size_t limit) {
  int64_t lower = range.begin.value_or(std::numeric_limits<int64_t>::min());
  if (after && *after >= lower) {
    if (*after == std::numeric_limits<int64_t>::max()) return {};
    lower = *after + 1;
  }
  const int64_t upper = range.end.value_or(std::numeric_limits<int64_t>::max());

  std::string sql;
  switch (table) {
    case ProjectionTable::kInline:
      sql = "SELECT cluster_id,derived::text,derived_version,derived_synced_at_ms FROM base_rows WHERE derived_version IS NOT NULL AND ";
      break;
    case ProjectionTable::kIndexedView:
      sql = "SELECT cluster_id,attributes::text,version,synced_at_ms FROM derived_view WHERE ";
      break;
    case ProjectionTable::kSummary:
      sql = "SELECT cluster_id,attributes::text,version,synced_at_ms FROM derived_summary WHERE deleted_at_ms IS NULL AND ";
      break;
  }
  // An open end bound includes the largest key.
  sql += range.end ? "cluster_id>=$1 AND cluster_id<$2 ORDER BY cluster_id LIMIT $3;" : "cluster_id>=$1 AND cluster_id<=$2 ORDER BY cluster_id LIMIT $3;";

  auto res = TX(t).Work().exec_params(sql, lower, upper, static_cast<int64_t>(limit));

  std::vector<projsync::model::DerivedRow> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadDerived(row));
  }
  return out;
}

Result PgRepository::PurgeTombstones(Transaction& t, projsync::model::TimePoint older_than, uint64_t& purged) {
  try {
    auto res = TX(t).Work().exec_prepared("purge_summary_tombstones", ToMillis(older_than));
    purged = res.affected_rows();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace projsync::db::postgres
