#include "memory_repository.hpp"

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace projsync::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(std::chrono::milliseconds lock_timeout) {
  return std::make_unique<MemoryTransaction>(*this, lock_timeout, MemoryTransaction::Access::kReadWrite);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead(std::chrono::milliseconds lock_timeout) {
  return std::make_unique<MemoryTransaction>(*this, lock_timeout, MemoryTransaction::Access::kReadOnly);
}

std::shared_ptr<const MemoryRepository::State> MemoryRepository::Snapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return committed_;
}

void MemoryRepository::Publish(State state) {
  auto next = std::make_shared<const State>(std::move(state));
  std::lock_guard lock(snapshot_mutex_);
  committed_ = std::move(next);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::Ping() {
  return Result::Ok();
}

Result MemoryRepository::NextSequence(Transaction& t, uint64_t& sequence) {
  sequence = TX(t).Mutable().next_sequence++;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Base relation
// ------------------------------------------------------------------

Result MemoryRepository::InsertBaseRow(Transaction& t, const model::BaseRowRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.base_rows.contains(r.row.key)) return Result::Err(ErrorCode::AlreadyExists);
  s.base_rows[r.row.key] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateBaseRow(Transaction& t, const model::BaseRowRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.base_rows.find(r.row.key);
  if (it == s.base_rows.end()) return Result::Err(ErrorCode::NotFound);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteBaseRow(Transaction& t, int64_t key) {
  auto& s = TX(t).Mutable();
  s.base_rows.erase(key);
  s.inline_derived.erase(key);
  return Result::Ok();
}

std::optional<model::BaseRowRecord> MemoryRepository::GetBaseRow(Transaction& t, int64_t key) {
  const auto& s  = TX(t).View();
  auto        it = s.base_rows.find(key);
  if (it == s.base_rows.end()) return std::nullopt;
  return it->second;
}

std::vector<int64_t> MemoryRepository::ListBaseKeys(Transaction& t, std::optional<int64_t> after, std::size_t limit) {
  const auto&          s  = TX(t).View();
  auto                 it = after ? s.base_rows.upper_bound(*after) : s.base_rows.begin();
  std::vector<int64_t> out;
  for (; it != s.base_rows.end() && out.size() < limit; ++it) {
    out.push_back(it->first);
  }
  return out;
}

// ------------------------------------------------------------------
// Clusters
// ------------------------------------------------------------------

std::optional<model::ClusterRecord> MemoryRepository::FindClusterByName(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.cluster_ids.find(name);
  if (it == s.cluster_ids.end()) return std::nullopt;
  return s.clusters.at(it->second);
}

Result MemoryRepository::UpsertCluster(Transaction& t, model::ClusterRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.cluster_name.empty()) return Result::Err(ErrorCode::ConstraintViolation, "cluster_name is required");

  auto it = s.cluster_ids.find(r.cluster_name);
  if (it != s.cluster_ids.end()) {
    r.cluster_id = it->second;
  } else {
    r.cluster_id                  = s.next_cluster_id++;
    s.cluster_ids[r.cluster_name] = r.cluster_id;
  }
  if (r.last_updated_ms == 0) {
    r.last_updated_ms = util::ToUnixMillis(util::Now());
  }
  s.clusters[r.cluster_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteCluster(Transaction& t, int64_t cluster_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.clusters.find(cluster_id);
  if (it == s.clusters.end()) return Result::Err(ErrorCode::NotFound);
  s.cluster_ids.erase(it->second.cluster_name);
  s.clusters.erase(it);
  s.cluster_stats.erase(cluster_id);
  return Result::Ok();
}

Result MemoryRepository::AppendClusterStat(Transaction& t, const model::ClusterStatRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.clusters.contains(r.cluster_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown cluster");
  s.cluster_stats[r.cluster_id].push_back(r);
  return Result::Ok();
}

std::vector<model::ClusterStatRecord> MemoryRepository::ListClusterStats(Transaction& t, int64_t cluster_id) {
  const auto& s  = TX(t).View();
  auto        it = s.cluster_stats.find(cluster_id);
  if (it == s.cluster_stats.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Projections
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDerived(Transaction& t, ProjectionTable table, const projsync::model::DerivedRow& row) {
  auto& s = TX(t).Mutable();
  switch (table) {
    case ProjectionTable::kInline:
      if (!s.base_rows.contains(row.key)) return Result::Err(ErrorCode::NotFound);
      s.inline_derived[row.key] = row;
      return Result::Ok();
    case ProjectionTable::kIndexedView:
      s.view[row.key] = row;
      return Result::Ok();
    case ProjectionTable::kSummary:
      s.summary[row.key] = model::DerivedRowRecord{row, std::nullopt};
      return Result::Ok();
  }
  return Result::Err(ErrorCode::Unsupported);
}

std::optional<model::DerivedRowRecord> MemoryRepository::GetDerived(Transaction& t, ProjectionTable table, int64_t key) {
  const auto& s = TX(t).View();
  switch (table) {
    case ProjectionTable::kInline: {
      auto it = s.inline_derived.find(key);
      if (it == s.inline_derived.end()) return std::nullopt;
      return model::DerivedRowRecord{it->second, std::nullopt};
    }
    case ProjectionTable::kIndexedView: {
      auto it = s.view.find(key);
      if (it == s.view.end()) return std::nullopt;
      return model::DerivedRowRecord{it->second, std::nullopt};
    }
    case ProjectionTable::kSummary: {
      auto it = s.summary.find(key);
      if (it == s.summary.end()) return std::nullopt;
      return it->second;
    }
  }
  return std::nullopt;
}

Result MemoryRepository::RemoveDerived(Transaction& t, ProjectionTable table, int64_t key) {
  auto& s = TX(t).Mutable();
  switch (table) {
    case ProjectionTable::kInline:
      s.inline_derived.erase(key);
      break;
    case ProjectionTable::kIndexedView:
      s.view.erase(key);
      break;
    case ProjectionTable::kSummary:
      s.summary.erase(key);
      break;
  }
  return Result::Ok();
}

Result MemoryRepository::TombstoneDerived(Transaction& t, int64_t key, uint64_t version, projsync::model::TimePoint at) {
  auto& record = TX(t).Mutable().summary[key];
  if (!record.IsTombstone()) {
    record.row.key            = key;
    record.row.last_synced_at = at;
    record.deleted_at         = at;
  }
  record.row.version = version;
  return Result::Ok();
}

std::vector<projsync::model::DerivedRow> MemoryRepository::ScanDerived(Transaction& t, ProjectionTable table,
                                                                       const projsync::model::KeyRange& range,
                                                                       std::optional<int64_t> after, std::size_t limit) {
  const auto&                              s = TX(t).View();
  std::vector<projsync::model::DerivedRow> out;

  auto collect = [&](const auto& rows, auto&& project) {
    auto it = after ? rows.upper_bound(*after) : (range.begin ? rows.lower_bound(*range.begin) : rows.begin());
    for (; it != rows.end() && out.size() < limit; ++it) {
      if (range.end && it->first >= *range.end) break;
      if (!range.Contains(it->first)) continue;
      if (const auto* row = project(it->second)) out.push_back(*row);
    }
  };

  switch (table) {
    case ProjectionTable::kInline:
      collect(s.inline_derived, [](const projsync::model::DerivedRow& r) { return &r; });
      break;
    case ProjectionTable::kIndexedView:
      collect(s.view, [](const projsync::model::DerivedRow& r) { return &r; });
      break;
    case ProjectionTable::kSummary:
      collect(s.summary, [](const model::DerivedRowRecord& r) -> const projsync::model::DerivedRow* {
        return r.IsTombstone() ? nullptr : &r.row;
      });
      break;
  }
  return out;
}

Result MemoryRepository::PurgeTombstones(Transaction& t, projsync::model::TimePoint older_than, uint64_t& purged) {
  auto& s = TX(t).Mutable();
  purged  = 0;
  for (auto it = s.summary.begin(); it != s.summary.end();) {
    if (it->second.deleted_at && *it->second.deleted_at < older_than) {
      it = s.summary.erase(it);
      ++purged;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace projsync::db::memory
