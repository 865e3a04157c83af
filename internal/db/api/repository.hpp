#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/base_row_record.hpp"
#include "internal/db/model/cluster_record.hpp"
#include "internal/db/model/cluster_stat_record.hpp"
#include "internal/db/model/derived_row_record.hpp"

namespace projsync::db {

// Physical home of a projection.
enum class ProjectionTable {
  kInline,      // derived columns of base_rows
  kIndexedView, // derived_view
  kSummary,     // derived_summary
};

const char* ToString(ProjectionTable table);

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Transactions are serializable with respect to each other
  - Begin() waits at most lock_timeout for the write lock, then throws
    util::StoreUnavailable

  The DB is the source of truth for:
    base rows (the base relation)
    cluster properties and stat history
    the three projection tables

  Version checks on projection rows belong to the caller; the repository
  writes what it is given.
*/

class Repository {
 public:
  static constexpr std::chrono::milliseconds kDefaultLockTimeout{5000};

  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(std::chrono::milliseconds lock_timeout) = 0;

  std::unique_ptr<Transaction> Begin() {
    return Begin(kDefaultLockTimeout);
  }

  // Transaction that only reads. Backends with committed snapshots
  // serve it without waiting on writers.
  virtual std::unique_ptr<Transaction> BeginRead(std::chrono::milliseconds lock_timeout) {
    return Begin(lock_timeout);
  }

  // Trivial round trip for health checks.
  virtual Result Ping() = 0;

  // Next value of the commit sequence shared by every writer.
  virtual Result NextSequence(Transaction&, uint64_t& sequence) = 0;

  // ---------------------------------------------------------------------
  // Base relation
  // ---------------------------------------------------------------------

  virtual Result InsertBaseRow(Transaction&, const model::BaseRowRecord&) = 0;

  // Rewrites columns and version; inline derived columns are untouched.
  virtual Result UpdateBaseRow(Transaction&, const model::BaseRowRecord&) = 0;

  virtual Result DeleteBaseRow(Transaction&, int64_t key) = 0;

  virtual std::optional<model::BaseRowRecord> GetBaseRow(Transaction&, int64_t key) = 0;

  // Keys in ascending order, strictly greater than after.
  virtual std::vector<int64_t> ListBaseKeys(Transaction&, std::optional<int64_t> after, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Clusters
  // ---------------------------------------------------------------------

  virtual std::optional<model::ClusterRecord> FindClusterByName(Transaction&, const std::string& name) = 0;

  // Inserts or updates by cluster_name; assigns cluster_id on insert.
  virtual Result UpsertCluster(Transaction&, model::ClusterRecord&) = 0;

  // Removes the cluster and its stat history.
  virtual Result DeleteCluster(Transaction&, int64_t cluster_id) = 0;

  virtual Result AppendClusterStat(Transaction&, const model::ClusterStatRecord&) = 0;

  virtual std::vector<model::ClusterStatRecord> ListClusterStats(Transaction&, int64_t cluster_id) = 0;

  // ---------------------------------------------------------------------
  // Projections
  // ---------------------------------------------------------------------

  // kInline returns NotFound when the base row does not exist.
  virtual Result UpsertDerived(Transaction&, ProjectionTable, const projsync::model::DerivedRow&) = 0;

  // Includes summary tombstones.
  virtual std::optional<model::DerivedRowRecord> GetDerived(Transaction&, ProjectionTable, int64_t key) = 0;

  // Hard delete. kInline clears the derived columns.
  virtual Result RemoveDerived(Transaction&, ProjectionTable, int64_t key) = 0;

  // Summary table only: soft delete at the given version. Inserts a
  // tombstone for an absent key; an existing tombstone keeps deleted_at.
  virtual Result TombstoneDerived(Transaction&, int64_t key, uint64_t version, projsync::model::TimePoint at) = 0;

  // Live rows in range with key > after, ascending, at most limit.
  virtual std::vector<projsync::model::DerivedRow> ScanDerived(Transaction&, ProjectionTable, const projsync::model::KeyRange& range,
                                                               std::optional<int64_t> after, std::size_t limit) = 0;

  // Summary table only: drops tombstones deleted before older_than.
  virtual Result PurgeTombstones(Transaction&, projsync::model::TimePoint older_than, uint64_t& purged) = 0;
};

} // namespace projsync::db
