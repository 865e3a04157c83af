#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace projsync::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  using Repository::Begin;
  std::unique_ptr<Transaction> Begin(std::chrono::milliseconds lock_timeout) override;
  std::unique_ptr<Transaction> BeginRead(std::chrono::milliseconds lock_timeout) override;

  Result Ping() override;
  Result NextSequence(Transaction&, uint64_t& sequence) override;

  Result InsertBaseRow(Transaction&, const model::BaseRowRecord&) override;
  Result UpdateBaseRow(Transaction&, const model::BaseRowRecord&) override;
  Result DeleteBaseRow(Transaction&, int64_t key) override;
  std::optional<model::BaseRowRecord> GetBaseRow(Transaction&, int64_t key) override;
  std::vector<int64_t> ListBaseKeys(Transaction&, std::optional<int64_t> after, std::size_t limit) override;

  std::optional<model::ClusterRecord> FindClusterByName(Transaction&, const std::string& name) override;
  Result UpsertCluster(Transaction&, model::ClusterRecord&) override;
  Result DeleteCluster(Transaction&, int64_t cluster_id) override;
  Result AppendClusterStat(Transaction&, const model::ClusterStatRecord&) override;
  std::vector<model::ClusterStatRecord> ListClusterStats(Transaction&, int64_t cluster_id) override;

  Result UpsertDerived(Transaction&, ProjectionTable, const projsync::model::DerivedRow&) override;
  std::optional<model::DerivedRowRecord> GetDerived(Transaction&, ProjectionTable, int64_t key) override;
  Result RemoveDerived(Transaction&, ProjectionTable, int64_t key) override;
  Result TombstoneDerived(Transaction&, int64_t key, uint64_t version, projsync::model::TimePoint at) override;
  std::vector<projsync::model::DerivedRow> ScanDerived(Transaction&, ProjectionTable, const projsync::model::KeyRange& range,
                                                       std::optional<int64_t> after, std::size_t limit) override;
  Result PurgeTombstones(Transaction&, projsync::model::TimePoint older_than, uint64_t& purged) override;

private:
  friend class MemoryTransaction;

  struct State {
    uint64_t next_sequence = 1;

    std::map<int64_t, model::BaseRowRecord>       base_rows;
    std::map<int64_t, projsync::model::DerivedRow> inline_derived;

    std::map<int64_t, model::ClusterRecord>                  clusters;
    std::map<std::string, int64_t>                           cluster_ids;
    std::map<int64_t, std::vector<model::ClusterStatRecord>> cluster_stats;
    int64_t                                                  next_cluster_id = 1;

    std::map<int64_t, projsync::model::DerivedRow> view;
    std::map<int64_t, model::DerivedRowRecord>     summary;
  };

  std::shared_ptr<const State> Snapshot() const;
  void                         Publish(State state);

  // Held by a transaction from Begin() until Commit()/Rollback().
  std::timed_mutex write_mutex_;

  // Guards the committed_ pointer only; readers keep their snapshot alive.
  mutable std::mutex           snapshot_mutex_;
  std::shared_ptr<const State> committed_;
};

}
