#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace projsync::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  using Repository::Begin;
  std::unique_ptr<Transaction> Begin(std::chrono::milliseconds lock_timeout) override;

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
