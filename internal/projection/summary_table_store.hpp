#pragma once

#include <chrono>

#include "projection_store.hpp"

namespace projsync::projection {

/*
  Separate table maintained only by explicit upserts.

  Remove is a soft delete: the row keeps its key with deleted_at set and
  the delete's version, so a late upsert of an older version stays
  rejected. PurgeTombstones() drops tombstones past the retention.
*/
class SummaryTableStore final : public ProjectionStore {
 public:
  using ProjectionStore::ProjectionStore;

  model::ProjectionMode Mode() const override {
    return model::ProjectionMode::kSummaryTable;
  }

  // Returns the number of tombstones dropped.
  uint64_t PurgeTombstones(std::chrono::milliseconds retention);

 protected:
  db::ProjectionTable Table() const override {
    return db::ProjectionTable::kSummary;
  }

  WriteOutcome DoUpsert(db::Transaction& tx, const model::DerivedRow& row) override;
  WriteOutcome DoRemove(db::Transaction& tx, model::RowKey key, uint64_t version) override;
};

} // namespace projsync::projection
