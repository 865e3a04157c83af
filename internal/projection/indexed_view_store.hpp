#pragma once

#include "projection_store.hpp"

namespace projsync::projection {

/*
  Separate table keyed like the base relation, ordered by key.

  Every write checks the base row inside the same transaction, so a view
  row never outlives its base row once the transaction commits. The
  ingest path writes base and view in one transaction.
*/
class IndexedViewStore final : public ProjectionStore {
 public:
  using ProjectionStore::ProjectionStore;

  model::ProjectionMode Mode() const override {
    return model::ProjectionMode::kIndexedView;
  }

 protected:
  db::ProjectionTable Table() const override {
    return db::ProjectionTable::kIndexedView;
  }

  WriteOutcome DoUpsert(db::Transaction& tx, const model::DerivedRow& row) override;
  WriteOutcome DoRemove(db::Transaction& tx, model::RowKey key, uint64_t version) override;
};

} // namespace projsync::projection
