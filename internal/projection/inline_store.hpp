#pragma once

#include "projection_store.hpp"

namespace projsync::projection {

/*
  Derived attributes persisted as columns of the base row.

  A write is a single row update; a key without a base row cannot be
  written (kBaseMissing). Deleting the base row drops its derived columns
  with it.
*/
class InlineStore final : public ProjectionStore {
 public:
  using ProjectionStore::ProjectionStore;

  model::ProjectionMode Mode() const override {
    return model::ProjectionMode::kInline;
  }

 protected:
  db::ProjectionTable Table() const override {
    return db::ProjectionTable::kInline;
  }

  WriteOutcome DoUpsert(db::Transaction& tx, const model::DerivedRow& row) override;
  WriteOutcome DoRemove(db::Transaction& tx, model::RowKey key, uint64_t version) override;
};

} // namespace projsync::projection
