#include "indexed_view_store.hpp"

namespace projsync::projection {

WriteOutcome IndexedViewStore::DoUpsert(db::Transaction& tx, const model::DerivedRow& row) {
  if (!repository_->GetBaseRow(tx, row.key)) {
    return WriteOutcome::kBaseMissing;
  }

  auto stored = StoredVersion(tx, row.key);
  if (stored && *stored > row.version) {
    return WriteOutcome::kSuperseded;
  }

  db::ThrowIfError(repository_->UpsertDerived(tx, Table(), row), "view upsert");
  return WriteOutcome::kApplied;
}

WriteOutcome IndexedViewStore::DoRemove(db::Transaction& tx, model::RowKey key, uint64_t version) {
  auto stored = StoredVersion(tx, key);
  if (!stored) {
    return WriteOutcome::kApplied;
  }
  if (*stored > version) {
    return WriteOutcome::kSuperseded;
  }

  db::ThrowIfError(repository_->RemoveDerived(tx, Table(), key), "view remove");
  return WriteOutcome::kApplied;
}

} // namespace projsync::projection
