#include "summary_table_store.hpp"

#include "internal/util/time.hpp"

namespace projsync::projection {

WriteOutcome SummaryTableStore::DoUpsert(db::Transaction& tx, const model::DerivedRow& row) {
  auto stored = StoredVersion(tx, row.key);
  if (stored && *stored > row.version) {
    return WriteOutcome::kSuperseded;
  }

  db::ThrowIfError(repository_->UpsertDerived(tx, Table(), row), "summary upsert");
  return WriteOutcome::kApplied;
}

WriteOutcome SummaryTableStore::DoRemove(db::Transaction& tx, model::RowKey key, uint64_t version) {
  auto stored = StoredVersion(tx, key);
  if (stored && *stored > version) {
    return WriteOutcome::kSuperseded;
  }

  // A key with no row still gets a tombstone at version.
  db::ThrowIfError(repository_->TombstoneDerived(tx, key, version, util::Now()), "summary tombstone");
  return WriteOutcome::kApplied;
}

uint64_t SummaryTableStore::PurgeTombstones(std::chrono::milliseconds retention) {
  auto     tx     = BeginTx();
  uint64_t purged = 0;
  db::ThrowIfError(repository_->PurgeTombstones(*tx, util::Now() - retention, purged), "summary purge");
  tx->Commit();
  return purged;
}

} // namespace projsync::projection
