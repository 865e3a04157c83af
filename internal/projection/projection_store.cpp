#include "projection_store.hpp"

#include <stdexcept>

#include "indexed_view_store.hpp"
#include "inline_store.hpp"
#include "summary_table_store.hpp"
#include "internal/util/time.hpp"

namespace projsync::projection {

const char* ToString(WriteOutcome outcome) {
  switch (outcome) {
    case WriteOutcome::kApplied:
      return "applied";
    case WriteOutcome::kSuperseded:
      return "superseded";
    case WriteOutcome::kBaseMissing:
      return "base_missing";
  }
  return "unknown";
}

ProjectionStore::ProjectionStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds lock_timeout)
    : repository_(std::move(repository)), lock_timeout_(lock_timeout) {
  if (!repository_) {
    throw std::invalid_argument("projection store requires a repository");
  }
}

std::unique_ptr<db::Transaction> ProjectionStore::BeginTx() {
  return repository_->Begin(lock_timeout_);
}

std::unique_ptr<db::Transaction> ProjectionStore::BeginReadTx() {
  return repository_->BeginRead(lock_timeout_);
}

std::optional<uint64_t> ProjectionStore::StoredVersion(db::Transaction& tx, model::RowKey key) {
  auto record = repository_->GetDerived(tx, Table(), key);
  if (!record) return std::nullopt;
  return record->row.version;
}

// ------------------------------------------------------------------
// Transactional forms
// ------------------------------------------------------------------

std::optional<model::DerivedRow> ProjectionStore::Get(db::Transaction& tx, model::RowKey key) {
  auto record = repository_->GetDerived(tx, Table(), key);
  if (!record || record->IsTombstone()) return std::nullopt;
  return std::move(record->row);
}

WriteOutcome ProjectionStore::Upsert(db::Transaction& tx, const model::DerivedRow& row) {
  return DoUpsert(tx, row);
}

WriteOutcome ProjectionStore::Remove(db::Transaction& tx, model::RowKey key, uint64_t version) {
  return DoRemove(tx, key, version);
}

ScanPage ProjectionStore::Scan(db::Transaction& tx, const model::KeyRange& range, std::optional<model::RowKey> cursor, std::size_t limit) {
  ScanPage page;
  if (limit == 0) return page;

  page.rows = repository_->ScanDerived(tx, Table(), range, cursor, limit);
  if (page.rows.size() == limit) {
    page.next_cursor = page.rows.back().key;
  }
  return page;
}

// ------------------------------------------------------------------
// Own transaction
// ------------------------------------------------------------------

std::optional<model::DerivedRow> ProjectionStore::Get(model::RowKey key) {
  auto tx  = BeginReadTx();
  auto row = Get(*tx, key);
  tx->Commit();
  return row;
}

WriteOutcome ProjectionStore::Upsert(const model::DerivedRow& row) {
  auto tx      = BeginTx();
  auto outcome = DoUpsert(*tx, row);
  tx->Commit();
  return outcome;
}

WriteOutcome ProjectionStore::Upsert(model::RowKey key, model::DerivedAttributes attributes) {
  auto tx = BeginTx();

  model::DerivedRow row;
  row.key            = key;
  row.attributes     = std::move(attributes);
  row.version        = StoredVersion(*tx, key).value_or(0);
  row.last_synced_at = util::Now();

  auto outcome = DoUpsert(*tx, row);
  tx->Commit();
  return outcome;
}

WriteOutcome ProjectionStore::Remove(model::RowKey key, uint64_t version) {
  auto tx      = BeginTx();
  auto outcome = DoRemove(*tx, key, version);
  tx->Commit();
  return outcome;
}

WriteOutcome ProjectionStore::Remove(model::RowKey key) {
  auto tx      = BeginTx();
  auto version = StoredVersion(*tx, key).value_or(0);
  auto outcome = DoRemove(*tx, key, version);
  tx->Commit();
  return outcome;
}

ScanPage ProjectionStore::Scan(const model::KeyRange& range, std::optional<model::RowKey> cursor, std::size_t limit) {
  auto tx   = BeginReadTx();
  auto page = Scan(*tx, range, cursor, limit);
  tx->Commit();
  return page;
}

ScanSequence ProjectionStore::ScanAll(const model::KeyRange& range, std::size_t page_size, std::optional<model::RowKey> cursor) {
  return ScanSequence(*this, range, page_size, cursor);
}

// ------------------------------------------------------------------
// ScanSequence
// ------------------------------------------------------------------

ScanSequence::ScanSequence(ProjectionStore& store, model::KeyRange range, std::size_t page_size, std::optional<model::RowKey> cursor)
    : store_(store), range_(range), page_size_(page_size == 0 ? 1 : page_size), cursor_(cursor) {
}

std::optional<model::DerivedRow> ScanSequence::Next() {
  if (buffer_.empty() && !exhausted_) {
    auto page = store_.Scan(range_, cursor_, page_size_);
    exhausted_ = !page.next_cursor.has_value();
    for (auto& row : page.rows) {
      buffer_.push_back(std::move(row));
    }
  }
  if (buffer_.empty()) return std::nullopt;

  auto row = std::move(buffer_.front());
  buffer_.pop_front();
  cursor_ = row.key;
  return row;
}

// ------------------------------------------------------------------
// Factory
// ------------------------------------------------------------------

ProjectionStorePtr MakeStore(model::ProjectionMode mode, std::shared_ptr<db::Repository> repository, std::chrono::milliseconds lock_timeout) {
  switch (mode) {
    case model::ProjectionMode::kInline:
      return std::make_shared<InlineStore>(std::move(repository), lock_timeout);
    case model::ProjectionMode::kIndexedView:
      return std::make_shared<IndexedViewStore>(std::move(repository), lock_timeout);
    case model::ProjectionMode::kSummaryTable:
      return std::make_shared<SummaryTableStore>(std::move(repository), lock_timeout);
  }
  throw std::invalid_argument("unknown projection mode");
}

} // namespace projsync::projection
