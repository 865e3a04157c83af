#include "internal/projection/projection_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/projection/summary_table_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace projsync;
using projection::WriteOutcome;

constexpr model::ProjectionMode kAllModes[] = {
    model::ProjectionMode::kInline,
    model::ProjectionMode::kIndexedView,
    model::ProjectionMode::kSummaryTable,
};

void PutBaseRow(db::Repository& repo, model::RowKey key, double free_ghz, uint64_t version) {
  auto tx = repo.Begin();
  db::model::BaseRowRecord record;
  record.row     = model::BaseRow{key, {{"FreeGHz", free_ghz}}};
  record.version = version;
  if (repo.GetBaseRow(*tx, key)) {
    db::ThrowIfError(repo.UpdateBaseRow(*tx, record), "update base row");
  } else {
    db::ThrowIfError(repo.InsertBaseRow(*tx, record), "insert base row");
  }
  tx->Commit();
}

model::DerivedRow Derived(model::RowKey key, double free_cores, uint64_t version) {
  model::DerivedRow row;
  row.key            = key;
  row.attributes     = {{"FreeCores", free_cores}};
  row.version        = version;
  row.last_synced_at = util::Now();
  return row;
}

double StoredFreeCores(projection::ProjectionStore& store, model::RowKey key) {
  auto row = store.Get(key);
  assert(row.has_value());
  return std::get<double>(row->attributes.at("FreeCores"));
}

void TestUpsertThenGet() {
  for (auto mode : kAllModes) {
    auto repo  = std::make_shared<db::memory::MemoryRepository>();
    auto store = projection::MakeStore(mode, repo);
    assert(store->Mode() == mode);

    PutBaseRow(*repo, 1, 4.8, 1);
    assert(!store->Get(1).has_value());
    assert(store->Upsert(Derived(1, 2.0, 1)) == WriteOutcome::kApplied);

    auto row = store->Get(1);
    assert(row.has_value());
    assert(row->version == 1);
    assert(StoredFreeCores(*store, 1) == 2.0);
  }
}

void TestOlderVersionIsSuperseded() {
  for (auto mode : kAllModes) {
    auto repo  = std::make_shared<db::memory::MemoryRepository>();
    auto store = projection::MakeStore(mode, repo);

    PutBaseRow(*repo, 1, 12.0, 5);
    assert(store->Upsert(Derived(1, 5.0, 5)) == WriteOutcome::kApplied);
    assert(store->Upsert(Derived(1, 2.0, 3)) == WriteOutcome::kSuperseded);
    assert(StoredFreeCores(*store, 1) == 5.0);

    // Equal version overwrites.
    assert(store->Upsert(Derived(1, 6.0, 5)) == WriteOutcome::kApplied);
    assert(StoredFreeCores(*store, 1) == 6.0);
  }
}

void TestUnversionedUpsertKeepsVersion() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = projection::MakeStore(model::ProjectionMode::kSummaryTable, repo);

  assert(store->Upsert(Derived(3, 1.0, 9)) == WriteOutcome::kApplied);
  assert(store->Upsert(3, model::DerivedAttributes{{"FreeCores", 4.0}}) == WriteOutcome::kApplied);

  auto row = store->Get(3);
  assert(row.has_value());
  assert(row->version == 9);
  assert(StoredFreeCores(*store, 3) == 4.0);
}

void TestInlineAndViewRequireBaseRow() {
  for (auto mode : {model::ProjectionMode::kInline, model::ProjectionMode::kIndexedView}) {
    auto repo  = std::make_shared<db::memory::MemoryRepository>();
    auto store = projection::MakeStore(mode, repo);
    assert(store->Upsert(Derived(42, 1.0, 1)) == WriteOutcome::kBaseMissing);
    assert(!store->Get(42).has_value());
  }

  auto repo    = std::make_shared<db::memory::MemoryRepository>();
  auto summary = projection::MakeStore(model::ProjectionMode::kSummaryTable, repo);
  assert(summary->Upsert(Derived(42, 1.0, 1)) == WriteOutcome::kApplied);
}

void TestRemoveIsVersioned() {
  for (auto mode : kAllModes) {
    auto repo  = std::make_shared<db::memory::MemoryRepository>();
    auto store = projection::MakeStore(mode, repo);

    PutBaseRow(*repo, 1, 4.8, 4);
    assert(store->Upsert(Derived(1, 2.0, 4)) == WriteOutcome::kApplied);
    assert(store->Remove(1, 2) == WriteOutcome::kSuperseded);
    assert(store->Get(1).has_value());

    assert(store->Remove(1, 6) == WriteOutcome::kApplied);
    assert(!store->Get(1).has_value());

    // Removing an already removed row still succeeds.
    assert(store->Remove(1, 7) == WriteOutcome::kApplied);
  }
}

void TestSummaryTombstoneRejectsLateUpsert() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = projection::MakeStore(model::ProjectionMode::kSummaryTable, repo);

  assert(store->Upsert(Derived(1, 2.0, 1)) == WriteOutcome::kApplied);
  assert(store->Remove(1, 3) == WriteOutcome::kApplied);
  assert(!store->Get(1).has_value());

  assert(store->Upsert(Derived(1, 2.0, 2)) == WriteOutcome::kSuperseded);
  assert(!store->Get(1).has_value());

  assert(store->Upsert(Derived(1, 9.0, 4)) == WriteOutcome::kApplied);
  assert(StoredFreeCores(*store, 1) == 9.0);
}

void TestRemoveOfAbsentRow() {
  for (auto mode : {model::ProjectionMode::kInline, model::ProjectionMode::kIndexedView}) {
    auto repo  = std::make_shared<db::memory::MemoryRepository>();
    auto store = projection::MakeStore(mode, repo);

    PutBaseRow(*repo, 1, 4.8, 1);
    assert(store->Remove(1, 7) == WriteOutcome::kApplied);
    assert(!store->Get(1).has_value());
  }

  // The delete's version is kept even though no row was stored yet.
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = projection::MakeStore(model::ProjectionMode::kSummaryTable, repo);

  assert(store->Remove(1, 5) == WriteOutcome::kApplied);
  assert(!store->Get(1).has_value());

  assert(store->Upsert(Derived(1, 2.0, 3)) == WriteOutcome::kSuperseded);
  assert(!store->Get(1).has_value());
  assert(store->Scan(model::KeyRange{}, std::nullopt, 10).rows.empty());

  assert(store->Remove(1, 4) == WriteOutcome::kSuperseded);
  assert(store->Remove(1, 8) == WriteOutcome::kApplied);
  assert(store->Upsert(Derived(1, 2.0, 6)) == WriteOutcome::kSuperseded);

  assert(store->Upsert(Derived(1, 2.0, 9)) == WriteOutcome::kApplied);
  assert(StoredFreeCores(*store, 1) == 2.0);
}

void TestSummaryPurgeDropsOldTombstones() {
  auto repo    = std::make_shared<db::memory::MemoryRepository>();
  auto store   = projection::MakeStore(model::ProjectionMode::kSummaryTable, repo);
  auto summary = std::dynamic_pointer_cast<projection::SummaryTableStore>(store);
  assert(summary);

  assert(store->Upsert(Derived(1, 2.0, 1)) == WriteOutcome::kApplied);
  assert(store->Upsert(Derived(2, 3.0, 1)) == WriteOutcome::kApplied);
  assert(store->Remove(1, 2) == WriteOutcome::kApplied);

  assert(summary->PurgeTombstones(std::chrono::hours(1)) == 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  assert(summary->PurgeTombstones(std::chrono::milliseconds(1)) == 1);

  // With the tombstone gone, an old version is accepted again.
  assert(store->Upsert(Derived(1, 1.0, 1)) == WriteOutcome::kApplied);
  assert(StoredFreeCores(*store, 2) == 3.0);
}

void TestScanPagesInKeyOrder() {
  for (auto mode : kAllModes) {
    auto repo  = std::make_shared<db::memory::MemoryRepository>();
    auto store = projection::MakeStore(mode, repo);

    for (model::RowKey key = 1; key <= 7; ++key) {
      PutBaseRow(*repo, key, 2.4 * key, 1);
      assert(store->Upsert(Derived(key, static_cast<double>(key), 1)) == WriteOutcome::kApplied);
    }

    model::KeyRange range{2, 7};
    auto first = store->Scan(range, std::nullopt, 3);
    assert(first.rows.size() == 3);
    assert(first.rows[0].key == 2 && first.rows[2].key == 4);
    assert(first.next_cursor == 4);

    auto second = store->Scan(range, first.next_cursor, 3);
    assert(second.rows.size() == 2);
    assert(second.rows[0].key == 5 && second.rows[1].key == 6);
    assert(!second.next_cursor.has_value());

    std::vector<model::RowKey> keys;
    auto                       sequence = store->ScanAll(model::KeyRange{}, 2);
    while (auto row = sequence.Next()) {
      keys.push_back(row->key);
    }
    assert((keys == std::vector<model::RowKey>{1, 2, 3, 4, 5, 6, 7}));
  }
}

void TestScanSkipsSummaryTombstones() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = projection::MakeStore(model::ProjectionMode::kSummaryTable, repo);

  for (model::RowKey key = 1; key <= 3; ++key) {
    assert(store->Upsert(Derived(key, 1.0, 1)) == WriteOutcome::kApplied);
  }
  assert(store->Remove(2, 2) == WriteOutcome::kApplied);

  auto page = store->Scan(model::KeyRange{}, std::nullopt, 10);
  assert(page.rows.size() == 2);
  assert(page.rows[0].key == 1 && page.rows[1].key == 3);
}

void TestWritesJoinCallerTransaction() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = projection::MakeStore(model::ProjectionMode::kIndexedView, repo);

  {
    auto tx = repo->Begin();
    db::model::BaseRowRecord record{model::BaseRow{1, {{"FreeGHz", 4.8}}}, 1};
    db::ThrowIfError(repo->InsertBaseRow(*tx, record), "insert");
    assert(store->Upsert(*tx, Derived(1, 2.0, 1)) == WriteOutcome::kApplied);
    assert(store->Get(*tx, 1).has_value());
    tx->Rollback();
  }
  assert(!store->Get(1).has_value());

  {
    auto tx = repo->Begin();
    db::model::BaseRowRecord record{model::BaseRow{1, {{"FreeGHz", 4.8}}}, 1};
    db::ThrowIfError(repo->InsertBaseRow(*tx, record), "insert");
    assert(store->Upsert(*tx, Derived(1, 2.0, 1)) == WriteOutcome::kApplied);
    tx->Commit();
  }
  assert(StoredFreeCores(*store, 1) == 2.0);
}

void TestReadsDoNotWaitOnWriter() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = projection::MakeStore(model::ProjectionMode::kSummaryTable, repo, std::chrono::milliseconds(20));
  assert(store->Upsert(Derived(1, 2.0, 1)) == WriteOutcome::kApplied);

  auto writer = repo->Begin();
  assert(store->Upsert(*writer, Derived(1, 7.0, 2)) == WriteOutcome::kApplied);
  assert(store->Upsert(*writer, Derived(2, 3.0, 1)) == WriteOutcome::kApplied);

  // Readers see the last commit while the writer holds the lock.
  assert(StoredFreeCores(*store, 1) == 2.0);
  assert(!store->Get(2).has_value());
  assert(store->Scan(model::KeyRange{}, std::nullopt, 10).rows.size() == 1);

  bool        blocked = false;
  std::thread other([&] {
    try {
      store->Upsert(Derived(3, 1.0, 1));
    } catch (const util::StoreUnavailable&) {
      blocked = true;
    }
  });
  other.join();
  assert(blocked);

  writer->Commit();
  assert(StoredFreeCores(*store, 1) == 7.0);
  assert(StoredFreeCores(*store, 2) == 3.0);
}

} // namespace

int main() {
  TestUpsertThenGet();
  TestOlderVersionIsSuperseded();
  TestUnversionedUpsertKeepsVersion();
  TestInlineAndViewRequireBaseRow();
  TestRemoveIsVersioned();
  TestSummaryTombstoneRejectsLateUpsert();
  TestRemoveOfAbsentRow();
  TestSummaryPurgeDropsOldTombstones();
  TestScanPagesInKeyOrder();
  TestScanSkipsSummaryTombstones();
  TestWritesJoinCallerTransaction();
  TestReadsDoNotWaitOnWriter();

  std::cout << "projsync_unit_projection_store: pass\n";
  return 0;
}
