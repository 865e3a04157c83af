#include "internal/sync/synchronizer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/derivation/ratio_rule.hpp"
#include "internal/monitor/drift_sink.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace projsync;
using model::MutationEvent;
using model::SyncState;

constexpr auto kDrainTimeout = std::chrono::seconds(5);

sync::SynchronizerOptions FastOptions() {
  sync::SynchronizerOptions options;
  options.workers               = 2;
  options.store_threads         = 2;
  options.retry_limit           = 2;
  options.retry_backoff_initial = std::chrono::milliseconds(1);
  options.retry_backoff_max     = std::chrono::milliseconds(4);
  return options;
}

derivation::DerivationRulePtr FreeCoresRule() {
  return std::make_shared<derivation::RatioRule>("FreeGHz", "FreeCores", 2.4);
}

// Counts Derive() calls on top of the FreeCores rule.
class CountingRule final : public derivation::DerivationRule {
 public:
  std::string Name() const override {
    return inner_.Name();
  }
  std::vector<std::string> InputColumns() const override {
    return inner_.InputColumns();
  }
  model::DerivedAttributes Derive(const model::BaseRow& row) const override {
    ++calls;
    return inner_.Derive(row);
  }

  mutable std::atomic<int> calls{0};

 private:
  derivation::RatioRule inner_{"FreeGHz", "FreeCores", 2.4};
};

// Summary-shaped store whose writes fail or stall on demand.
class ScriptedStore final : public projection::ProjectionStore {
 public:
  using ProjectionStore::ProjectionStore;

  model::ProjectionMode Mode() const override {
    return model::ProjectionMode::kSummaryTable;
  }

  std::atomic<int>                       failures_left{0};
  std::atomic<int>                       write_calls{0};
  std::chrono::milliseconds              write_delay{0};

 protected:
  db::ProjectionTable Table() const override {
    return db::ProjectionTable::kSummary;
  }

  projection::WriteOutcome DoUpsert(db::Transaction& tx, const model::DerivedRow& row) override {
    ++write_calls;
    if (write_delay.count() > 0) std::this_thread::sleep_for(write_delay);
    if (failures_left.fetch_sub(1) > 0) throw util::StoreUnavailable("scripted store failure");

    auto stored = StoredVersion(tx, row.key);
    if (stored && *stored > row.version) return projection::WriteOutcome::kSuperseded;
    db::ThrowIfError(repository_->UpsertDerived(tx, Table(), row), "scripted upsert");
    return projection::WriteOutcome::kApplied;
  }

  projection::WriteOutcome DoRemove(db::Transaction& tx, model::RowKey key, uint64_t) override {
    db::ThrowIfError(repository_->RemoveDerived(tx, Table(), key), "scripted remove");
    return projection::WriteOutcome::kApplied;
  }
};

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<monitor::DriftLedger>         drift = std::make_shared<monitor::DriftLedger>();
  std::shared_ptr<sync::Synchronizer>           synchronizer;

  explicit Fixture(model::ProjectionMode mode, sync::SynchronizerOptions options = FastOptions(),
                   derivation::DerivationRulePtr rule = FreeCoresRule()) {
    synchronizer = std::make_shared<sync::Synchronizer>(std::move(rule), projection::MakeStore(mode, repo), drift, options);
    synchronizer->Start();
  }

  Fixture(projection::ProjectionStorePtr store, sync::SynchronizerOptions options) {
    synchronizer = std::make_shared<sync::Synchronizer>(FreeCoresRule(), std::move(store), drift, options);
    synchronizer->Start();
  }

  void PutBaseRow(const model::BaseRow& row, uint64_t version) {
    auto tx = repo->Begin();
    db::model::BaseRowRecord record{row, version};
    if (repo->GetBaseRow(*tx, row.key)) {
      db::ThrowIfError(repo->UpdateBaseRow(*tx, record), "update base row");
    } else {
      db::ThrowIfError(repo->InsertBaseRow(*tx, record), "insert base row");
    }
    tx->Commit();
  }

  std::optional<model::DerivedRow> Stored(model::RowKey key) {
    return synchronizer->Store().Get(key);
  }
};

model::BaseRow Row(model::RowKey key, double free_ghz, double cpu_usage = 10.0) {
  return model::BaseRow{key, {{"FreeGHz", free_ghz}, {"cpu_usage", cpu_usage}}};
}

double FreeCores(const model::DerivedRow& row) {
  return std::get<double>(row.attributes.at("FreeCores"));
}

void TestInsertDerivesFreeCores() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  auto result = f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8)));
  assert(result.state == SyncState::kConsistent);
  assert(result.error.empty());

  auto stored = f.Stored(1);
  assert(stored.has_value());
  assert(std::fabs(FreeCores(*stored) - 2.0) < 1e-12);
  assert(stored->version == 1);
  assert(f.synchronizer->StateOf(1) == SyncState::kConsistent);
}

void TestUpdateRecomputesWithNewVersion() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  assert(f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8))).state == SyncState::kConsistent);
  auto result = f.synchronizer->Submit(MutationEvent::Update(2, Row(1, 4.8), Row(1, 12.0)));
  assert(result.state == SyncState::kConsistent);

  auto stored = f.Stored(1);
  assert(stored.has_value());
  assert(std::fabs(FreeCores(*stored) - 5.0) < 1e-12);
  assert(stored->version == 2);
}

void TestUnrelatedUpdateIsNotRecomputed() {
  auto rule = std::make_shared<CountingRule>();
  Fixture f(model::ProjectionMode::kSummaryTable, FastOptions(), rule);

  assert(f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8, 10.0))).state == SyncState::kConsistent);
  assert(rule->calls == 1);

  auto result = f.synchronizer->Submit(MutationEvent::Update(2, Row(1, 4.8, 10.0), Row(1, 4.8, 95.0)));
  assert(result.state == SyncState::kConsistent);
  assert(rule->calls == 1);

  auto stored = f.Stored(1);
  assert(stored.has_value());
  assert(stored->version == 1);

  auto stats = f.synchronizer->Snapshot();
  assert(stats.events_skipped == 1);
  assert(stats.events_applied == 1);
}

void TestDomainErrorLeavesPriorRowAndReportsDrift() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  assert(f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8))).state == SyncState::kConsistent);

  auto result = f.synchronizer->Submit(MutationEvent::Update(2, Row(1, 4.8), Row(1, -1.0)));
  assert(result.state == SyncState::kFailed);
  assert(result.error.find("negative") != std::string::npos);

  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(1) == SyncState::kFailed);

  auto status = f.synchronizer->StatusOf(1);
  assert(status.has_value());
  assert(status->attempts == FastOptions().retry_limit + 1);

  auto stored = f.Stored(1);
  assert(stored.has_value());
  assert(std::fabs(FreeCores(*stored) - 2.0) < 1e-12);
  assert(stored->version == 1);

  assert(f.drift->Total() == 1);
  auto records = f.drift->Recent(10);
  assert(records.size() == 1);
  assert(records.front().key == 1);
  assert(records.front().kind == model::DriftKind::kSyncFailed);
  assert(!records.front().expected.has_value());
  assert(records.front().actual.has_value());
}

void TestNewerEventRecoversFailedKey() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  assert(f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, -1.0))).state == SyncState::kFailed);
  assert(f.synchronizer->Drain(kDrainTimeout));

  auto result = f.synchronizer->Submit(MutationEvent::Update(2, Row(1, -1.0), Row(1, 2.4)));
  assert(result.state == SyncState::kConsistent);
  assert(FreeCores(*f.Stored(1)) == 1.0);
}

void TestOrderingViolationIsRejected() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  assert(f.synchronizer->Submit(MutationEvent::Insert(5, Row(1, 4.8))).state == SyncState::kConsistent);

  for (uint64_t sequence : {5u, 3u}) {
    bool threw = false;
    try {
      (void)f.synchronizer->Submit(MutationEvent::Update(sequence, Row(1, 4.8), Row(1, 9.6)));
    } catch (const util::OrderingViolation&) {
      threw = true;
    }
    assert(threw);
  }

  // Other keys keep their own sequence.
  assert(f.synchronizer->Submit(MutationEvent::Insert(1, Row(2, 2.4))).state == SyncState::kConsistent);
  assert(FreeCores(*f.Stored(1)) == 2.0);
}

void TestZeroSequenceIsRejected() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  bool threw = false;
  try {
    (void)f.synchronizer->Submit(MutationEvent::Insert(0, Row(1, 4.8)));
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSubmitAfterStopFails() {
  Fixture f(model::ProjectionMode::kSummaryTable);
  f.synchronizer->Stop();

  bool threw = false;
  try {
    (void)f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8)));
  } catch (const util::SyncFailed&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteMakesKeyAbsent() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  assert(f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8))).state == SyncState::kConsistent);
  auto result = f.synchronizer->Submit(MutationEvent::Delete(2, 1));
  assert(result.state == SyncState::kAbsent);
  assert(!f.Stored(1).has_value());

  // The absent key keeps its last sequence, so a replayed insert is refused.
  auto status = f.synchronizer->StatusOf(1);
  assert(status.has_value());
  assert(status->state == SyncState::kAbsent);
  assert(status->last_sequence == 2);

  bool threw = false;
  try {
    (void)f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8)));
  } catch (const util::OrderingViolation&) {
    threw = true;
  }
  assert(threw);
  assert(!f.Stored(1).has_value());
  assert(f.synchronizer->Snapshot().keys_absent == 1);
}

void TestInlineWithoutBaseRowEndsAbsent() {
  Fixture f(model::ProjectionMode::kInline);

  auto result = f.synchronizer->Submit(MutationEvent::Insert(1, Row(9, 4.8)));
  assert(result.state == SyncState::kAbsent);
  assert(!f.Stored(9).has_value());

  f.PutBaseRow(Row(10, 4.8), 2);
  assert(f.synchronizer->Submit(MutationEvent::Insert(2, Row(10, 4.8))).state == SyncState::kConsistent);
  assert(FreeCores(*f.Stored(10)) == 2.0);
}

void TestTransientStoreFailureIsRetried() {
  auto repo  = std::make_shared<db::memory::MemoryRepository>();
  auto store = std::make_shared<ScriptedStore>(repo, db::Repository::kDefaultLockTimeout);
  store->failures_left = 2;
  Fixture f(store, FastOptions());

  auto first = f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8)));
  assert(first.state == SyncState::kFailed);

  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(1) == SyncState::kConsistent);
  assert(store->write_calls == 3);
  assert(f.drift->Total() == 0);

  auto stats = f.synchronizer->Snapshot();
  assert(stats.events_failed == 2);
  assert(stats.events_applied == 1);
  assert(stats.keys_consistent == 1);
}

void TestUpsertDeadlineMarksFailed() {
  auto repo          = std::make_shared<db::memory::MemoryRepository>();
  auto store         = std::make_shared<ScriptedStore>(repo, db::Repository::kDefaultLockTimeout);
  store->write_delay = std::chrono::milliseconds(200);

  auto options            = FastOptions();
  options.retry_limit     = 0;
  options.upsert_deadline = std::chrono::milliseconds(20);
  Fixture f(store, options);

  auto result = f.synchronizer->Submit(MutationEvent::Insert(1, Row(1, 4.8)));
  assert(result.state == SyncState::kFailed);
  assert(result.error.find("exceeded") != std::string::npos);

  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(1) == SyncState::kFailed);

  auto records = f.drift->Recent(1);
  assert(records.size() == 1);
  assert(records.front().kind == model::DriftKind::kSyncFailed);
  assert(records.front().expected.has_value());
}

void TestStalenessWindowReturnsPending() {
  auto options             = FastOptions();
  options.staleness_window = std::chrono::milliseconds(1000);
  Fixture f(model::ProjectionMode::kSummaryTable, options);

  for (uint64_t sequence = 1; sequence <= 3; ++sequence) {
    model::MutationEvent event = sequence == 1 ? MutationEvent::Insert(1, Row(7, 2.4))
                                               : MutationEvent::Update(sequence, Row(7, 2.4 * (sequence - 1)), Row(7, 2.4 * sequence));
    auto result = f.synchronizer->Submit(event);
    assert(result.state == SyncState::kPending);
  }

  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(7) == SyncState::kConsistent);

  auto stored = f.Stored(7);
  assert(stored.has_value());
  assert(stored->version == 3);
  assert(std::fabs(FreeCores(*stored) - 3.0) < 1e-12);
}

void TestDualWriteAppliesInsideTransaction() {
  Fixture f(model::ProjectionMode::kIndexedView);

  auto event = MutationEvent::Insert(1, Row(4, 4.8));
  sync::InlineApply applied;
  {
    auto tx = f.repo->Begin();
    db::ThrowIfError(f.repo->InsertBaseRow(*tx, db::model::BaseRowRecord{Row(4, 4.8), 1}), "insert base row");
    applied = f.synchronizer->ApplyWithin(*tx, event);
    assert(applied.outcome == projection::WriteOutcome::kApplied);
    tx->Commit();
  }

  auto result = f.synchronizer->Acknowledge(applied);
  assert(result.state == SyncState::kConsistent);
  assert(FreeCores(*f.Stored(4)) == 2.0);

  bool threw = false;
  try {
    (void)f.synchronizer->Acknowledge(applied);
  } catch (const util::OrderingViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestDualWriteDomainErrorRollsIntoRetry() {
  Fixture f(model::ProjectionMode::kIndexedView);

  auto event = MutationEvent::Insert(1, Row(4, -2.0));
  sync::InlineApply applied;
  {
    auto tx = f.repo->Begin();
    db::ThrowIfError(f.repo->InsertBaseRow(*tx, db::model::BaseRowRecord{Row(4, -2.0), 1}), "insert base row");
    applied = f.synchronizer->ApplyWithin(*tx, event);
    assert(!applied.error.empty());
    assert(!applied.outcome.has_value());
    tx->Commit();
  }

  auto result = f.synchronizer->Acknowledge(applied);
  assert(result.state == SyncState::kFailed);
  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.drift->Total() == 1);
  assert(!f.Stored(4).has_value());
}

void TestResyncRepairsAndRemoves() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  f.synchronizer->Store().Upsert(model::DerivedRow{3, {{"FreeCores", 99.0}}, 4, {}});
  f.synchronizer->Resync(3, Row(3, 4.8), 4);
  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(3) == SyncState::kConsistent);
  assert(FreeCores(*f.Stored(3)) == 2.0);

  f.synchronizer->Resync(3, std::nullopt, 5);
  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(3) == SyncState::kAbsent);
  assert(!f.Stored(3).has_value());
}

void TestResyncBelowLastSequenceStillSettles() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  assert(f.synchronizer->Submit(MutationEvent::Insert(10, Row(1, 4.8))).state == SyncState::kConsistent);
  f.synchronizer->Store().Upsert(1, model::DerivedAttributes{{"FreeCores", 99.0}});

  f.synchronizer->Resync(1, Row(1, 4.8), 1);
  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(1) == SyncState::kConsistent);
  assert(f.Stored(1)->version == 10);
  assert(FreeCores(*f.Stored(1)) == 2.0);

  f.synchronizer->Resync(1, std::nullopt, 2);
  assert(f.synchronizer->Drain(kDrainTimeout));
  assert(f.synchronizer->StateOf(1) == SyncState::kAbsent);
  assert(!f.Stored(1).has_value());

  // The next event must still follow the last accepted sequence.
  assert(f.synchronizer->Submit(MutationEvent::Insert(11, Row(1, 12.0))).state == SyncState::kConsistent);
  assert(FreeCores(*f.Stored(1)) == 5.0);
}

void TestIndependentKeysAllConverge() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  std::vector<std::thread> writers;
  for (model::RowKey key = 1; key <= 8; ++key) {
    writers.emplace_back([&f, key] {
      (void)f.synchronizer->Submit(MutationEvent::Insert(1, Row(key, 2.4 * key)));
      (void)f.synchronizer->Submit(MutationEvent::Update(2, Row(key, 2.4 * key), Row(key, 4.8 * key)));
    });
  }
  for (auto& writer : writers) writer.join();
  assert(f.synchronizer->Drain(kDrainTimeout));

  for (model::RowKey key = 1; key <= 8; ++key) {
    auto stored = f.Stored(key);
    assert(stored.has_value());
    assert(stored->version == 2);
    assert(std::fabs(FreeCores(*stored) - 2.0 * key) < 1e-9);
  }
  assert(f.synchronizer->Snapshot().keys_consistent == 8);
}

} // namespace

int main() {
  TestInsertDerivesFreeCores();
  TestUpdateRecomputesWithNewVersion();
  TestUnrelatedUpdateIsNotRecomputed();
  TestDomainErrorLeavesPriorRowAndReportsDrift();
  TestNewerEventRecoversFailedKey();
  TestOrderingViolationIsRejected();
  TestZeroSequenceIsRejected();
  TestSubmitAfterStopFails();
  TestDeleteMakesKeyAbsent();
  TestInlineWithoutBaseRowEndsAbsent();
  TestTransientStoreFailureIsRetried();
  TestUpsertDeadlineMarksFailed();
  TestStalenessWindowReturnsPending();
  TestDualWriteAppliesInsideTransaction();
  TestDualWriteDomainErrorRollsIntoRetry();
  TestResyncRepairsAndRemoves();
  TestResyncBelowLastSequenceStillSettles();
  TestIndependentKeysAllConverge();

  std::cout << "projsync_unit_synchronizer: pass\n";
  return 0;
}
