#include "internal/monitor/consistency_monitor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/derivation/ratio_rule.hpp"

namespace {

using namespace projsync;
using model::DriftKind;
using model::MutationEvent;
using model::SyncState;

constexpr auto kDrainTimeout = std::chrono::seconds(5);

// FreeCores rule that takes its time.
class SlowRule final : public derivation::DerivationRule {
 public:
  std::string Name() const override {
    return inner_.Name();
  }
  std::vector<std::string> InputColumns() const override {
    return inner_.InputColumns();
  }
  model::DerivedAttributes Derive(const model::BaseRow& row) const override {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return inner_.Derive(row);
  }

 private:
  derivation::RatioRule inner_{"FreeGHz", "FreeCores", 2.4};
};

sync::SynchronizerOptions FastOptions() {
  sync::SynchronizerOptions options;
  options.workers               = 2;
  options.retry_limit           = 0;
  options.retry_backoff_initial = std::chrono::milliseconds(1);
  options.retry_backoff_max     = std::chrono::milliseconds(1);
  return options;
}

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo  = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<monitor::DriftLedger>         drift = std::make_shared<monitor::DriftLedger>();
  std::shared_ptr<sync::Synchronizer>           synchronizer;
  std::unique_ptr<monitor::ConsistencyMonitor>  checker;

  explicit Fixture(model::ProjectionMode mode, monitor::MonitorOptions options = {}, sync::SynchronizerOptions sync_options = FastOptions(),
                   derivation::DerivationRulePtr rule = std::make_shared<derivation::RatioRule>("FreeGHz", "FreeCores", 2.4)) {
    synchronizer = std::make_shared<sync::Synchronizer>(std::move(rule), projection::MakeStore(mode, repo), drift, sync_options);
    synchronizer->Start();
    checker = std::make_unique<monitor::ConsistencyMonitor>(synchronizer, drift, options);
  }

  void PutBaseRow(model::RowKey key, double free_ghz, uint64_t version) {
    auto tx = repo->Begin();
    db::ThrowIfError(repo->InsertBaseRow(*tx, db::model::BaseRowRecord{model::BaseRow{key, {{"FreeGHz", free_ghz}}}, version}), "insert base row");
    tx->Commit();
  }

  // Base row plus a synchronized projection row.
  void PutSynced(model::RowKey key, double free_ghz, uint64_t version) {
    PutBaseRow(key, free_ghz, version);
    auto result = synchronizer->Submit(MutationEvent::Insert(version, model::BaseRow{key, {{"FreeGHz", free_ghz}}}));
    assert(result.state == SyncState::kConsistent);
  }
};

std::size_t CountKind(const monitor::SweepReport& report, DriftKind kind) {
  std::size_t count = 0;
  for (const auto& record : report.records) {
    if (record.kind == kind) ++count;
  }
  return count;
}

void TestCleanProjectionHasNoDrift() {
  Fixture f(model::ProjectionMode::kSummaryTable);
  for (model::RowKey key = 1; key <= 5; ++key) f.PutSynced(key, 2.4 * key, 1);

  auto report = f.checker->Sweep();
  assert(report.keys_checked == 5);
  assert(report.drift == 0);
  assert(report.records.empty());
  assert(f.drift->Total() == 0);
  assert(f.checker->LastReport().has_value());
}

void TestDetectsMissingMismatchAndOrphan() {
  Fixture f(model::ProjectionMode::kSummaryTable);
  f.PutSynced(1, 4.8, 1);
  f.PutSynced(2, 4.8, 1);
  f.PutBaseRow(3, 12.0, 1);

  assert(f.synchronizer->Store().Upsert(2, model::DerivedAttributes{{"FreeCores", 99.0}}) == projection::WriteOutcome::kApplied);
  assert(f.synchronizer->Store().Upsert(model::DerivedRow{9, {{"FreeCores", 1.0}}, 1, {}}) == projection::WriteOutcome::kApplied);

  auto report = f.checker->Sweep(false, 2);
  assert(report.keys_checked == 3);
  assert(report.drift == 3);
  assert(report.healed == 0);
  assert(CountKind(report, DriftKind::kMismatch) == 1);
  assert(CountKind(report, DriftKind::kMissing) == 1);
  assert(CountKind(report, DriftKind::kOrphan) == 1);
  assert(f.drift->Total() == 3);

  for (const auto& record : report.records) {
    if (record.kind == DriftKind::kMismatch) {
      assert(record.key == 2);
      assert(record.expected.has_value() && record.actual.has_value());
      assert(std::get<double>(record.expected->at("FreeCores")) == 2.0);
      assert(std::get<double>(record.actual->at("FreeCores")) == 99.0);
    } else if (record.kind == DriftKind::kMissing) {
      assert(record.key == 3);
      assert(!record.actual.has_value());
    } else {
      assert(record.key == 9);
      assert(!record.expected.has_value());
    }
  }

  // Detection alone leaves the store as it was.
  assert(std::get<double>(f.synchronizer->Store().Get(2)->attributes.at("FreeCores")) == 99.0);
}

void TestSelfHealRepairsDrift() {
  Fixture f(model::ProjectionMode::kSummaryTable);
  f.PutSynced(1, 4.8, 1);
  f.PutSynced(2, 4.8, 1);
  f.PutBaseRow(3, 12.0, 1);
  assert(f.synchronizer->Store().Upsert(2, model::DerivedAttributes{{"FreeCores", 99.0}}) == projection::WriteOutcome::kApplied);
  assert(f.synchronizer->Store().Upsert(model::DerivedRow{9, {{"FreeCores", 1.0}}, 1, {}}) == projection::WriteOutcome::kApplied);

  auto healing = f.checker->Sweep(true);
  assert(healing.drift == 3);
  assert(healing.healed == 3);
  assert(f.synchronizer->Drain(kDrainTimeout));

  auto& store = f.synchronizer->Store();
  assert(std::get<double>(store.Get(2)->attributes.at("FreeCores")) == 2.0);
  assert(std::get<double>(store.Get(3)->attributes.at("FreeCores")) == 5.0);
  assert(!store.Get(9).has_value());
  assert(f.synchronizer->StateOf(9) == SyncState::kAbsent);

  auto clean = f.checker->Sweep();
  assert(clean.drift == 0);
}

void TestHealsKeyWhoseSequenceIsPastBaseVersion() {
  Fixture f(model::ProjectionMode::kSummaryTable);
  f.PutBaseRow(1, 4.8, 1);
  assert(f.synchronizer->Submit(MutationEvent::Insert(10, model::BaseRow{1, {{"FreeGHz", 4.8}}})).state == SyncState::kConsistent);
  assert(f.synchronizer->Store().Upsert(1, model::DerivedAttributes{{"FreeCores", 99.0}}) == projection::WriteOutcome::kApplied);

  auto healing = f.checker->Sweep(true);
  assert(healing.drift == 1);
  assert(healing.healed == 1);
  assert(f.synchronizer->Drain(kDrainTimeout));

  assert(f.synchronizer->StateOf(1) == SyncState::kConsistent);
  auto row = f.synchronizer->Store().Get(1);
  assert(row.has_value());
  assert(row->version == 10);
  assert(std::get<double>(row->attributes.at("FreeCores")) == 2.0);

  // The key is checked again rather than skipped as busy.
  assert(f.synchronizer->Store().Upsert(1, model::DerivedAttributes{{"FreeCores", 42.0}}) == projection::WriteOutcome::kApplied);
  auto again = f.checker->Sweep(false);
  assert(again.drift == 1);
  assert(again.records.front().kind == DriftKind::kMismatch);
}

void TestDomainErrorWithStoredRowIsMismatch() {
  Fixture f(model::ProjectionMode::kSummaryTable);
  f.PutBaseRow(4, -1.0, 1);
  assert(f.synchronizer->Store().Upsert(model::DerivedRow{4, {{"FreeCores", 3.0}}, 1, {}}) == projection::WriteOutcome::kApplied);

  auto report = f.checker->Sweep(true);
  assert(report.drift == 1);
  assert(report.healed == 0);
  assert(report.records.front().kind == DriftKind::kMismatch);
  assert(!report.records.front().expected.has_value());
  assert(report.records.front().detail.find("negative") != std::string::npos);
}

void TestInlineModeSkipsOrphanScan() {
  Fixture f(model::ProjectionMode::kInline);
  f.PutSynced(1, 4.8, 1);
  f.PutBaseRow(2, 2.4, 1);

  auto report = f.checker->Sweep();
  assert(report.keys_checked == 2);
  assert(report.drift == 1);
  assert(report.records.front().kind == DriftKind::kMissing);
  assert(report.records.front().key == 2);
}

void TestPendingKeysPastWindowAreReported() {
  monitor::MonitorOptions options;
  options.staleness_window = std::chrono::milliseconds(10);

  auto sync_options             = FastOptions();
  sync_options.staleness_window = std::chrono::milliseconds(10);

  Fixture f(model::ProjectionMode::kSummaryTable, options, sync_options, std::make_shared<SlowRule>());

  auto result = f.synchronizer->Submit(MutationEvent::Insert(1, model::BaseRow{5, {{"FreeGHz", 4.8}}}));
  assert(result.state == SyncState::kPending);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto report = f.checker->Sweep();
  assert(CountKind(report, DriftKind::kStalenessExceeded) == 1);
  assert(report.records.back().key == 5);

  assert(f.synchronizer->Drain(kDrainTimeout));
}

void TestSweepPurgesExpiredTombstones() {
  monitor::MonitorOptions options;
  options.tombstone_retention = std::chrono::milliseconds(1);
  Fixture f(model::ProjectionMode::kSummaryTable, options);

  assert(f.synchronizer->Submit(MutationEvent::Insert(1, model::BaseRow{1, {{"FreeGHz", 4.8}}})).state == SyncState::kConsistent);
  assert(f.synchronizer->Submit(MutationEvent::Delete(2, 1)).state == SyncState::kAbsent);
  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  auto report = f.checker->Sweep();
  assert(report.tombstones_purged == 1);
  assert(report.drift == 0);
}

void TestBackgroundSweepRuns() {
  monitor::MonitorOptions options;
  options.sweep_interval = std::chrono::milliseconds(10);
  Fixture f(model::ProjectionMode::kSummaryTable, options);
  f.PutBaseRow(1, 4.8, 1);

  f.checker->Start();
  const auto deadline = std::chrono::steady_clock::now() + kDrainTimeout;
  while (!f.checker->LastReport() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  f.checker->Stop();

  auto last = f.checker->LastReport();
  assert(last.has_value());
  assert(last->keys_checked == 1);
  assert(CountKind(*last, DriftKind::kMissing) == 1);
}

} // namespace

int main() {
  TestCleanProjectionHasNoDrift();
  TestDetectsMissingMismatchAndOrphan();
  TestSelfHealRepairsDrift();
  TestHealsKeyWhoseSequenceIsPastBaseVersion();
  TestDomainErrorWithStoredRowIsMismatch();
  TestInlineModeSkipsOrphanScan();
  TestPendingKeysPastWindowAreReported();
  TestSweepPurgesExpiredTombstones();
  TestBackgroundSweepRuns();

  std::cout << "projsync_unit_consistency_monitor: pass\n";
  return 0;
}
