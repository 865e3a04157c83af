#include "internal/core/cluster_importer.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/derivation/ratio_rule.hpp"
#include "internal/monitor/drift_sink.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace projsync;
using model::SyncState;

struct Fixture {
  std::shared_ptr<db::memory::MemoryRepository> repo  = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<monitor::DriftLedger>         drift = std::make_shared<monitor::DriftLedger>();
  std::shared_ptr<sync::Synchronizer>           synchronizer;
  std::unique_ptr<core::ClusterImporter>        importer;

  explicit Fixture(model::ProjectionMode mode) {
    sync::SynchronizerOptions options;
    options.workers               = 2;
    options.retry_limit           = 0;
    options.retry_backoff_initial = std::chrono::milliseconds(1);
    options.retry_backoff_max     = std::chrono::milliseconds(1);

    auto rule    = std::make_shared<derivation::RatioRule>("FreeGHz", "FreeCores", 2.4);
    synchronizer = std::make_shared<sync::Synchronizer>(rule, projection::MakeStore(mode, repo), drift, options);
    synchronizer->Start();
    importer = std::make_unique<core::ClusterImporter>(repo, synchronizer);
  }

  std::optional<db::model::BaseRowRecord> BaseRow(int64_t key) {
    auto tx  = repo->Begin();
    auto row = repo->GetBaseRow(*tx, key);
    tx->Commit();
    return row;
  }

  std::size_t StatCount(int64_t cluster_id) {
    auto tx    = repo->Begin();
    auto stats = repo->ListClusterStats(*tx, cluster_id);
    tx->Commit();
    return stats.size();
  }
};

projsync::v1::ClusterStat Stat(int64_t timestamp_ms, std::optional<double> free_ghz, double cpu_usage = 25.0) {
  projsync::v1::ClusterStat stat;
  *stat.mutable_timestamp() = util::ToProto(util::FromUnixMillis(timestamp_ms));
  stat.set_cpu_usage(cpu_usage);
  stat.set_active_connections(12);
  if (free_ghz) stat.set_free_ghz(*free_ghz);
  return stat;
}

projsync::v1::ClusterData Cluster(const std::string& name, std::initializer_list<projsync::v1::ClusterStat> stats) {
  projsync::v1::ClusterData cluster;
  cluster.mutable_properties()->set_cluster_name(name);
  cluster.mutable_properties()->set_region("eu-west-1");
  for (const auto& stat : stats) *cluster.add_stats() = stat;
  return cluster;
}

double FreeCores(const model::DerivedRow& row) {
  return std::get<double>(row.attributes.at("FreeCores"));
}

void TestStatColumnsKeepUnsetFieldsNull() {
  projsync::v1::ClusterStat stat;
  stat.set_free_ghz(4.8);
  stat.set_error_count(3);

  auto columns = core::StatColumns(stat);
  assert(std::get<double>(columns.at("FreeGHz")) == 4.8);
  assert(std::get<double>(columns.at("error_count")) == 3.0);
  assert(model::IsNull(columns.at("cpu_usage")));
  assert(model::IsNull(columns.at("response_time_ms")));
  assert(columns.size() == 9);
}

void TestImportWritesHistoryAndNewestBaseRow() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  auto result = f.importer->Import({Cluster("alpha", {Stat(1000, 2.4), Stat(3000, 4.8), Stat(2000, 7.2)}),
                                    Cluster("beta", {Stat(1000, 12.0)})});
  assert(result.cluster_ids.size() == 2);
  assert(result.stats_written == 4);
  assert(result.sync_results.size() == 2);
  for (const auto& sync_result : result.sync_results) assert(sync_result.state == SyncState::kConsistent);

  const auto alpha = result.cluster_ids[0];
  const auto beta  = result.cluster_ids[1];
  assert(alpha != beta);
  assert(f.StatCount(alpha) == 3);

  auto base = f.BaseRow(alpha);
  assert(base.has_value());
  assert(std::get<double>(base->row.columns.at("FreeGHz")) == 4.8);
  assert(std::get<double>(base->row.columns.at("timestamp_ms")) == 3000.0);

  auto derived = f.synchronizer->Store().Get(alpha);
  assert(derived.has_value());
  assert(std::fabs(FreeCores(*derived) - 2.0) < 1e-12);
  assert(derived->version == base->version);
  assert(std::fabs(FreeCores(*f.synchronizer->Store().Get(beta)) - 5.0) < 1e-12);
}

void TestReimportUpdatesSameCluster() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  auto first  = f.importer->Import({Cluster("alpha", {Stat(1000, 4.8)})});
  auto second = f.importer->Import({Cluster("alpha", {Stat(2000, 9.6)})});
  assert(first.cluster_ids.front() == second.cluster_ids.front());

  const auto id      = first.cluster_ids.front();
  auto       derived = f.synchronizer->Store().Get(id);
  assert(derived.has_value());
  assert(std::fabs(FreeCores(*derived) - 4.0) < 1e-12);
  assert(derived->version == f.BaseRow(id)->version);
  assert(f.StatCount(id) == 2);
}

void TestLateStatOnlyExtendsHistory() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  auto first = f.importer->Import({Cluster("alpha", {Stat(5000, 4.8)})});
  const auto id      = first.cluster_ids.front();
  const auto version = f.BaseRow(id)->version;

  auto late = f.importer->Import({Cluster("alpha", {Stat(1000, 24.0)})});
  assert(late.sync_results.empty());
  assert(late.stats_written == 1);
  assert(f.StatCount(id) == 2);
  assert(f.BaseRow(id)->version == version);
  assert(std::fabs(FreeCores(*f.synchronizer->Store().Get(id)) - 2.0) < 1e-12);
}

void TestUnrelatedStatChangeSkipsDerivation() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  auto first = f.importer->Import({Cluster("alpha", {Stat(1000, 4.8, 10.0)})});
  const auto id = first.cluster_ids.front();
  const auto derived_version = f.synchronizer->Store().Get(id)->version;

  auto second = f.importer->Import({Cluster("alpha", {Stat(2000, 4.8, 90.0)})});
  assert(second.sync_results.size() == 1);
  assert(second.sync_results.front().state == SyncState::kConsistent);
  assert(f.synchronizer->Store().Get(id)->version == derived_version);
  assert(f.synchronizer->Snapshot().events_skipped == 1);
}

void TestDualWriteInInlineMode() {
  Fixture f(model::ProjectionMode::kInline);
  assert(f.importer->DualWrite());

  auto result = f.importer->Import({Cluster("alpha", {Stat(1000, 4.8)})});
  assert(result.sync_results.size() == 1);
  assert(result.sync_results.front().state == SyncState::kConsistent);

  const auto id = result.cluster_ids.front();
  assert(std::fabs(FreeCores(*f.synchronizer->Store().Get(id)) - 2.0) < 1e-12);
  assert(f.synchronizer->Snapshot().queued_events == 0);
}

void TestNullFreeGhzDerivesNullFreeCores() {
  Fixture f(model::ProjectionMode::kIndexedView);

  auto result  = f.importer->Import({Cluster("alpha", {Stat(1000, std::nullopt)})});
  auto derived = f.synchronizer->Store().Get(result.cluster_ids.front());
  assert(derived.has_value());
  assert(model::IsNull(derived->attributes.at("FreeCores")));
}

void TestNegativeFreeGhzCommitsBaseRowAndFails() {
  Fixture f(model::ProjectionMode::kInline);

  auto result = f.importer->Import({Cluster("alpha", {Stat(1000, -1.0)})});
  assert(result.sync_results.front().state == SyncState::kFailed);
  assert(f.synchronizer->Drain(std::chrono::seconds(5)));

  const auto id = result.cluster_ids.front();
  assert(f.BaseRow(id).has_value());
  assert(!f.synchronizer->Store().Get(id).has_value());
  assert(f.drift->Total() == 1);
}

void TestInvalidBatchWritesNothing() {
  Fixture f(model::ProjectionMode::kSummaryTable);

  projsync::v1::ClusterData no_timestamp = Cluster("beta", {});
  no_timestamp.add_stats()->set_free_ghz(4.8);

  for (const auto& bad : {Cluster("", {Stat(1000, 4.8)}), no_timestamp}) {
    bool threw = false;
    try {
      (void)f.importer->Import({Cluster("alpha", {Stat(1000, 4.8)}), bad});
    } catch (const util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }

  auto tx = f.repo->Begin();
  assert(!f.repo->FindClusterByName(*tx, "alpha").has_value());
  assert(f.repo->ListBaseKeys(*tx, std::nullopt, 10).empty());
  tx->Commit();
}

void TestDeleteClusterRemovesProjection() {
  for (auto mode : {model::ProjectionMode::kInline, model::ProjectionMode::kSummaryTable}) {
    Fixture f(mode);

    auto       result = f.importer->Import({Cluster("alpha", {Stat(1000, 4.8)})});
    const auto id     = result.cluster_ids.front();
    assert(f.synchronizer->Store().Get(id).has_value());

    assert(f.importer->DeleteCluster("alpha") == id);
    assert(f.synchronizer->Drain(std::chrono::seconds(5)));
    assert(!f.BaseRow(id).has_value());
    assert(!f.synchronizer->Store().Get(id).has_value());
    assert(f.synchronizer->StateOf(id) == SyncState::kAbsent);
    assert(f.StatCount(id) == 0);

    bool threw = false;
    try {
      (void)f.importer->DeleteCluster("alpha");
    } catch (const util::NotFound&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestStatColumnsKeepUnsetFieldsNull();
  TestImportWritesHistoryAndNewestBaseRow();
  TestReimportUpdatesSameCluster();
  TestLateStatOnlyExtendsHistory();
  TestUnrelatedStatChangeSkipsDerivation();
  TestDualWriteInInlineMode();
  TestNullFreeGhzDerivesNullFreeCores();
  TestNegativeFreeGhzCommitsBaseRowAndFails();
  TestInvalidBatchWritesNothing();
  TestDeleteClusterRemovesProjection();

  std::cout << "projsync_unit_cluster_importer: pass\n";
  return 0;
}
