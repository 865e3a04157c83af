#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/mutation_feed_service.hpp"
#include "internal/service/read_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "projsync/v1/services.pb.h"

namespace {

using projsync::runtime::config::RuntimeConfig;

projsync::factory::Application BuildApp(const std::string& mode) {
  RuntimeConfig config;
  config.mutable_sync()->set_mode(mode);
  config.mutable_sync()->set_retry_limit(0);
  auto app = projsync::factory::Build(config);
  app.Start();
  return app;
}

projsync::v1::ImportRequest ImportOf(const std::string& name, int64_t timestamp_ms, double free_ghz) {
  projsync::v1::ImportRequest req;
  auto*                       cluster = req.add_clusters();
  cluster->mutable_properties()->set_cluster_name(name);
  auto* stat                = cluster->add_stats();
  *stat->mutable_timestamp() = projsync::util::ToProto(projsync::util::FromUnixMillis(timestamp_ms));
  stat->set_free_ghz(free_ghz);
  stat->set_cpu_usage(40.0);
  return req;
}

projsync::v1::MutationEvent InsertEvent(uint64_t sequence, int64_t key, double free_ghz) {
  projsync::v1::MutationEvent event;
  event.set_sequence(sequence);
  auto* row = event.mutable_insert()->mutable_row();
  row->set_key(key);
  (*row->mutable_columns()->mutable_fields())["FreeGHz"].set_number_value(free_ghz);
  return event;
}

double FreeCores(const projsync::v1::DerivedRow& row) {
  return row.derived_attributes().fields().at("FreeCores").number_value();
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestImportThenRead() {
  auto app = BuildApp("inline");

  const auto imported = app.ingest_service->ImportClusters(ImportOf("alpha", 1000, 4.8));
  assert(imported.status() == "success");
  assert(imported.message() == "Imported 1 clusters with their stats");
  assert(imported.cluster_ids_size() == 1);
  assert(imported.stats_written() == 1);

  projsync::v1::GetRequest get;
  get.set_key(imported.cluster_ids(0));
  const auto found = app.read_service->Get(get);
  assert(found.found());
  assert(std::fabs(FreeCores(found.row()) - 2.0) < 1e-12);
  assert(found.row().has_last_synced_at());

  get.set_key(imported.cluster_ids(0) + 1000);
  assert(!app.read_service->Get(get).found());
  app.Stop();
}

void TestScanPagesAndValidatesRange() {
  auto app = BuildApp("indexed-view");
  for (int i = 0; i < 5; ++i) {
    (void)app.ingest_service->ImportClusters(ImportOf("cluster-" + std::to_string(i), 1000, 2.4 * (i + 1)));
  }

  projsync::v1::ScanRequest scan;
  scan.set_limit(2);
  auto first = app.read_service->Scan(scan);
  assert(first.rows_size() == 2);
  assert(first.has_next_cursor());

  scan.set_cursor(first.next_cursor());
  scan.set_limit(0);
  auto rest = app.read_service->Scan(scan);
  assert(rest.rows_size() == 3);
  assert(!rest.has_next_cursor());
  assert(rest.rows(0).key() > first.rows(1).key());

  projsync::v1::ScanRequest bad;
  bad.set_start_key(10);
  bad.set_end_key(5);
  assert(Throws<projsync::util::InvalidArgument>([&] { (void)app.read_service->Scan(bad); }));
  app.Stop();
}

void TestEmptyImportIsRejected() {
  auto app = BuildApp("inline");
  assert(Throws<projsync::util::InvalidArgument>([&] { (void)app.ingest_service->ImportClusters(projsync::v1::ImportRequest{}); }));
  app.Stop();
}

void TestDeleteUnknownClusterIsNotFound() {
  auto app = BuildApp("inline");

  projsync::v1::DeleteClusterRequest req;
  req.set_cluster_name("nope");
  assert(Throws<projsync::util::NotFound>([&] { (void)app.ingest_service->DeleteCluster(req); }));

  const auto imported = app.ingest_service->ImportClusters(ImportOf("alpha", 1000, 4.8));
  req.set_cluster_name("alpha");
  assert(app.ingest_service->DeleteCluster(req).cluster_id() == imported.cluster_ids(0));

  projsync::v1::GetRequest get;
  get.set_key(imported.cluster_ids(0));
  assert(!app.read_service->Get(get).found());
  app.Stop();
}

void TestFeedAppliesEventsInOrder() {
  auto app = BuildApp("summary-table");

  projsync::v1::ApplyRequest req;
  *req.add_events() = InsertEvent(1, 100, 4.8);
  *req.add_events() = InsertEvent(1, 101, -1.0);
  const auto resp   = app.feed_service->Apply(req);
  assert(resp.results_size() == 2);
  assert(resp.results(0).key() == 100);
  assert(resp.results(0).state() == projsync::v1::SYNC_STATE_CONSISTENT);
  assert(resp.results(1).state() == projsync::v1::SYNC_STATE_FAILED);
  assert(!resp.results(1).error().empty());

  projsync::v1::GetRequest get;
  get.set_key(100);
  assert(std::fabs(FreeCores(app.read_service->Get(get).row()) - 2.0) < 1e-12);

  projsync::v1::ApplyRequest stale;
  *stale.add_events() = InsertEvent(1, 100, 9.6);
  assert(Throws<projsync::util::OrderingViolation>([&] { (void)app.feed_service->Apply(stale); }));

  projsync::v1::ApplyRequest empty_change;
  empty_change.add_events()->set_sequence(7);
  assert(Throws<projsync::util::InvalidArgument>([&] { (void)app.feed_service->Apply(empty_change); }));
  app.Stop();
}

void TestAdminReportsStatsHealthAndDrift() {
  auto app = BuildApp("summary-table");
  (void)app.ingest_service->ImportClusters(ImportOf("alpha", 1000, 4.8));

  // A base row the synchronizer never heard about.
  {
    auto tx = app.repository->Begin();
    projsync::db::model::BaseRowRecord record{projsync::model::BaseRow{500, {{"FreeGHz", 2.4}}}, 99};
    projsync::db::ThrowIfError(app.repository->InsertBaseRow(*tx, record), "insert base row");
    tx->Commit();
  }

  const auto health = app.admin_service->Health(projsync::v1::HealthRequest{});
  assert(health.status() == "healthy");
  assert(health.database() == "connected");

  projsync::v1::SweepRequest sweep;
  const auto report = app.admin_service->Sweep(sweep);
  assert(report.keys_checked() == 2);
  assert(report.drift_size() == 1);
  assert(report.drift(0).key() == 500);
  assert(report.drift(0).kind() == projsync::v1::DRIFT_KIND_MISSING);
  assert(report.healed() == 0);

  sweep.set_self_heal(true);
  assert(app.admin_service->Sweep(sweep).healed() == 1);
  assert(app.synchronizer->Drain(std::chrono::seconds(5)));

  projsync::v1::GetRequest get;
  get.set_key(500);
  assert(app.read_service->Get(get).found());

  const auto drift = app.admin_service->ListDrift(projsync::v1::ListDriftRequest{});
  assert(drift.drift_size() == 2);

  const auto stats = app.admin_service->Stats(projsync::v1::StatsRequest{});
  assert(stats.mode() == "summary-table");
  assert(stats.keys_consistent() == 2);
  assert(stats.drift_records() == 2);
  assert(stats.queued_events() == 0);
  app.Stop();
}

} // namespace

int main() {
  TestImportThenRead();
  TestScanPagesAndValidatesRange();
  TestEmptyImportIsRejected();
  TestDeleteUnknownClusterIsNotFound();
  TestFeedAppliesEventsInOrder();
  TestAdminReportsStatsHealthAndDrift();

  std::cout << "projsync_unit_services: pass\n";
  return 0;
}
