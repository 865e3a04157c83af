#include "consistency_monitor.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/projection/summary_table_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace projsync::monitor {

namespace {

struct Observed {
  db::model::BaseRowRecord         base;
  std::optional<model::DerivedRow> stored;
};

} // namespace

ConsistencyMonitor::ConsistencyMonitor(std::shared_ptr<sync::Synchronizer> synchronizer, std::shared_ptr<DriftSink> sink, MonitorOptions options)
    : synchronizer_(std::move(synchronizer)), sink_(std::move(sink)), options_(options) {
  if (!synchronizer_) throw std::invalid_argument("consistency monitor requires a synchronizer");
  if (!sink_) throw std::invalid_argument("consistency monitor requires a drift sink");
  if (options_.batch_size == 0) options_.batch_size = 1;
}

ConsistencyMonitor::~ConsistencyMonitor() {
  Stop();
}

SweepReport ConsistencyMonitor::Sweep() {
  return Sweep(options_.self_heal);
}

SweepReport ConsistencyMonitor::Sweep(bool self_heal, std::size_t batch_size) {
  if (batch_size == 0) batch_size = options_.batch_size;
  std::lock_guard sweep_lock(sweep_mutex_);

  const auto* mode = model::ToString(synchronizer_->Mode());

  observability::SpanScope span(observability::kMonitorSweepSpan);
  span.SetAttribute(observability::attr::kMode, mode);
  span.SetAttribute(observability::attr::kSelfHeal, self_heal ? "true" : "false");

  observability::LogContext log_context({observability::StringField("sweep_mode", mode)});

  SweepReport report;
  report.started_at = util::Now();

  CheckBaseRows(self_heal, batch_size, report);
  CheckOrphans(self_heal, batch_size, report);
  CheckStaleness(report);
  PurgeTombstones(report);

  report.finished_at = util::Now();
  span.SetAttribute(observability::attr::kKeysChecked, static_cast<std::int64_t>(report.keys_checked));
  span.SetAttribute(observability::attr::kDrift, static_cast<std::int64_t>(report.drift));
  span.SetAttribute(observability::attr::kHealed, static_cast<std::int64_t>(report.healed));

  PROJSYNC_LOG_INFO("consistency sweep finished",
                    {observability::IntField("keys_checked", static_cast<std::int64_t>(report.keys_checked)),
                     observability::IntField("drift", static_cast<std::int64_t>(report.drift)),
                     observability::IntField("healed", static_cast<std::int64_t>(report.healed)),
                     observability::IntField("duration_ms", util::ToUnixMillis(report.finished_at) - util::ToUnixMillis(report.started_at))});

  {
    std::lock_guard lock(mutex_);
    last_report_ = report;
  }
  return report;
}

std::optional<SweepReport> ConsistencyMonitor::LastReport() const {
  std::lock_guard lock(mutex_);
  return last_report_;
}

void ConsistencyMonitor::CheckBaseRows(bool self_heal, std::size_t batch_size, SweepReport& report) {
  auto&       store      = synchronizer_->Store();
  auto&       repository = store.Repository();
  const auto& rule       = synchronizer_->Rule();

  std::optional<int64_t> after;
  for (;;) {
    std::vector<Observed> batch;
    bool                  last_page = false;
    {
      auto tx   = repository.Begin(options_.lock_timeout);
      auto keys = repository.ListBaseKeys(*tx, after, batch_size);
      for (auto key : keys) {
        auto base = repository.GetBaseRow(*tx, key);
        if (!base) continue;
        batch.push_back(Observed{std::move(*base), store.Get(*tx, key)});
      }
      tx->Commit();

      if (keys.empty()) break;
      after     = keys.back();
      last_page = keys.size() < batch_size;
    }

    for (auto& observed : batch) {
      const auto key = observed.base.row.key;
      ++report.keys_checked;
      if (Busy(key)) continue;

      std::optional<model::DerivedAttributes> expected;
      std::string                             domain_error;
      try {
        expected = rule.Derive(observed.base.row);
      } catch (const util::DomainError& e) {
        domain_error = e.what();
      }

      if (!expected) {
        // Nothing valid could have been written; a stored value is stale.
        if (observed.stored) {
          Report(model::DriftRecord{key, std::nullopt, observed.stored->attributes, util::Now(), model::DriftKind::kMismatch, domain_error},
                 report);
        }
        continue;
      }

      if (!observed.stored) {
        Report(model::DriftRecord{key, expected, std::nullopt, util::Now(), model::DriftKind::kMissing, "no projection row"}, report);
      } else if (!model::AttributesEqual(*expected, observed.stored->attributes)) {
        Report(model::DriftRecord{key, expected, observed.stored->attributes, util::Now(), model::DriftKind::kMismatch,
                                  "stored version " + std::to_string(observed.stored->version)},
               report);
      } else {
        continue;
      }

      if (self_heal) {
        const auto stored_version = observed.stored ? observed.stored->version : 0;
        synchronizer_->Resync(key, observed.base.row, std::max(observed.base.version, stored_version));
        ++report.healed;
      }
    }

    if (last_page) break;
  }
}

void ConsistencyMonitor::CheckOrphans(bool self_heal, std::size_t batch_size, SweepReport& report) {
  auto& store = synchronizer_->Store();
  // Inline projections live in the base row itself.
  if (store.Mode() == model::ProjectionMode::kInline) return;

  auto& repository = store.Repository();

  std::vector<model::DerivedRow> page;
  auto flush = [&] {
    std::vector<model::DerivedRow> orphans;
    {
      auto tx = repository.Begin(options_.lock_timeout);
      for (auto& row : page) {
        if (!repository.GetBaseRow(*tx, row.key)) orphans.push_back(std::move(row));
      }
      tx->Commit();
    }
    page.clear();

    for (auto& orphan : orphans) {
      if (Busy(orphan.key)) continue;
      Report(model::DriftRecord{orphan.key, std::nullopt, orphan.attributes, util::Now(), model::DriftKind::kOrphan, "base row missing"}, report);
      if (self_heal) {
        synchronizer_->Resync(orphan.key, std::nullopt, orphan.version);
        ++report.healed;
      }
    }
  };

  auto scan = store.ScanAll(model::KeyRange{}, batch_size);
  while (auto row = scan.Next()) {
    page.push_back(std::move(*row));
    if (page.size() >= batch_size) flush();
  }
  if (!page.empty()) flush();
}

void ConsistencyMonitor::CheckStaleness(SweepReport& report) {
  if (options_.staleness_window.count() <= 0) return;

  const auto now = util::Now();
  for (const auto& [key, since] : synchronizer_->PendingSince(now - options_.staleness_window)) {
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(now - since).count();
    Report(model::DriftRecord{key, std::nullopt, std::nullopt, now, model::DriftKind::kStalenessExceeded,
                              "pending for " + std::to_string(waited) + "ms"},
           report);
  }
}

void ConsistencyMonitor::PurgeTombstones(SweepReport& report) {
  if (options_.tombstone_retention.count() <= 0) return;

  auto* summary = dynamic_cast<projection::SummaryTableStore*>(&synchronizer_->Store());
  if (!summary) return;

  report.tombstones_purged = summary->PurgeTombstones(options_.tombstone_retention);
  if (report.tombstones_purged > 0) {
    PROJSYNC_LOG_INFO("purged summary tombstones", {observability::IntField("count", static_cast<std::int64_t>(report.tombstones_purged))});
  }
}

void ConsistencyMonitor::Report(model::DriftRecord record, SweepReport& report) {
  ++report.drift;
  sink_->Report(record);
  report.records.push_back(std::move(record));
}

bool ConsistencyMonitor::Busy(model::RowKey key) const {
  return synchronizer_->StateOf(key) == model::SyncState::kPending;
}

void ConsistencyMonitor::Start() {
  if (options_.sweep_interval.count() <= 0) return;

  {
    std::lock_guard lock(mutex_);
    if (!stopped_) return;
    stopped_ = false;
  }
  thread_ = std::thread(&ConsistencyMonitor::Run, this);

  PROJSYNC_LOG_INFO("consistency monitor started", {observability::IntField("sweep_interval_ms", options_.sweep_interval.count()),
                                                    observability::BoolField("self_heal", options_.self_heal)});
}

void ConsistencyMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ConsistencyMonitor::Run() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, options_.sweep_interval, [this] { return stopped_; });
      if (stopped_) return;
    }

    try {
      Sweep();
    } catch (const std::exception& e) {
      PROJSYNC_LOG_ERROR("consistency sweep failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace projsync::monitor
