#include "cluster_importer.hpp"

#include <optional>
#include <stdexcept>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace projsync::core {

namespace {

constexpr const char* kTimestampColumn = "timestamp_ms";

int64_t StatTimestampMs(const projsync::v1::ClusterStat& stat) {
  return static_cast<int64_t>(util::ToUnixMillis(util::FromProto(stat.timestamp())));
}

db::model::ClusterRecord ToClusterRecord(const projsync::v1::ClusterProperty& properties) {
  db::model::ClusterRecord record;
  record.cluster_name = properties.cluster_name();
  if (properties.has_environment()) record.environment = properties.environment();
  if (properties.has_region()) record.region = properties.region();
  if (properties.has_owner()) record.owner = properties.owner();
  if (properties.has_description()) record.description = properties.description();
  record.is_active       = properties.has_is_active() ? properties.is_active() : true;
  record.last_updated_ms = util::ToUnixMillis(util::Now());
  return record;
}

void Validate(const projsync::v1::ClusterData& cluster) {
  if (cluster.properties().cluster_name().empty()) {
    throw util::InvalidArgument("cluster_name is required");
  }
  for (const auto& stat : cluster.stats()) {
    if (!stat.has_timestamp()) {
      throw util::InvalidArgument("stat for cluster '" + cluster.properties().cluster_name() + "' has no timestamp");
    }
  }
}

} // namespace

projsync::model::Columns StatColumns(const projsync::v1::ClusterStat& stat) {
  projsync::model::Columns columns;
  auto number = [&](const char* name, bool present, double value) {
    columns[name] = present ? projsync::model::ColumnValue{value} : projsync::model::ColumnValue{};
  };

  number("cpu_usage", stat.has_cpu_usage(), stat.cpu_usage());
  number("memory_usage", stat.has_memory_usage(), stat.memory_usage());
  number("storage_usage", stat.has_storage_usage(), stat.storage_usage());
  number("network_throughput", stat.has_network_throughput(), stat.network_throughput());
  number("active_connections", stat.has_active_connections(), static_cast<double>(stat.active_connections()));
  number("request_count", stat.has_request_count(), static_cast<double>(stat.request_count()));
  number("response_time_ms", stat.has_response_time_ms(), static_cast<double>(stat.response_time_ms()));
  number("error_count", stat.has_error_count(), static_cast<double>(stat.error_count()));
  number("FreeGHz", stat.has_free_ghz(), stat.free_ghz());
  return columns;
}

ClusterImporter::ClusterImporter(std::shared_ptr<db::Repository> repository, std::shared_ptr<sync::Synchronizer> synchronizer,
                                 std::chrono::milliseconds lock_timeout)
    : repository_(std::move(repository)), synchronizer_(std::move(synchronizer)), lock_timeout_(lock_timeout) {
  if (!repository_) throw std::invalid_argument("cluster importer requires a repository");
  if (!synchronizer_) throw std::invalid_argument("cluster importer requires a synchronizer");
}

bool ClusterImporter::DualWrite() const {
  return synchronizer_->Mode() != projsync::model::ProjectionMode::kSummaryTable && synchronizer_->Options().staleness_window.count() == 0;
}

ImportResult ClusterImporter::Import(const std::vector<projsync::v1::ClusterData>& clusters) {
  for (const auto& cluster : clusters) Validate(cluster);

  observability::SpanScope span(observability::kIngestImportSpan);
  span.SetAttribute(observability::attr::kClusters, static_cast<std::int64_t>(clusters.size()));

  std::lock_guard lock(import_mutex_);

  ImportResult                                  result;
  std::vector<projsync::model::MutationEvent>   events;
  std::vector<sync::InlineApply>                applied;

  try {
    auto tx = repository_->Begin(lock_timeout_);

    for (const auto& cluster : clusters) {
      auto record = ToClusterRecord(cluster.properties());
      db::ThrowIfError(repository_->UpsertCluster(*tx, record), "upsert cluster '" + record.cluster_name + "'");
      result.cluster_ids.push_back(record.cluster_id);

      const projsync::v1::ClusterStat* newest = nullptr;
      for (const auto& stat : cluster.stats()) {
        db::model::ClusterStatRecord stat_record{record.cluster_id, StatTimestampMs(stat), StatColumns(stat)};
        db::ThrowIfError(repository_->AppendClusterStat(*tx, stat_record), "append stat for '" + record.cluster_name + "'");
        ++result.stats_written;
        if (!newest || StatTimestampMs(stat) >= StatTimestampMs(*newest)) newest = &stat;
      }
      if (!newest) continue;

      projsync::model::BaseRow row{record.cluster_id, StatColumns(*newest)};
      row.columns[kTimestampColumn] = static_cast<double>(StatTimestampMs(*newest));

      auto existing = repository_->GetBaseRow(*tx, record.cluster_id);
      if (existing) {
        const auto stored_ts = projsync::model::NumberColumn(existing->row.columns, kTimestampColumn);
        // Late arrivals only extend the history.
        if (stored_ts && *stored_ts > StatTimestampMs(*newest)) continue;
        if (existing->row == row) continue;
      }

      uint64_t sequence = 0;
      db::ThrowIfError(repository_->NextSequence(*tx, sequence), "next sequence");

      const db::model::BaseRowRecord base{row, sequence};
      if (existing) {
        db::ThrowIfError(repository_->UpdateBaseRow(*tx, base), "update base row");
        events.push_back(projsync::model::MutationEvent::Update(sequence, existing->row, row));
      } else {
        db::ThrowIfError(repository_->InsertBaseRow(*tx, base), "insert base row");
        events.push_back(projsync::model::MutationEvent::Insert(sequence, row));
      }
    }

    if (DualWrite()) {
      for (const auto& event : events) applied.push_back(synchronizer_->ApplyWithin(*tx, event));
    }

    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    PROJSYNC_LOG_ERROR("cluster import failed", {observability::IntField("clusters", static_cast<std::int64_t>(clusters.size())),
                                                 observability::StringField("error", e.what())});
    throw;
  }

  if (DualWrite()) {
    for (const auto& outcome : applied) result.sync_results.push_back(synchronizer_->Acknowledge(outcome));
  } else {
    for (const auto& event : events) result.sync_results.push_back(synchronizer_->Submit(event));
  }

  PROJSYNC_LOG_INFO("clusters imported", {observability::IntField("clusters", static_cast<std::int64_t>(clusters.size())),
                                          observability::IntField("stats", static_cast<std::int64_t>(result.stats_written)),
                                          observability::IntField("events", static_cast<std::int64_t>(events.size())),
                                          observability::BoolField("dual_write", DualWrite())});
  return result;
}

int64_t ClusterImporter::DeleteCluster(const std::string& cluster_name) {
  if (cluster_name.empty()) throw util::InvalidArgument("cluster_name is required");

  std::lock_guard lock(import_mutex_);

  int64_t                                      cluster_id = 0;
  std::optional<projsync::model::MutationEvent> event;
  std::optional<sync::InlineApply>             applied;
  {
    auto tx      = repository_->Begin(lock_timeout_);
    auto cluster = repository_->FindClusterByName(*tx, cluster_name);
    if (!cluster) throw util::NotFound("cluster '" + cluster_name + "' not found");
    cluster_id = cluster->cluster_id;

    if (repository_->GetBaseRow(*tx, cluster_id)) {
      uint64_t sequence = 0;
      db::ThrowIfError(repository_->NextSequence(*tx, sequence), "next sequence");
      event = projsync::model::MutationEvent::Delete(sequence, cluster_id);
      if (DualWrite()) applied = synchronizer_->ApplyWithin(*tx, *event);
      db::ThrowIfError(repository_->DeleteBaseRow(*tx, cluster_id), "delete base row");
    }
    db::ThrowIfError(repository_->DeleteCluster(*tx, cluster_id), "delete cluster '" + cluster_name + "'");
    tx->Commit();
  }

  if (applied) {
    synchronizer_->Acknowledge(*applied);
  } else if (event) {
    synchronizer_->Submit(*event);
  }

  PROJSYNC_LOG_INFO("cluster deleted", {observability::StringField("cluster_name", cluster_name), observability::IntField("cluster_id", cluster_id)});
  return cluster_id;
}

} // namespace projsync::core
