#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/cluster_importer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/derivation/rule_factory.hpp"
#include "internal/model/projection_mode.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/projection_store.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/mutation_feed_service.hpp"
#include "internal/service/read_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if PROJSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PROJSYNC_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace projsync::factory {

using projsync::runtime::config::RuntimeConfig;
using projsync::runtime::config::SyncConfig;

namespace {

constexpr std::size_t kDefaultWorkers      = 4;
constexpr std::size_t kDefaultBatchSize    = 256;
constexpr std::size_t kDefaultDriftHistory = 1024;

std::chrono::milliseconds DurationOr(bool present, const google::protobuf::Duration& value, std::chrono::milliseconds fallback) {
  return present ? util::ToMillis(value) : fallback;
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PROJSYNC_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(
        sqlite.path(), sqlite.wal_mode(), DurationOr(sqlite.has_busy_timeout(), sqlite.busy_timeout(), db::sqlite::SqliteDB::kDefaultBusyTimeout));
    sqlite_db->Migrate();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PROJSYNC_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Migrate();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

sync::SynchronizerOptions SynchronizerOptionsFrom(const SyncConfig& config) {
  sync::SynchronizerOptions options;
  options.staleness_window      = DurationOr(config.has_staleness_window(), config.staleness_window(), options.staleness_window);
  options.retry_limit           = config.has_retry_limit() ? config.retry_limit() : options.retry_limit;
  options.workers               = config.workers() == 0 ? kDefaultWorkers : config.workers();
  options.store_threads         = config.store_threads() == 0 ? kDefaultWorkers : config.store_threads();
  options.upsert_deadline       = DurationOr(config.has_upsert_deadline(), config.upsert_deadline(), options.upsert_deadline);
  options.retry_backoff_initial = DurationOr(config.has_retry_backoff_initial(), config.retry_backoff_initial(), options.retry_backoff_initial);
  options.retry_backoff_max     = DurationOr(config.has_retry_backoff_max(), config.retry_backoff_max(), options.retry_backoff_max);
  if (options.retry_backoff_max < options.retry_backoff_initial) {
    options.retry_backoff_max = options.retry_backoff_initial;
  }
  return options;
}

monitor::MonitorOptions MonitorOptionsFrom(const RuntimeConfig& config) {
  monitor::MonitorOptions options;
  options.sweep_interval      = DurationOr(config.monitor().has_sweep_interval(), config.monitor().sweep_interval(), options.sweep_interval);
  options.batch_size          = config.monitor().batch_size() == 0 ? kDefaultBatchSize : config.monitor().batch_size();
  options.self_heal           = config.sync().self_heal();
  options.staleness_window    = DurationOr(config.sync().has_staleness_window(), config.sync().staleness_window(), options.staleness_window);
  options.tombstone_retention = DurationOr(config.summary().has_tombstone_retention(), config.summary().tombstone_retention(), options.tombstone_retention);
  return options;
}

void Application::Start() {
  synchronizer->Start();
  monitor->Start();
}

void Application::Stop() {
  monitor->Stop();
  synchronizer->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  const auto mode_name = config.sync().mode().empty() ? std::string("inline") : config.sync().mode();
  const auto mode      = model::ParseProjectionMode(mode_name);
  if (!mode) {
    throw util::InvalidArgument("unknown sync mode '" + mode_name + "'");
  }

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  auto store     = projection::MakeStore(*mode, app.repository, db::Repository::kDefaultLockTimeout);

  // ------------------------------------------------------------------
  // Synchronization
  // ------------------------------------------------------------------
  auto rule = derivation::MakeRule(config.derivation());

  const auto drift_history = config.monitor().drift_history() == 0 ? kDefaultDriftHistory : config.monitor().drift_history();
  app.drift                = std::make_shared<monitor::DriftLedger>(drift_history);
  app.synchronizer         = std::make_shared<sync::Synchronizer>(rule, store, app.drift, SynchronizerOptionsFrom(config.sync()));
  app.monitor              = std::make_shared<monitor::ConsistencyMonitor>(app.synchronizer, app.drift, MonitorOptionsFrom(config));
  app.importer             = std::make_shared<core::ClusterImporter>(app.repository, app.synchronizer);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = app.repository;
  ctx.synchronizer = app.synchronizer;
  ctx.monitor      = app.monitor;
  ctx.drift        = app.drift;
  ctx.importer     = app.importer;

  app.read_service   = std::make_shared<service::ReadService>(ctx);
  app.feed_service   = std::make_shared<service::MutationFeedService>(ctx);
  app.ingest_service = std::make_shared<service::IngestService>(ctx);
  app.admin_service  = std::make_shared<service::AdminService>(ctx);

  PROJSYNC_LOG_INFO("runtime built", {observability::StringField("mode", model::ToString(*mode)),
                                      observability::StringField("rule", rule->Name()),
                                      observability::StringField("database", config.database().has_sqlite()     ? "sqlite"
                                                                             : config.database().has_postgres() ? "postgres"
                                                                                                                 : "memory")});
  return app;
}

} // namespace projsync::factory
