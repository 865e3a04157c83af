#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/monitor/consistency_monitor.hpp"
#include "internal/sync/synchronizer.hpp"

namespace projsync::core { class ClusterImporter; }
namespace projsync::service {
class ReadService;
class MutationFeedService;
class IngestService;
class AdminService;
}

namespace projsync::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<sync::Synchronizer> synchronizer;
  std::shared_ptr<monitor::DriftLedger> drift;
  std::shared_ptr<monitor::ConsistencyMonitor> monitor;
  std::shared_ptr<core::ClusterImporter> importer;

  std::shared_ptr<service::ReadService> read_service;
  std::shared_ptr<service::MutationFeedService> feed_service;
  std::shared_ptr<service::IngestService> ingest_service;
  std::shared_ptr<service::AdminService> admin_service;

  // Starts the sync workers and the scheduled sweep.
  void Start();
  void Stop();
};

sync::SynchronizerOptions SynchronizerOptionsFrom(const projsync::runtime::config::SyncConfig& config);
monitor::MonitorOptions MonitorOptionsFrom(const projsync::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const projsync::runtime::config::RuntimeConfig& config);

}
