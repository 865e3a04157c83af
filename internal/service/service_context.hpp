#pragma once

#include <memory>

namespace projsync::db { class Repository; }
namespace projsync::sync { class Synchronizer; }
namespace projsync::monitor { class ConsistencyMonitor; class DriftLedger; }
namespace projsync::core { class ClusterImporter; }

namespace projsync::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<projsync::db::Repository> repository;
  std::shared_ptr<projsync::sync::Synchronizer> synchronizer;
  std::shared_ptr<projsync::monitor::ConsistencyMonitor> monitor;
  std::shared_ptr<projsync::monitor::DriftLedger> drift;
  std::shared_ptr<projsync::core::ClusterImporter> importer;
};

}
