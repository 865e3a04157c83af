#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/sync/synchronizer.hpp"
#include "projsync/v1/types.pb.h"

namespace projsync::core {

struct ImportResult {
  std::vector<int64_t>          cluster_ids;
  uint64_t                      stats_written = 0;
  std::vector<sync::SyncResult> sync_results;
};

/*
  Writes cluster properties and statistics and feeds the resulting base
  row changes to the synchronizer.

  A batch is one transaction: any failure rolls back every cluster in it.
  The newest stat of a cluster becomes its base row; every stat is kept
  in the history table. In inline and indexed-view modes with a zero
  staleness window the derived rows are written in the same transaction.
*/
class ClusterImporter {
 public:
  ClusterImporter(std::shared_ptr<db::Repository> repository, std::shared_ptr<sync::Synchronizer> synchronizer,
                  std::chrono::milliseconds lock_timeout = db::Repository::kDefaultLockTimeout);

  ImportResult Import(const std::vector<projsync::v1::ClusterData>& clusters);

  // Returns the deleted cluster id. Throws util::NotFound for an unknown name.
  int64_t DeleteCluster(const std::string& cluster_name);

  bool DualWrite() const;

 private:
  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<sync::Synchronizer> synchronizer_;
  std::chrono::milliseconds           lock_timeout_;

  // Keeps commit order and acknowledgement order the same.
  std::mutex import_mutex_;
};

// Base row columns for one stat; unset fields are null.
projsync::model::Columns StatColumns(const projsync::v1::ClusterStat& stat);

} // namespace projsync::core
