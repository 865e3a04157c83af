#pragma once

#include <cstdint>

#include "internal/model/row.hpp"

namespace projsync::db::model {

// One row of cluster statistics history.
struct ClusterStatRecord {
  int64_t                  cluster_id   = 0;
  int64_t                  timestamp_ms = 0;
  projsync::model::Columns values;
};

} // namespace projsync::db::model
