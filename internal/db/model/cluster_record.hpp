#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace projsync::db::model {

// Cluster properties. cluster_id doubles as the base row key.
struct ClusterRecord {
  int64_t     cluster_id = 0;
  std::string cluster_name;

  std::optional<std::string> environment;
  std::optional<std::string> region;
  std::optional<std::string> owner;
  std::optional<std::string> description;
  bool                       is_active = true;

  uint64_t last_updated_ms = 0;
};

} // namespace projsync::db::model
