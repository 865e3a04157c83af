#pragma once

#include <optional>

#include "internal/model/row.hpp"

namespace projsync::db::model {

/*
  Stored projection row. deleted_at is set only for summary-table
  tombstones; scans never return tombstoned rows.
*/
struct DerivedRowRecord {
  projsync::model::DerivedRow               row;
  std::optional<projsync::model::TimePoint> deleted_at;

  bool IsTombstone() const {
    return deleted_at.has_value();
  }
};

} // namespace projsync::db::model
