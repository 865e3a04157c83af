#pragma once

#include <cstdint>

#include "internal/model/row.hpp"

namespace projsync::db::model {

/*
  Persistent base row.

  version is the sequence number of the mutation that last wrote the row.
*/
struct BaseRowRecord {
  projsync::model::BaseRow row;
  uint64_t                 version = 0;
};

} // namespace projsync::db::model
