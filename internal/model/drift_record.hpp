#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "row.hpp"

namespace projsync::model {

enum class DriftKind : std::uint8_t {
  kMismatch,
  kMissing,
  kOrphan,
  kSyncFailed,
  kStalenessExceeded,
};

constexpr const char* ToString(DriftKind kind) {
  switch (kind) {
    case DriftKind::kMismatch:
      return "mismatch";
    case DriftKind::kMissing:
      return "missing";
    case DriftKind::kOrphan:
      return "orphan";
    case DriftKind::kSyncFailed:
      return "sync_failed";
    case DriftKind::kStalenessExceeded:
      return "staleness_exceeded";
  }
  return "unknown";
}

/*
  Divergence between the projection and what derivation over the current
  base row would produce. expected is empty when the base row is gone or
  cannot be derived; actual is empty when nothing is stored.
*/
struct DriftRecord {
  RowKey                           key = 0;
  std::optional<DerivedAttributes> expected;
  std::optional<DerivedAttributes> actual;
  TimePoint                        detected_at{};
  DriftKind                        kind = DriftKind::kMismatch;
  std::string                      detail;
};

} // namespace projsync::model
