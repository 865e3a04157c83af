#include "repository.hpp"

namespace projsync::db {

const char* ToString(ProjectionTable table) {
  switch (table) {
    case ProjectionTable::kInline:
      return "base_rows";
    case ProjectionTable::kIndexedView:
      return "derived_view";
    case ProjectionTable::kSummary:
      return "derived_summary";
  }
  return "unknown";
}

} // namespace projsync::db
