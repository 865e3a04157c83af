#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace projsync::model {

enum class ProjectionMode : std::uint8_t {
  kInline,
  kIndexedView,
  kSummaryTable,
};

constexpr const char* ToString(ProjectionMode mode) {
  switch (mode) {
    case ProjectionMode::kInline:
      return "inline";
    case ProjectionMode::kIndexedView:
      return "indexed-view";
    case ProjectionMode::kSummaryTable:
      return "summary-table";
  }
  return "unknown";
}

constexpr std::optional<ProjectionMode> ParseProjectionMode(std::string_view value) {
  if (value == "inline") return ProjectionMode::kInline;
  if (value == "indexed-view") return ProjectionMode::kIndexedView;
  if (value == "summary-table") return ProjectionMode::kSummaryTable;
  return std::nullopt;
}

} // namespace projsync::model
