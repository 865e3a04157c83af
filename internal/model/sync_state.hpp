#pragma once

#include <cstdint>

namespace projsync::model {

/*
  Per-key synchronization state.

    Absent     -> Pending      insert scheduled
    Pending    -> Consistent   upsert landed
    Consistent -> Pending      update touched an input column
    Consistent -> Absent       delete processed
    Pending    -> Absent       delete processed
    *          -> Failed       derivation or store failure
    Failed     -> Pending      retry or newer event
*/
enum class SyncState : std::uint8_t {
  kAbsent     = 0,
  kPending    = 1,
  kConsistent = 2,
  kFailed     = 3,
};

constexpr bool CanTransition(SyncState from, SyncState to) {
  if (from == to) {
    return true;
  }
  if (to == SyncState::kFailed) {
    return true;
  }

  switch (from) {
    case SyncState::kAbsent:
      return to == SyncState::kPending;
    case SyncState::kPending:
      return to == SyncState::kConsistent || to == SyncState::kAbsent;
    case SyncState::kConsistent:
      return to == SyncState::kPending || to == SyncState::kAbsent;
    case SyncState::kFailed:
      return to == SyncState::kPending || to == SyncState::kAbsent;
  }
  return false;
}

constexpr const char* ToString(SyncState state) {
  switch (state) {
    case SyncState::kAbsent:
      return "absent";
    case SyncState::kPending:
      return "pending";
    case SyncState::kConsistent:
      return "consistent";
    case SyncState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace projsync::model
