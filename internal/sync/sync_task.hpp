#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "internal/model/mutation_event.hpp"
#include "internal/model/sync_state.hpp"

namespace projsync::sync {

// What a caller learns about one submitted event.
struct SyncResult {
  model::RowKey    key      = 0;
  uint64_t         sequence = 0;
  model::SyncState state    = model::SyncState::kPending;
  std::string      error;
};

/*
  One unit of work for a key.

  resync tasks come from the consistency monitor; their sequence is at
  least the key's last sequence and they bypass change detection.
*/
struct SyncTask {
  model::MutationEvent event;

  bool     resync  = false;
  uint32_t attempt = 0;

  // State a resync dropped unapplied hands the key back to.
  model::SyncState resume_state = model::SyncState::kPending;

  // Fulfilled once, on the first terminal outcome. Retries carry none.
  std::shared_ptr<std::promise<SyncResult>> done;
};

} // namespace projsync::sync
