#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/derivation/derivation_rule.hpp"
#include "internal/model/mutation_event.hpp"
#include "internal/model/projection_mode.hpp"
#include "internal/model/sync_state.hpp"
#include "internal/projection/projection_store.hpp"
#include "key_scheduler.hpp"
#include "retry_timer.hpp"
#include "store_executor.hpp"
#include "sync_worker.hpp"
#include "sync_task.hpp"

namespace projsync::monitor {
class DriftSink;
}

namespace projsync::sync {

struct SynchronizerOptions {
  // Zero makes Submit() wait for the outcome.
  std::chrono::milliseconds staleness_window{0};

  // Retries after the first failed attempt.
  uint32_t retry_limit = 3;

  std::size_t workers       = 4;
  std::size_t store_threads = 4;

  std::chrono::milliseconds upsert_deadline{5000};
  std::chrono::milliseconds retry_backoff_initial{100};
  std::chrono::milliseconds retry_backoff_max{5000};
};

struct KeyStatus {
  model::SyncState state         = model::SyncState::kAbsent;
  uint64_t         last_sequence = 0;
  uint32_t         attempts      = 0;
  // Set while state is kPending.
  std::optional<std::chrono::system_clock::time_point> pending_since;
  std::string                                          last_error;
};

struct SyncStats {
  model::ProjectionMode mode = model::ProjectionMode::kInline;

  uint64_t keys_absent     = 0;
  uint64_t keys_pending    = 0;
  uint64_t keys_consistent = 0;
  uint64_t keys_failed     = 0;

  uint64_t queued_events   = 0;
  uint64_t in_flight       = 0;
  uint64_t pending_retries = 0;

  uint64_t events_applied   = 0;
  uint64_t events_skipped   = 0;
  uint64_t events_discarded = 0;
  uint64_t events_failed    = 0;
};

/*
  Result of ApplyWithin(); handed back to Acknowledge() after the
  caller's transaction commits.
*/
struct InlineApply {
  model::MutationEvent               event;
  bool                               skipped = false;
  std::optional<projection::WriteOutcome> outcome;
  std::string                        error;
};

/*
  Keeps the projection store in step with base-relation mutations.

  Per key: FIFO in sequence order, one worker at a time. Across keys:
  concurrent on the worker pool. A queued event that a newer event for
  the same key makes pointless is dropped by sequence comparison.

  State per key follows model::SyncState. Failures (derivation domain
  errors, store errors, deadline overruns) mark the key Failed and retry
  with exponential backoff; once retry_limit is spent a SyncFailed drift
  record goes to the sink and the stored row is left as it was.
*/
class Synchronizer {
 public:
  Synchronizer(derivation::DerivationRulePtr rule, projection::ProjectionStorePtr store, std::shared_ptr<monitor::DriftSink> drift_sink,
               SynchronizerOptions options = {});
  ~Synchronizer();

  Synchronizer(const Synchronizer&)            = delete;
  Synchronizer& operator=(const Synchronizer&) = delete;

  void Start();
  void Stop();

  // Throws util::OrderingViolation when the sequence does not advance
  // for the key.
  SyncResult Submit(model::MutationEvent event);

  // ---------------------------------------------------------------------
  // Dual write: derive and write inside the caller's transaction, then
  // Acknowledge() after commit. Derivation errors are returned, store
  // errors propagate so the caller rolls back.
  // ---------------------------------------------------------------------

  InlineApply ApplyWithin(db::Transaction& tx, const model::MutationEvent& event);
  SyncResult  Acknowledge(const InlineApply& applied);

  // Re-derives key through its queue at max(version, last sequence). No
  // row means the base row is gone and the projection row is removed.
  void Resync(model::RowKey key, std::optional<model::BaseRow> row, uint64_t version);

  // Waits until no work is queued, running or waiting for retry.
  bool Drain(std::chrono::milliseconds timeout);

  model::SyncState         StateOf(model::RowKey key) const;
  std::optional<KeyStatus> StatusOf(model::RowKey key) const;
  SyncStats                Snapshot() const;

  // Keys pending since before cutoff.
  std::vector<std::pair<model::RowKey, std::chrono::system_clock::time_point>> PendingSince(
      std::chrono::system_clock::time_point cutoff) const;

  model::ProjectionMode Mode() const {
    return store_->Mode();
  }
  const SynchronizerOptions& Options() const {
    return options_;
  }
  const derivation::DerivationRule& Rule() const {
    return *rule_;
  }
  projection::ProjectionStore& Store() {
    return *store_;
  }

 private:
  void Process(SyncTask task);

  bool Superseded(const SyncTask& task) const;
  void ResumeAfterDroppedResync(const SyncTask& task);
  bool NeedsDerivation(const model::MutationEvent& event, const KeyStatus& status) const;

  projection::WriteOutcome Write(const model::MutationEvent& event, const std::optional<model::DerivedAttributes>& attributes);

  // Run with the task's LogContext (key, sequence) open.
  void OnSuccess(const SyncTask& task, projection::WriteOutcome outcome);
  void OnFailure(SyncTask task, const std::optional<model::DerivedAttributes>& expected, const std::string& error);
  void ScheduleRetry(SyncTask task, uint32_t attempt);
  void ReportExhausted(const SyncTask& task, const std::optional<model::DerivedAttributes>& expected, const std::string& error);

  // Caller holds mutex_.
  void SetState(model::RowKey key, KeyStatus& status, model::SyncState next);

  static void Resolve(const SyncTask& task, SyncResult result);

  std::chrono::milliseconds Backoff(uint32_t attempt) const;

  derivation::DerivationRulePtr       rule_;
  projection::ProjectionStorePtr      store_;
  std::shared_ptr<monitor::DriftSink> drift_sink_;
  SynchronizerOptions                 options_;

  KeyScheduler  scheduler_;
  RetryTimer    retry_timer_;
  StoreExecutor executor_;

  // One entry per key ever seen, Absent keys included: last_sequence is
  // what rejects a replay after a delete, and inline and indexed-view
  // stores keep no trace of a deleted key. Memory grows with the
  // number of distinct keys, not with the number of events.
  mutable std::mutex                            mutex_;
  std::unordered_map<model::RowKey, KeyStatus>  keys_;

  std::atomic<uint64_t> events_applied_{0};
  std::atomic<uint64_t> events_skipped_{0};
  std::atomic<uint64_t> events_discarded_{0};
  std::atomic<uint64_t> events_failed_{0};

  std::vector<std::unique_ptr<SyncWorker>> workers_;
  std::atomic<bool>                        running_{false};
};

} // namespace projsync::sync
