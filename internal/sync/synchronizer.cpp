#include "synchronizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/monitor/drift_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace projsync::sync {

namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point started) {
  return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

std::int64_t AsInt(uint64_t value) {
  return static_cast<std::int64_t>(value);
}

} // namespace

Synchronizer::Synchronizer(derivation::DerivationRulePtr rule, projection::ProjectionStorePtr store,
                           std::shared_ptr<monitor::DriftSink> drift_sink, SynchronizerOptions options)
    : rule_(std::move(rule)),
      store_(std::move(store)),
      drift_sink_(std::move(drift_sink)),
      options_(options),
      executor_(std::max<std::size_t>(options.store_threads, 1)) {
  if (!rule_) throw std::invalid_argument("synchronizer requires a derivation rule");
  if (!store_) throw std::invalid_argument("synchronizer requires a projection store");
  if (!drift_sink_) throw std::invalid_argument("synchronizer requires a drift sink");
}

Synchronizer::~Synchronizer() {
  Stop();
}

void Synchronizer::Start() {
  if (running_.exchange(true)) return;

  const auto count = std::max<std::size_t>(options_.workers, 1);
  for (std::size_t i = 0; i < count; ++i) {
    auto worker = std::make_unique<SyncWorker>(scheduler_, [this](SyncTask task) { Process(std::move(task)); });
    worker->Start();
    workers_.push_back(std::move(worker));
  }

  PROJSYNC_LOG_INFO("synchronizer started", {observability::StringField("mode", model::ToString(Mode())),
                                             observability::IntField("workers", static_cast<std::int64_t>(count)),
                                             observability::IntField("staleness_window_ms", options_.staleness_window.count())});
}

void Synchronizer::Stop() {
  if (!running_.exchange(false)) return;

  scheduler_.Shutdown();
  for (auto& worker : workers_) worker->Join();
  workers_.clear();

  retry_timer_.Stop();
  executor_.Stop();

  PROJSYNC_LOG_INFO("synchronizer stopped", {observability::StringField("mode", model::ToString(Mode()))});
}

SyncResult Synchronizer::Submit(model::MutationEvent event) {
  if (!running_) throw util::SyncFailed("synchronizer is not running");
  if (event.sequence == 0) throw util::InvalidArgument("mutation sequence must be positive");

  const auto key      = event.Key();
  const auto sequence = event.sequence;
  const bool wait     = options_.staleness_window.count() == 0;

  SyncTask                 task{std::move(event)};
  std::future<SyncResult> done;
  {
    std::lock_guard lock(mutex_);
    auto&           status = keys_[key];
    if (sequence <= status.last_sequence) {
      PROJSYNC_LOG_ERROR("mutation out of order", {observability::IntField("key", key), observability::IntField("sequence", AsInt(sequence)),
                                                   observability::IntField("last_sequence", AsInt(status.last_sequence))});
      throw util::OrderingViolation("sequence " + std::to_string(sequence) + " for key " + std::to_string(key) +
                                    " does not follow " + std::to_string(status.last_sequence));
    }

    const bool needed    = NeedsDerivation(task.event, status);
    status.last_sequence = sequence;
    status.attempts      = 0;

    if (!needed) {
      ++events_skipped_;
      observability::Metrics::Instance().RecordSyncOutcome("skipped");
      PROJSYNC_LOG_DEBUG("update leaves inputs unchanged", {observability::IntField("key", key), observability::IntField("sequence", AsInt(sequence))});
      return SyncResult{key, sequence, status.state, {}};
    }

    status.last_error.clear();
    SetState(key, status, model::SyncState::kPending);
    if (wait) {
      task.done = std::make_shared<std::promise<SyncResult>>();
      done      = task.done->get_future();
    }
  }

  scheduler_.Enqueue(std::move(task));
  if (!wait) return SyncResult{key, sequence, model::SyncState::kPending, {}};
  return done.get();
}

InlineApply Synchronizer::ApplyWithin(db::Transaction& tx, const model::MutationEvent& event) {
  if (event.sequence == 0) throw util::InvalidArgument("mutation sequence must be positive");

  InlineApply applied{event};
  const auto  key = event.Key();
  {
    std::lock_guard lock(mutex_);
    auto            it = keys_.find(key);
    if (it != keys_.end()) {
      if (event.sequence <= it->second.last_sequence) {
        throw util::OrderingViolation("sequence " + std::to_string(event.sequence) + " for key " + std::to_string(key) +
                                      " does not follow " + std::to_string(it->second.last_sequence));
      }
      if (!NeedsDerivation(event, it->second)) {
        applied.skipped = true;
        return applied;
      }
    }
  }

  if (event.IsDelete()) {
    applied.outcome = store_->Remove(tx, key, event.sequence);
    return applied;
  }

  model::DerivedAttributes attributes;
  try {
    attributes = rule_->Derive(*event.CurrentRow());
  } catch (const util::DomainError& e) {
    applied.error = e.what();
    return applied;
  }

  applied.outcome = store_->Upsert(tx, model::DerivedRow{key, std::move(attributes), event.sequence, util::Now()});
  return applied;
}

SyncResult Synchronizer::Acknowledge(const InlineApply& applied) {
  const auto key      = applied.event.Key();
  const auto sequence = applied.event.sequence;

  std::unique_lock lock(mutex_);
  auto&            status = keys_[key];
  if (sequence <= status.last_sequence) {
    PROJSYNC_LOG_ERROR("acknowledged mutation out of order",
                       {observability::IntField("key", key), observability::IntField("sequence", AsInt(sequence)),
                        observability::IntField("last_sequence", AsInt(status.last_sequence))});
    throw util::OrderingViolation("sequence " + std::to_string(sequence) + " for key " + std::to_string(key) + " does not follow " +
                                  std::to_string(status.last_sequence));
  }
  status.last_sequence = sequence;
  status.attempts      = 0;

  if (applied.skipped) {
    ++events_skipped_;
    observability::Metrics::Instance().RecordSyncOutcome("skipped");
    return SyncResult{key, sequence, status.state, {}};
  }

  if (!applied.error.empty()) {
    lock.unlock();
    observability::LogContext log_context({observability::IntField("key", key), observability::IntField("sequence", AsInt(sequence))});
    OnFailure(SyncTask{applied.event}, std::nullopt, applied.error);
    return SyncResult{key, sequence, model::SyncState::kFailed, applied.error};
  }

  const bool gone = applied.event.IsDelete() || applied.outcome == projection::WriteOutcome::kBaseMissing;
  status.last_error.clear();
  if (status.state != model::SyncState::kPending && !gone) SetState(key, status, model::SyncState::kPending);
  SetState(key, status, gone ? model::SyncState::kAbsent : model::SyncState::kConsistent);
  ++events_applied_;
  observability::Metrics::Instance().RecordSyncOutcome("applied");
  return SyncResult{key, sequence, status.state, {}};
}

void Synchronizer::Resync(model::RowKey key, std::optional<model::BaseRow> row, uint64_t version) {
  if (!running_) throw util::SyncFailed("synchronizer is not running");

  SyncTask task;
  task.resync = true;
  {
    std::lock_guard lock(mutex_);
    auto& status = keys_[key];
    // The repair must not lose to the version the last event already wrote.
    const auto sequence = std::max(version, status.last_sequence);
    if (row) {
      row->key   = key;
      task.event = model::MutationEvent::Insert(sequence, std::move(*row));
    } else {
      task.event = model::MutationEvent::Delete(sequence, key);
    }
    task.resume_state = status.state;
    SetState(key, status, model::SyncState::kPending);
  }

  PROJSYNC_LOG_DEBUG("resync scheduled", {observability::IntField("key", key), observability::StringField("change", task.event.KindName()),
                                          observability::IntField("version", AsInt(task.event.sequence))});
  scheduler_.Enqueue(std::move(task));
}

bool Synchronizer::Drain(std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  for (;;) {
    if (scheduler_.Queued() == 0 && scheduler_.InFlight() == 0 && retry_timer_.Pending() == 0) return true;
    if (Clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

model::SyncState Synchronizer::StateOf(model::RowKey key) const {
  std::lock_guard lock(mutex_);
  auto            it = keys_.find(key);
  return it == keys_.end() ? model::SyncState::kAbsent : it->second.state;
}

std::optional<KeyStatus> Synchronizer::StatusOf(model::RowKey key) const {
  std::lock_guard lock(mutex_);
  auto            it = keys_.find(key);
  if (it == keys_.end()) return std::nullopt;
  return it->second;
}

SyncStats Synchronizer::Snapshot() const {
  SyncStats stats;
  stats.mode = store_->Mode();
  {
    std::lock_guard lock(mutex_);
    for (const auto& [key, status] : keys_) {
      switch (status.state) {
        case model::SyncState::kAbsent:
          ++stats.keys_absent;
          break;
        case model::SyncState::kPending:
          ++stats.keys_pending;
          break;
        case model::SyncState::kConsistent:
          ++stats.keys_consistent;
          break;
        case model::SyncState::kFailed:
          ++stats.keys_failed;
          break;
      }
    }
  }

  stats.queued_events    = scheduler_.Queued();
  stats.in_flight        = scheduler_.InFlight();
  stats.pending_retries  = retry_timer_.Pending();
  stats.events_applied   = events_applied_;
  stats.events_skipped   = events_skipped_;
  stats.events_discarded = events_discarded_;
  stats.events_failed    = events_failed_;

  auto& metrics = observability::Metrics::Instance();
  metrics.SetKeyStateCount(model::ToString(model::SyncState::kAbsent), stats.keys_absent);
  metrics.SetKeyStateCount(model::ToString(model::SyncState::kPending), stats.keys_pending);
  metrics.SetKeyStateCount(model::ToString(model::SyncState::kConsistent), stats.keys_consistent);
  metrics.SetKeyStateCount(model::ToString(model::SyncState::kFailed), stats.keys_failed);
  return stats;
}

std::vector<std::pair<model::RowKey, std::chrono::system_clock::time_point>> Synchronizer::PendingSince(
    std::chrono::system_clock::time_point cutoff) const {
  std::vector<std::pair<model::RowKey, std::chrono::system_clock::time_point>> out;
  std::lock_guard                                                              lock(mutex_);
  for (const auto& [key, status] : keys_) {
    if (status.state == model::SyncState::kPending && status.pending_since && *status.pending_since < cutoff) {
      out.emplace_back(key, *status.pending_since);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

void Synchronizer::Process(SyncTask task) {
  const auto key      = task.event.Key();
  const auto sequence = task.event.sequence;

  if (Superseded(task)) {
    ++events_discarded_;
    observability::Metrics::Instance().RecordSyncOutcome("superseded");
    PROJSYNC_LOG_DEBUG("sync task superseded", {observability::IntField("key", key), observability::IntField("sequence", AsInt(sequence))});
    if (task.resync) ResumeAfterDroppedResync(task);
    Resolve(task, SyncResult{key, sequence, model::SyncState::kPending, "superseded"});
    return;
  }

  observability::SpanScope span(observability::kSyncProcessSpan);
  span.SetAttribute(observability::attr::kKey, static_cast<std::int64_t>(key));
  span.SetAttribute(observability::attr::kSequence, AsInt(sequence));
  span.SetAttribute(observability::attr::kChange, task.event.KindName());
  span.SetAttribute(observability::attr::kMode, model::ToString(Mode()));
  if (task.attempt > 0) span.SetAttribute(observability::attr::kAttempt, static_cast<std::int64_t>(task.attempt));
  if (task.resync) span.AddEvent("resync");

  observability::LogContext log_context({observability::IntField("key", key), observability::IntField("sequence", AsInt(sequence))});

  const auto                              started = Clock::now();
  std::optional<model::DerivedAttributes> expected;
  try {
    if (const auto* row = task.event.CurrentRow()) expected = rule_->Derive(*row);
    const auto outcome = Write(task.event, expected);
    observability::Metrics::Instance().ObserveSyncDurationMs(model::ToString(Mode()), ElapsedMs(started));
    span.SetAttribute(observability::attr::kOutcome, projection::ToString(outcome));
    OnSuccess(task, outcome);
  } catch (const util::DomainError& e) {
    span.RecordException(e.what());
    OnFailure(std::move(task), std::nullopt, e.what());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    OnFailure(std::move(task), expected, e.what());
  }
}

bool Synchronizer::Superseded(const SyncTask& task) const {
  const auto key      = task.event.Key();
  const auto sequence = task.event.sequence;

  if (task.resync || task.attempt > 0) {
    std::lock_guard lock(mutex_);
    auto            it = keys_.find(key);
    if (it != keys_.end() && it->second.last_sequence > sequence) return true;
  }

  return scheduler_.AnyQueued(key, [&](const SyncTask& later) {
    if (later.event.sequence <= sequence) return false;
    if (later.resync || !later.event.IsUpdate()) return true;
    const auto& update = std::get<model::UpdateChange>(later.event.change);
    return derivation::InputsChanged(*rule_, update.old_row, update.new_row);
  });
}

void Synchronizer::ResumeAfterDroppedResync(const SyncTask& task) {
  const auto key = task.event.Key();
  if (task.resume_state == model::SyncState::kPending) return;
  if (scheduler_.AnyQueued(key, [](const SyncTask&) { return true; })) return;

  // No queued event is left to settle the key.
  std::lock_guard lock(mutex_);
  auto            it = keys_.find(key);
  if (it != keys_.end() && it->second.state == model::SyncState::kPending) {
    SetState(key, it->second, task.resume_state);
  }
}

bool Synchronizer::NeedsDerivation(const model::MutationEvent& event, const KeyStatus& status) const {
  if (!event.IsUpdate() || status.state != model::SyncState::kConsistent) return true;
  const auto& update = std::get<model::UpdateChange>(event.change);
  return derivation::InputsChanged(*rule_, update.old_row, update.new_row);
}

projection::WriteOutcome Synchronizer::Write(const model::MutationEvent& event, const std::optional<model::DerivedAttributes>& attributes) {
  auto store  = store_;
  auto future = executor_.Submit([store, event, attributes]() {
    if (event.IsDelete()) return store->Remove(event.Key(), event.sequence);
    return store->Upsert(model::DerivedRow{event.Key(), *attributes, event.sequence, util::Now()});
  });

  if (future.wait_for(options_.upsert_deadline) != std::future_status::ready) {
    throw util::DeadlineExceeded("projection write for key " + std::to_string(event.Key()) + " exceeded " +
                                 std::to_string(options_.upsert_deadline.count()) + "ms");
  }
  return future.get();
}

void Synchronizer::OnSuccess(const SyncTask& task, projection::WriteOutcome outcome) {
  const auto key      = task.event.Key();
  const auto sequence = task.event.sequence;

  model::SyncState state;
  {
    std::lock_guard lock(mutex_);
    auto&           status = keys_[key];
    // A newer event is queued behind this one; the key stays pending.
    if (status.last_sequence <= sequence) {
      status.attempts = 0;
      status.last_error.clear();
      const bool gone = task.event.IsDelete() || outcome == projection::WriteOutcome::kBaseMissing;
      if (status.state == model::SyncState::kFailed && !gone) SetState(key, status, model::SyncState::kPending);
      SetState(key, status, gone ? model::SyncState::kAbsent : model::SyncState::kConsistent);
    }
    state = status.state;
  }

  if (outcome == projection::WriteOutcome::kSuperseded) {
    ++events_discarded_;
  } else {
    ++events_applied_;
  }
  observability::Metrics::Instance().RecordSyncOutcome(projection::ToString(outcome));

  PROJSYNC_LOG_DEBUG("sync applied",
                     {observability::StringField("outcome", projection::ToString(outcome)), observability::StringField("state", model::ToString(state))});
  Resolve(task, SyncResult{key, sequence, state, {}});
}

void Synchronizer::OnFailure(SyncTask task, const std::optional<model::DerivedAttributes>& expected, const std::string& error) {
  const auto key      = task.event.Key();
  const auto sequence = task.event.sequence;

  uint32_t attempt = 0;
  {
    std::lock_guard lock(mutex_);
    auto&           status = keys_[key];
    if (status.last_sequence > sequence) {
      ++events_discarded_;
      Resolve(task, SyncResult{key, sequence, status.state, error});
      return;
    }
    attempt           = ++status.attempts;
    status.last_error = error;
    SetState(key, status, model::SyncState::kFailed);
  }

  ++events_failed_;
  observability::Metrics::Instance().RecordSyncOutcome("failed");
  PROJSYNC_LOG_WARN("sync attempt failed", {observability::IntField("attempt", attempt), observability::StringField("error", error)});

  Resolve(task, SyncResult{key, sequence, model::SyncState::kFailed, error});
  task.done.reset();

  if (attempt <= options_.retry_limit) {
    ScheduleRetry(std::move(task), attempt);
  } else {
    ReportExhausted(task, expected, error);
  }
}

void Synchronizer::ScheduleRetry(SyncTask task, uint32_t attempt) {
  task.attempt       = attempt;
  const auto backoff = Backoff(attempt);
  retry_timer_.Schedule(backoff, [this, task]() mutable {
    const auto key = task.event.Key();
    {
      std::lock_guard lock(mutex_);
      auto&           status = keys_[key];
      if (status.last_sequence > task.event.sequence) {
        ++events_discarded_;
        return;
      }
      if (status.state == model::SyncState::kFailed) SetState(key, status, model::SyncState::kPending);
    }
    scheduler_.Enqueue(std::move(task));
  });

  PROJSYNC_LOG_DEBUG("sync retry scheduled", {observability::IntField("attempt", attempt), observability::IntField("backoff_ms", backoff.count())});
}

void Synchronizer::ReportExhausted(const SyncTask& task, const std::optional<model::DerivedAttributes>& expected, const std::string& error) {
  const auto key = task.event.Key();

  model::DriftRecord record;
  record.key         = key;
  record.expected    = expected;
  record.detected_at = util::Now();
  record.kind        = model::DriftKind::kSyncFailed;
  record.detail      = error;
  try {
    if (auto stored = store_->Get(key)) record.actual = stored->attributes;
  } catch (const std::exception& e) {
    PROJSYNC_LOG_WARN("could not read stored row for drift record", {observability::StringField("error", e.what())});
  }

  observability::Metrics::Instance().RecordSyncOutcome("exhausted");
  PROJSYNC_LOG_ERROR("sync retries exhausted", {observability::StringField("error", error)});
  drift_sink_->Report(record);
}

void Synchronizer::SetState(model::RowKey key, KeyStatus& status, model::SyncState next) {
  if (!model::CanTransition(status.state, next)) {
    PROJSYNC_LOG_ERROR("unexpected sync state transition", {observability::IntField("key", key), observability::StringField("from", model::ToString(status.state)),
                                                            observability::StringField("to", model::ToString(next))});
  }

  if (next == model::SyncState::kPending) {
    if (!status.pending_since) status.pending_since = util::Now();
  } else {
    status.pending_since.reset();
  }
  status.state = next;
}

void Synchronizer::Resolve(const SyncTask& task, SyncResult result) {
  if (task.done) task.done->set_value(std::move(result));
}

std::chrono::milliseconds Synchronizer::Backoff(uint32_t attempt) const {
  auto delay = options_.retry_backoff_initial;
  for (uint32_t i = 1; i < attempt && delay < options_.retry_backoff_max; ++i) delay *= 2;
  return std::min(delay, options_.retry_backoff_max);
}

} // namespace projsync::sync
