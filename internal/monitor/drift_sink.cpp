#include "drift_sink.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace projsync::monitor {

DriftLedger::DriftLedger(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

void DriftLedger::Report(const model::DriftRecord& record) {
  {
    std::lock_guard lock(mutex_);
    records_.push_back(record);
    if (records_.size() > capacity_) {
      records_.pop_front();
    }
    ++total_;
  }

  const auto* kind     = model::ToString(record.kind);
  const auto  expected = record.expected ? model::ToString(*record.expected) : std::string("<none>");
  const auto  actual   = record.actual ? model::ToString(*record.actual) : std::string("<none>");

  observability::Metrics::Instance().RecordDrift(kind);
  // Lands on the sweep or sync span that found it.
  observability::AddActiveSpanEvent("projsync.drift", {{observability::attr::kKey, std::to_string(record.key)},
                                                       {observability::attr::kDriftKind, kind},
                                                       {"projsync.drift.detail", record.detail}});
  PROJSYNC_LOG_DRIFT("drift detected", {observability::IntField("key", record.key), observability::StringField("kind", kind),
                                        observability::StringField("expected", expected), observability::StringField("actual", actual),
                                        observability::StringField("detail", record.detail)});
}

std::vector<model::DriftRecord> DriftLedger::Recent(std::size_t limit) const {
  std::lock_guard                 lock(mutex_);
  std::vector<model::DriftRecord> out;
  for (auto it = records_.rbegin(); it != records_.rend() && out.size() < limit; ++it) {
    out.push_back(*it);
  }
  return out;
}

uint64_t DriftLedger::Total() const {
  std::lock_guard lock(mutex_);
  return total_;
}

} // namespace projsync::monitor
