#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace projsync::runtime::config {
class RuntimeConfig;
}

namespace projsync::observability {

// Span names.
inline constexpr std::string_view kSyncProcessSpan  = "projsync.sync.process";
inline constexpr std::string_view kMonitorSweepSpan = "projsync.monitor.sweep";
inline constexpr std::string_view kIngestImportSpan = "projsync.ingest.import";

// Span attribute keys shared by the sync path, the monitor and the services.
namespace attr {
inline constexpr std::string_view kKey         = "projsync.key";
inline constexpr std::string_view kSequence    = "projsync.sequence";
inline constexpr std::string_view kChange      = "projsync.change";
inline constexpr std::string_view kAttempt     = "projsync.attempt";
inline constexpr std::string_view kOutcome     = "projsync.outcome";
inline constexpr std::string_view kMode        = "projsync.mode";
inline constexpr std::string_view kSelfHeal    = "projsync.self_heal";
inline constexpr std::string_view kKeysChecked = "projsync.keys_checked";
inline constexpr std::string_view kDrift       = "projsync.drift";
inline constexpr std::string_view kHealed      = "projsync.healed";
inline constexpr std::string_view kClusters    = "projsync.clusters";
inline constexpr std::string_view kDriftKind   = "projsync.drift.kind";
} // namespace attr

// Exporter, sampler and resource come from config.observability(); the
// resource also names the projection mode and the database backend.
bool InitializeTracing(const projsync::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const projsync::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Adds an event to the span active on the calling thread. No-op without one.
void AddActiveSpanEvent(std::string_view name, std::initializer_list<std::pair<std::string_view, std::string>> attributes);

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveSyncDurationMs(std::string_view mode, double duration_ms);
  void RecordSyncOutcome(std::string_view outcome);
  void RecordDrift(std::string_view kind);
  void SetKeyStateCount(std::string_view state, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const projsync::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const projsync::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline void AddActiveSpanEvent(std::string_view, std::initializer_list<std::pair<std::string_view, std::string>>) {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveSyncDurationMs(std::string_view, double) {
}

inline void Metrics::RecordSyncOutcome(std::string_view) {
}

inline void Metrics::RecordDrift(std::string_view) {
}

inline void Metrics::SetKeyStateCount(std::string_view, std::uint64_t) {
}
#endif

} // namespace projsync::observability
