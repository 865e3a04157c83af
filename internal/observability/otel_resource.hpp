#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

#include "config/config.pb.h"

namespace projsync::observability {

inline constexpr const char* kInstrumentationName    = "projsync";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Configured endpoint, then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT,
// then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default.
std::string ResolveOtlpEndpoint(const projsync::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

bool UsesHttpTransport(const projsync::runtime::config::ObservabilityConfig& config);

// service.name/version plus the projection mode, self-heal setting and
// database backend, so every exported span and metric carries them.
opentelemetry::sdk::resource::Resource BuildResource(const projsync::runtime::config::RuntimeConfig& config);

} // namespace projsync::observability

#endif
