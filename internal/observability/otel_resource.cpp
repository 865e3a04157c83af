#include "internal/observability/otel_resource.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

namespace projsync::observability {

namespace resource = opentelemetry::sdk::resource;

namespace {

const char* DatabaseSystem(const projsync::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) return "sqlite";
  if (database.has_postgres()) return "postgresql";
  return "memory";
}

} // namespace

bool UsesHttpTransport(const projsync::runtime::config::ObservabilityConfig& config) {
  return config.transport() == projsync::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string ResolveOtlpEndpoint(const projsync::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (UsesHttpTransport(config)) {
    return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  }
  return "localhost:4317";
}

resource::Resource BuildResource(const projsync::runtime::config::RuntimeConfig& config) {
  const std::string mode = config.sync().mode().empty() ? std::string("inline") : config.sync().mode();

  resource::ResourceAttributes attrs = {
      {"service.name", std::string(kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)},
      {"db.system", std::string(DatabaseSystem(config.database()))},
      {"projsync.sync.mode", mode},
      {"projsync.sync.self_heal", config.sync().self_heal()},
  };
  return resource::Resource::Create(attrs);
}

} // namespace projsync::observability

#endif
