#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace projsync::observability {
namespace {

constexpr const char* kLoggerName      = "projsync";
constexpr const char* kDriftLoggerName = "projsync.drift";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool ResolveTraceContextEnabled(const projsync::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("PROJSYNC_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

thread_local std::vector<LogField> t_context;

void AppendFields(fmt::memory_buffer& out, const LogField* begin, const LogField* end) {
  for (auto it = begin; it != end; ++it) {
    fmt::format_to(std::back_inserter(out), " {}={}", it->key, it->value);
  }
}

#ifdef ENABLE_OTEL
void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  fmt::format_to(std::back_inserter(out), " trace_id={} span_id={}", std::string_view(trace_hex, sizeof(trace_hex)),
                 std::string_view(span_hex, sizeof(span_hex)));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

void Emit(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!logger.should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  AppendFields(line, fields.begin(), fields.end());
  AppendFields(line, t_context.data(), t_context.data() + t_context.size());
  AppendTraceContext(line);
  logger.log(level, "{}", std::string_view(line.data(), line.size()));
}

std::shared_ptr<spdlog::logger> MakeLogger(const char* name, spdlog::sink_ptr sink, const std::string& level) {
  spdlog::drop(name);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::from_str(level));
  logger->flush_on(spdlog::level::warn);
  return logger;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{}", value)};
}

void InitializeLogging(const projsync::runtime::config::RuntimeConfig& config) {
  InitializeLogging(config, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}

void InitializeLogging(const projsync::runtime::config::RuntimeConfig& config, spdlog::sink_ptr sink) {
  const auto& logging = config.logging();
  const auto  pattern = FromEnvOr("PROJSYNC_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %n: %v");

  // Both loggers share the sink, so the pattern is set once on it.
  sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(pattern));

  auto drift = MakeLogger(kDriftLoggerName, sink, FromEnvOr("PROJSYNC_DRIFT_LOG_LEVEL", logging.drift_level(), "warn"));
  spdlog::register_logger(drift);

  auto logger = MakeLogger(kLoggerName, sink, FromEnvOr("PROJSYNC_LOG_LEVEL", logging.level(), "info"));
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Emit(*spdlog::default_logger_raw(), level, message, fields);
}

void LogDrift(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto drift = spdlog::get(kDriftLoggerName);
  if (!drift) {
    // Not initialized: fall back to the service logger.
    Emit(*spdlog::default_logger_raw(), level, message, fields);
    return;
  }
  Emit(*drift, level, message, fields);
}

LogContext::LogContext(std::initializer_list<LogField> fields) : restore_size_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

LogContext::~LogContext() {
  t_context.resize(restore_size_);
}

} // namespace projsync::observability
