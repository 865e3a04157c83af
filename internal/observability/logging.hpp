#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace projsync::runtime::config {
class RuntimeConfig;
}

namespace projsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Service logger "projsync" plus drift logger "projsync.drift", both on stdout.
void InitializeLogging(const projsync::runtime::config::RuntimeConfig& config);
// Same loggers writing to `sink`.
void InitializeLogging(const projsync::runtime::config::RuntimeConfig& config, spdlog::sink_ptr sink);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

// Drift reports, filtered by logging.drift_level independently of logging.level.
void LogDrift(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

/*
  LogContext

  Fields appended to every line the current thread logs while the scope
  is alive, after the call's own fields. Scopes nest; inner fields follow
  outer ones. A sync task opens one with its key and sequence, a sweep
  with its mode, so lines from the repository and projection layers
  below them are attributable without passing the key down.
*/
class LogContext {
 public:
  explicit LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

 private:
  std::size_t restore_size_;
};

} // namespace projsync::observability

#define PROJSYNC_LOG_DEBUG(message, ...) ::projsync::observability::LogDebug((message), ##__VA_ARGS__)
#define PROJSYNC_LOG_INFO(message, ...) ::projsync::observability::LogInfo((message), ##__VA_ARGS__)
#define PROJSYNC_LOG_WARN(message, ...) ::projsync::observability::LogWarn((message), ##__VA_ARGS__)
#define PROJSYNC_LOG_ERROR(message, ...) ::projsync::observability::LogError((message), ##__VA_ARGS__)
#define PROJSYNC_LOG_DRIFT(message, ...) ::projsync::observability::LogDrift(::spdlog::level::warn, (message), ##__VA_ARGS__)
