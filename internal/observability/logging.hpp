#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace rollout::runtime::config {
class RuntimeConfig;
}

namespace rollout::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

void InitializeLogging(const rollout::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Fields attached to every line logged by the current thread while the
  scope is alive (session_id, phase). Scopes nest; an explicit field with
  the same key wins over a scoped one, and an inner scope over an outer.
*/
class LogContext {
 public:
  explicit LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

 private:
  std::size_t pushed_;
};

// Renders `message key=value ...` the way Log writes it.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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

// Reserved for outcomes that need an operator.
inline void LogCritical(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::critical, message, fields);
}

} // namespace rollout::observability

#define ROLLOUT_LOG_DEBUG(message, ...) ::rollout::observability::LogDebug((message), ##__VA_ARGS__)
#define ROLLOUT_LOG_INFO(message, ...) ::rollout::observability::LogInfo((message), ##__VA_ARGS__)
#define ROLLOUT_LOG_WARN(message, ...) ::rollout::observability::LogWarn((message), ##__VA_ARGS__)
#define ROLLOUT_LOG_ERROR(message, ...) ::rollout::observability::LogError((message), ##__VA_ARGS__)
#define ROLLOUT_LOG_CRITICAL(message, ...) ::rollout::observability::LogCritical((message), ##__VA_ARGS__)
