#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <set>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace rollout::observability {
namespace {

constexpr const char* kLoggerName     = "rollout-manager";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct Settings {
  std::string level   = "info";
  std::string pattern = kDefaultPattern;
  bool        include_trace_context{false};
};

// Environment beats the config file.
Settings Resolve(const rollout::runtime::config::RuntimeConfig& config) {
  Settings settings;
  const auto& logging = config.logging();

  if (const char* level = std::getenv("ROLLOUT_LOG_LEVEL")) {
    settings.level = level;
  } else if (!logging.level().empty()) {
    settings.level = logging.level();
  }

  if (const char* pattern = std::getenv("ROLLOUT_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  if (const char* include_trace = std::getenv("ROLLOUT_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    settings.include_trace_context = value == "1" || value == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }
  return settings;
}

bool g_include_trace_context{false};

thread_local std::vector<LogField> t_context;

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\n\"=") != std::string::npos;
}

// Command output is often multi-line; keep one record per line.
void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out += '"';
  for (const char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        break;
      default:
        out += c;
    }
  }
  out += '"';
}

void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out += ' ';
  out += field.key;
  out += '=';
  AppendValue(out, field.value);
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(out, {"trace_id", HexId(trace_bytes, 16)});
  AppendField(out, {"span_id", HexId(span_bytes, 8)});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string           out;
  std::set<std::string> seen;
  for (const auto& field : fields) {
    if (seen.insert(field.key).second) AppendField(out, field);
  }
  for (auto it = t_context.rbegin(); it != t_context.rend(); ++it) {
    if (seen.insert(it->key).second) AppendField(out, *it);
  }
  AppendTraceContext(out);
  return out;
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

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

LogContext::LogContext(std::initializer_list<LogField> fields) : pushed_(fields.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

LogContext::~LogContext() {
  t_context.resize(t_context.size() - pushed_);
}

void InitializeLogging(const rollout::runtime::config::RuntimeConfig& config) {
  const auto settings = Resolve(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);

  auto level = spdlog::level::from_str(settings.level);
  const bool unknown_level = level == spdlog::level::off && settings.level != "off";
  if (unknown_level) level = spdlog::level::info;
  logger->set_level(level);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.include_trace_context;

  if (unknown_level) {
    LogWarn("unknown log level, using info", {StringField("level", settings.level)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized = SerializeFields(fields);
  if (serialized.empty()) return std::string(message);
  return std::string(message) + ' ' + serialized;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  spdlog::log(level, "{}", FormatLine(message, fields));
}

} // namespace rollout::observability
