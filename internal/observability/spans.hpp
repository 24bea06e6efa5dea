#pragma once

#include <memory>
#include <string_view>

namespace rollout::runtime::config {
class RuntimeConfig;
}

namespace rollout::observability {

// Both return false when no exporter is configured; the API below then
// records nothing.
bool InitializeTracing(const rollout::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const rollout::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per orchestrator phase or rollback, active for the scope.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
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

  void RecordPhase(std::string_view phase, std::string_view outcome);
  void ObservePhaseDurationMs(std::string_view phase, double duration_ms);
  void RecordSessionOutcome(std::string_view strategy, std::string_view outcome);
  // level is "deployment" or "restore".
  void RecordRollback(std::string_view level, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const rollout::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const rollout::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordPhase(std::string_view, std::string_view) {
}

inline void Metrics::ObservePhaseDurationMs(std::string_view, double) {
}

inline void Metrics::RecordSessionOutcome(std::string_view, std::string_view) {
}

inline void Metrics::RecordRollback(std::string_view, bool) {
}
#endif

} // namespace rollout::observability
