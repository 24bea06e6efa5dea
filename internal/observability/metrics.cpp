#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace rollout::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Counter       = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;
using Histogram     = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>;
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Sessions are minutes long; a coarse interval is enough.
constexpr std::chrono::milliseconds kExportInterval{15000};

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// The attribute values must outlive the call; callers keep the strings.
void Increment(const Counter& counter, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { counter->Add(1, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(1, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(1, attributes);
  }
}

void Observe(const Histogram& histogram, double value, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter   phases;
  Histogram phase_duration_ms;
  Counter   sessions;
  Counter   rollbacks;
};

bool InitializeMetrics(const rollout::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlp(config.observability().metrics(), "metrics");
  if (!settings.enabled) return false;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = kExportInterval;
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", settings.service_name},
                                        {"rollout.deployment_target", config.state().deployment_target()}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("rollout-manager", "0.1.0");

  impl_->phases            = impl_->meter->CreateUInt64Counter("rollout.phase.count", "Phase outcomes by phase", "1");
  impl_->phase_duration_ms = impl_->meter->CreateDoubleHistogram("rollout.phase.duration_ms", "Phase wall-clock duration", "ms");
  impl_->sessions          = impl_->meter->CreateUInt64Counter("rollout.session.count", "Terminal session outcomes", "1");
  impl_->rollbacks         = impl_->meter->CreateUInt64Counter("rollout.rollback.count", "Rollback attempts by level", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordPhase(std::string_view phase, std::string_view outcome) {
  const std::string p(phase), o(outcome);
  Increment(impl_->phases, {{"phase", p}, {"outcome", o}});
}

void Metrics::ObservePhaseDurationMs(std::string_view phase, double duration_ms) {
  const std::string p(phase);
  Observe(impl_->phase_duration_ms, duration_ms, {{"phase", p}});
}

void Metrics::RecordSessionOutcome(std::string_view strategy, std::string_view outcome) {
  const std::string s(strategy), o(outcome);
  Increment(impl_->sessions, {{"strategy", s}, {"outcome", o}});
}

void Metrics::RecordRollback(std::string_view level, bool success) {
  const std::string l(level);
  Increment(impl_->rollbacks, {{"level", l}, {"success", success}});
}

} // namespace rollout::observability

#endif
