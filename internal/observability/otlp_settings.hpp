#pragma once

#include <string>
#include <string_view>

namespace rollout::runtime::config {
class OtlpExporterConfig;
}

namespace rollout::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpSettings {
  bool          enabled{false};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  std::string   service_name{"rollout-manager"};
  bool          insecure{true};
};

/*
  Resolves one exporter ("traces" or "metrics").

  Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  OTEL_EXPORTER_OTLP_ENDPOINT (with /v1/<signal> appended for http), then
  the collector defaults. The exporter is enabled only when one of the
  first three is set. Throws std::invalid_argument on an unknown
  transport.
*/
OtlpSettings ResolveOtlp(const rollout::runtime::config::OtlpExporterConfig& config, std::string_view signal);

} // namespace rollout::observability
