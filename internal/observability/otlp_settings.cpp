#include "internal/observability/otlp_settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "config/config.pb.h"

namespace rollout::observability {
namespace {

std::string Env(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value ? value : "";
}

std::string Upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string TrimSlash(std::string s) {
  while (!s.empty() && s.back() == '/') s.pop_back();
  return s;
}

} // namespace

OtlpSettings ResolveOtlp(const rollout::runtime::config::OtlpExporterConfig& config, std::string_view signal) {
  OtlpSettings settings;

  if (config.transport() == "http") {
    settings.transport = OtlpTransport::kHttpProtobuf;
  } else if (!config.transport().empty() && config.transport() != "grpc") {
    throw std::invalid_argument("unknown OTLP transport '" + config.transport() + "' (expected grpc or http)");
  }
  const bool http = settings.transport == OtlpTransport::kHttpProtobuf;

  const auto signal_env  = Env("OTEL_EXPORTER_OTLP_" + Upper(signal) + "_ENDPOINT");
  const auto generic_env = Env("OTEL_EXPORTER_OTLP_ENDPOINT");

  if (!config.endpoint().empty()) {
    settings.endpoint = config.endpoint();
  } else if (!signal_env.empty()) {
    settings.endpoint = signal_env;
  } else if (!generic_env.empty()) {
    settings.endpoint = http ? TrimSlash(generic_env) + "/v1/" + std::string(signal) : generic_env;
  }
  settings.enabled = !settings.endpoint.empty();

  if (settings.endpoint.empty()) {
    settings.endpoint = http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  }

  if (!config.service_name().empty()) {
    settings.service_name = config.service_name();
  } else if (const auto name = Env("OTEL_SERVICE_NAME"); !name.empty()) {
    settings.service_name = name;
  }

  settings.insecure = settings.endpoint.rfind("https://", 0) != 0;
  return settings;
}

} // namespace rollout::observability
