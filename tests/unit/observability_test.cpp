#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_settings.hpp"

using namespace rollout::observability;
using namespace std::chrono_literals;

namespace {

void TestPlainAndQuotedValues() {
  assert(FormatLine("phase started", {}) == "phase started");
  assert(FormatLine("backup created", {StringField("store", "appdb"), IntField("bytes", 4096), BoolField("ok", true)}) ==
         "backup created store=appdb bytes=4096 ok=true");
  assert(FormatLine("x", {DurationField("elapsed", 1500ms)}) == "x elapsed=1500ms");

  assert(FormatLine("x", {StringField("error", "pull access denied")}) == R"(x error="pull access denied")");
  assert(FormatLine("x", {StringField("stderr", "line one\nsay \"hi\"")}) == R"(x stderr="line one\nsay \"hi\"")");
  assert(FormatLine("x", {StringField("reason", "")}) == R"(x reason="")");
}

void TestContextIsScopedAndExplicitFieldsWin() {
  {
    LogContext session({StringField("session_id", "s-1")});
    assert(FormatLine("a", {}) == "a session_id=s-1");
    {
      LogContext phase({StringField("phase", "deploying")});
      assert(FormatLine("b", {StringField("unit", "api-green-0")}) == "b unit=api-green-0 phase=deploying session_id=s-1");
      assert(FormatLine("c", {StringField("phase", "rolling_back")}) == "c phase=rolling_back session_id=s-1");
    }
    {
      LogContext inner({StringField("session_id", "s-2")});
      assert(FormatLine("d", {}) == "d session_id=s-2");
    }
    assert(FormatLine("e", {}) == "e session_id=s-1");

    // Other threads do not see this thread's context.
    std::string other;
    std::thread([&other] { other = FormatLine("f", {}); }).join();
    assert(other == "f");
  }
  assert(FormatLine("g", {}) == "g");
}

void ClearOtelEnv() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  unsetenv("OTEL_SERVICE_NAME");
}

void TestOtlpDisabledWithoutEndpoint() {
  ClearOtelEnv();
  rollout::runtime::config::OtlpExporterConfig config;
  const auto settings = ResolveOtlp(config, "traces");
  assert(!settings.enabled);
  assert(settings.endpoint == "localhost:4317");
  assert(settings.transport == OtlpTransport::kGrpc);
  assert(settings.service_name == "rollout-manager");
}

void TestOtlpEndpointPrecedence() {
  ClearOtelEnv();
  rollout::runtime::config::OtlpExporterConfig config;
  config.set_transport("http");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318/", 1);
  auto settings = ResolveOtlp(config, "metrics");
  assert(settings.enabled);
  assert(settings.endpoint == "http://collector:4318/v1/metrics");
  assert(settings.insecure);

  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "https://metrics.example:4318/v1/metrics", 1);
  settings = ResolveOtlp(config, "metrics");
  assert(settings.endpoint == "https://metrics.example:4318/v1/metrics");
  assert(!settings.insecure);
  // The traces exporter does not pick up the metrics variable.
  assert(ResolveOtlp(config, "traces").endpoint == "http://collector:4318/v1/traces");

  config.set_endpoint("http://override:4318/v1/metrics");
  config.set_service_name("rollout-staging");
  settings = ResolveOtlp(config, "metrics");
  assert(settings.endpoint == "http://override:4318/v1/metrics");
  assert(settings.service_name == "rollout-staging");
  ClearOtelEnv();
}

void TestOtlpUnknownTransport() {
  rollout::runtime::config::OtlpExporterConfig config;
  config.set_transport("udp");
  bool threw = false;
  try {
    ResolveOtlp(config, "traces");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPlainAndQuotedValues();
  TestContextIsScopedAndExplicitFieldsWin();
  TestOtlpDisabledWithoutEndpoint();
  TestOtlpEndpointPrecedence();
  TestOtlpUnknownTransport();

  std::cout << "observability_test: pass\n";
  return 0;
}
