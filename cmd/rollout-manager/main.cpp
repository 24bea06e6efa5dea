#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/update_orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

namespace obs = rollout::observability;

// In-flight Upgrade calls get this long to reach a terminal phase on
// shutdown; anything still running is resumed by crash recovery.
constexpr std::chrono::seconds kDrainTimeout{30};

std::optional<std::string> ParseConfigPath(int argc, char** argv) {
  if (argc == 2 && std::string(argv[1]).rfind("--", 0) != 0) return std::string(argv[1]);
  if (argc == 3 && std::string(argv[1]) == "--config") return std::string(argv[2]);
  return std::nullopt;
}

// Blocks SIGINT/SIGTERM for every thread started afterwards so that only
// WaitForTermination receives them.
sigset_t BlockTerminationSignals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  return set;
}

int WaitForTermination(const sigset_t& set) {
  int signal = 0;
  sigwait(&set, &signal);
  return signal;
}

void ResumeInterruptedSessions(rollout::core::UpdateOrchestrator& orchestrator) {
  const auto outcomes = orchestrator.RecoverInterruptedSessions();
  for (const auto& outcome : outcomes) {
    ROLLOUT_LOG_WARN("resumed interrupted session", {obs::StringField("session_id", outcome.session.session_id()),
                                                     obs::BoolField("manual_intervention_required", outcome.manual_intervention_required),
                                                     obs::StringField("message", outcome.message)});
  }
  if (!outcomes.empty()) {
    ROLLOUT_LOG_INFO("crash recovery finished", {obs::IntField("sessions", static_cast<int64_t>(outcomes.size()))});
  }
}

void ShutdownObservability() {
  obs::ShutdownLogging();
  obs::ShutdownMetrics();
  obs::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ParseConfigPath(argc, argv);
  if (!config_path) {
    std::cerr << "usage: rollout-manager [--config] <config.yaml>" << std::endl;
    return 1;
  }

  const sigset_t termination = BlockTerminationSignals();

  try {
    const auto config = rollout::config::ConfigLoader::LoadFromYaml(*config_path);

    obs::InitializeTracing(config);
    obs::InitializeMetrics(config);
    obs::InitializeLogging(config);

    auto app = rollout::factory::Build(config);

    // Before listening, so a client never sees a session that a dead
    // process left half way through.
    ResumeInterruptedSessions(*app.orchestrator);

    rollout::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
    ROLLOUT_LOG_INFO("rollout manager started", {obs::StringField("deployment_target", config.state().deployment_target()),
                                                 obs::StringField("state_backend", config.state().backend())});

    const int signal = WaitForTermination(termination);
    ROLLOUT_LOG_INFO("shutting down rollout manager", {obs::IntField("signal", signal)});

    server.Stop(kDrainTimeout);
    ShutdownObservability();
  } catch (const std::exception& e) {
    ROLLOUT_LOG_ERROR("fatal error", {obs::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
