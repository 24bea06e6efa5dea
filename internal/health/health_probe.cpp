#include "health_probe.hpp"

#include "internal/deploy/container_runtime.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace rollout::health {

CommandUnitProbe::CommandUnitProbe(const rollout::runtime::config::DeploymentConfig& config,
                                   std::shared_ptr<deploy::ContainerRuntime>           runtime)
    : runtime_(std::move(runtime)) {
  for (const auto& service : config.services()) {
    if (!service.health_command().empty()) {
      commands_[service.name()] = service.health_command();
    }
  }
}

bool CommandUnitProbe::Probe(const DeploymentUnit& unit, std::chrono::milliseconds timeout) {
  auto it = commands_.find(unit.service());
  if (it == commands_.end()) {
    return runtime_ && runtime_->IsHealthy(unit.identity(), timeout);
  }

  auto command = util::ExpandTemplate(it->second, "unit", unit.identity());
  command      = util::ExpandTemplate(command, "service", unit.service());

  util::CommandResult result;
  try {
    result = util::RunShell(command, timeout);
  } catch (const util::CommandError& e) {
    observability::LogWarn("health probe could not run",
                           {observability::StringField("unit", unit.identity()), observability::StringField("error", e.what())});
    return false;
  }

  if (!result.Ok()) {
    observability::LogDebug("health probe negative", {observability::StringField("unit", unit.identity()),
                                                      observability::BoolField("timed_out", result.timed_out),
                                                      observability::IntField("exit_code", result.exit_code)});
  }
  return result.Ok();
}

} // namespace rollout::health
