#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "rollout/manager/v1/session.pb.h"

namespace rollout::deploy {
class ContainerRuntime;
}

namespace rollout::health {

using rollout::manager::v1::DeploymentUnit;

// Readiness signal of one running unit.
class UnitProbe {
 public:
  virtual ~UnitProbe() = default;

  virtual bool Probe(const DeploymentUnit& unit, std::chrono::milliseconds timeout) = 0;
};

/*
  Runs the service's health_command with `{unit}` and `{service}`
  expanded; exit status 0 is healthy. Services without a command fall
  back to the container runtime's own view of the unit.
*/
class CommandUnitProbe final : public UnitProbe {
 public:
  CommandUnitProbe(const rollout::runtime::config::DeploymentConfig& config,
                   std::shared_ptr<deploy::ContainerRuntime>           runtime);

  bool Probe(const DeploymentUnit& unit, std::chrono::milliseconds timeout) override;

 private:
  std::map<std::string, std::string>        commands_;
  std::shared_ptr<deploy::ContainerRuntime> runtime_;
};

} // namespace rollout::health
