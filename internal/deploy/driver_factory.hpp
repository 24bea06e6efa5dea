#pragma once

#include <memory>

#include "deployment_driver.hpp"

namespace rollout::deploy {

// Holds the collaborators shared by both strategies and builds the
// driver a session asked for.
class DriverFactory {
 public:
  DriverFactory(std::shared_ptr<ContainerRuntime> runtime, std::shared_ptr<TrafficRouter> router,
                std::shared_ptr<health::HealthEvaluator> health, DriverOptions options);

  std::shared_ptr<DeploymentDriver> Create(Strategy strategy) const;

 private:
  std::shared_ptr<ContainerRuntime>        runtime_;
  std::shared_ptr<TrafficRouter>           router_;
  std::shared_ptr<health::HealthEvaluator> health_;
  DriverOptions                            options_;

  std::shared_ptr<DeploymentDriver> parallel_;
  std::shared_ptr<DeploymentDriver> sequential_;
};

} // namespace rollout::deploy
