#include "driver_factory.hpp"

#include "internal/util/errors.hpp"
#include "parallel_cutover_driver.hpp"
#include "sequential_replace_driver.hpp"

namespace rollout::deploy {

DriverFactory::DriverFactory(std::shared_ptr<ContainerRuntime> runtime, std::shared_ptr<TrafficRouter> router,
                             std::shared_ptr<health::HealthEvaluator> health, DriverOptions options)
    : runtime_(std::move(runtime)), router_(std::move(router)), health_(std::move(health)), options_(std::move(options)) {
  parallel_   = std::make_shared<ParallelCutoverDriver>(runtime_, router_, health_, options_);
  sequential_ = std::make_shared<SequentialReplaceDriver>(runtime_, router_, health_, options_);
}

std::shared_ptr<DeploymentDriver> DriverFactory::Create(Strategy strategy) const {
  switch (strategy) {
    case Strategy::STRATEGY_PARALLEL_CUTOVER:
      return parallel_;
    case Strategy::STRATEGY_SEQUENTIAL_REPLACE:
      return sequential_;
    default:
      throw util::ValidationError("unknown deployment strategy " + std::to_string(static_cast<int>(strategy)));
  }
}

} // namespace rollout::deploy
