#pragma once

#include <map>
#include <mutex>

#include "deployment_driver.hpp"
#include "internal/util/time.hpp"

namespace rollout::deploy {

/*
  Blue/green cutover.

  A full second generation is started next to the live one, every unit
  must turn healthy, then the routing pointer flips. The old generation
  stays untouched until Finalize, which waits out the grace period
  before removing it, so rolling back after the flip is a pointer flip.
*/
class ParallelCutoverDriver final : public DeploymentDriver {
 public:
  using DeploymentDriver::DeploymentDriver;

  Strategy Kind() const override {
    return Strategy::STRATEGY_PARALLEL_CUTOVER;
  }

  void                     Deploy(const DeployRequest& request) override;
  void                     Rollback(const DeployRequest& request) override;
  void                     Finalize(const DeployRequest& request) override;
  void                     RemoveStandby(const DeployRequest& request) override;
  std::vector<std::string> Plan(const DeployRequest& request) override;
  void                     CheckHeadroom(const DeployRequest& request) override;

  static std::string OtherGeneration(const std::string& generation);

 private:
  std::mutex                                 mutex_;
  std::map<std::string, util::TimePoint> cutover_at_;
};

} // namespace rollout::deploy
