#pragma once

#include <optional>

#include "deployment_driver.hpp"

namespace rollout::deploy {

/*
  In-place replacement, one unit at a time in identity order.

  Each replaced unit must turn healthy before the next one is touched.
  On the first failure the units replaced so far are put back on the
  source version in reverse order; units not yet reached are never
  touched.
*/
class SequentialReplaceDriver final : public DeploymentDriver {
 public:
  using DeploymentDriver::DeploymentDriver;

  Strategy Kind() const override {
    return Strategy::STRATEGY_SEQUENTIAL_REPLACE;
  }

  void                     Deploy(const DeployRequest& request) override;
  void                     Rollback(const DeployRequest& request) override;
  void                     Finalize(const DeployRequest& request) override;
  std::vector<std::string> Plan(const DeployRequest& request) override;

 private:
  struct Step {
    UnitSpec                   spec;
    std::optional<RunningUnit> previous;  // nullopt when the unit is new
  };

  std::vector<Step> Steps(const DeployRequest& request, std::string* generation);

  // Puts replaced units back in reverse order. Returns the failures.
  std::vector<std::string> Restore(const std::vector<Step>& replaced);
};

} // namespace rollout::deploy
