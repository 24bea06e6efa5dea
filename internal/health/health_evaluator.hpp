#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "health_probe.hpp"
#include "internal/util/retry.hpp"

namespace rollout::backup {
class StoreAdapter;
}

namespace rollout::health {

enum class Verdict {
  Healthy,
  Degraded,  // some units or stores failing
  Unhealthy  // every unit failing, or a store down
};

std::string_view VerdictName(Verdict verdict);

struct HealthReport {
  Verdict                     verdict = Verdict::Unhealthy;
  std::vector<DeploymentUnit> units;
  std::map<std::string, bool> stores;
  unsigned                    attempts = 0;
  std::string                 detail;
};

struct HealthPolicy {
  unsigned                  attempts = 24;
  std::chrono::milliseconds interval{5000};
  std::chrono::milliseconds deadline{120000};
  std::chrono::milliseconds probe_timeout{10000};
};

/*
  Bounded readiness polling.

  Each attempt probes every unit and store in parallel; polling stops at
  the first attempt where everything is healthy, after `attempts`
  rounds, or at the deadline, whichever comes first. The report carries
  the last observed status of every unit.
*/
class HealthEvaluator {
 public:
  HealthEvaluator(std::shared_ptr<UnitProbe> probe, std::vector<std::shared_ptr<backup::StoreAdapter>> stores,
                  HealthPolicy policy, util::SleepFn sleep = util::RealSleep);

  // A non-default `deadline` cuts polling and each probe short at that
  // point in time.
  HealthReport Evaluate(const std::vector<DeploymentUnit>& units, bool include_stores = true,
                        util::TimePoint deadline = {}) const;

  // Single-unit gate used while bringing units up.
  bool WaitHealthy(const DeploymentUnit& unit, util::TimePoint deadline = {}) const;

  const HealthPolicy& Policy() const {
    return policy_;
  }

 private:
  void ProbeRound(std::vector<DeploymentUnit>& units, std::map<std::string, bool>& stores, bool include_stores,
                  std::chrono::milliseconds probe_timeout) const;

  util::RetryPolicy RetryPolicyFor(util::TimePoint deadline) const;

  std::shared_ptr<UnitProbe>                         probe_;
  std::vector<std::shared_ptr<backup::StoreAdapter>> stores_;
  HealthPolicy                                       policy_;
  util::SleepFn                                      sleep_;
};

} // namespace rollout::health
