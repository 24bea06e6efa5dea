#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "container_runtime.hpp"
#include "internal/util/retry.hpp"
#include "rollout/manager/v1/session.pb.h"
#include "traffic_router.hpp"

namespace rollout::health {
class HealthEvaluator;
}

namespace rollout::deploy {

using rollout::manager::v1::DeploymentUnit;
using rollout::manager::v1::Strategy;

struct DeployRequest {
  std::string     session_id;
  std::string     source_version;
  std::string     target_version;
  util::TimePoint deadline{};  // bounds unit start-up; default is none
};

struct DriverOptions {
  std::vector<rollout::runtime::config::ServiceConfig> services;
  unsigned                                             unit_start_attempts = 3;
  std::chrono::milliseconds                            unit_retry_backoff{5000};
  std::chrono::milliseconds                            grace_period{60000};
  unsigned                                             max_units = 0;  // 0 = unlimited
  std::chrono::milliseconds                            image_timeout{30000};
  util::SleepFn                                        sleep = util::RealSleep;
};

DriverOptions MakeDriverOptions(const rollout::runtime::config::DeploymentConfig& config);

/*
  One contract, two strategies.

  Deploy brings the managed units to request.target_version; Rollback
  returns them to request.source_version using only what the container
  runtime and the routing pointer report, so it works for a session
  recovered after a crash. Finalize makes the deploy permanent. Failures
  throw util::DeploymentError.

  Status() always reads the runtime; nothing is cached.
*/
class DeploymentDriver {
 public:
  DeploymentDriver(std::shared_ptr<ContainerRuntime> runtime, std::shared_ptr<TrafficRouter> router,
                   std::shared_ptr<health::HealthEvaluator> health, DriverOptions options);
  virtual ~DeploymentDriver() = default;

  virtual Strategy Kind() const = 0;

  virtual void Deploy(const DeployRequest& request) = 0;

  virtual void Rollback(const DeployRequest& request) = 0;

  virtual void Finalize(const DeployRequest& request) = 0;

  // Removes every unit outside the routed generation. Throws
  // util::DeploymentError when nothing is routed.
  virtual void RemoveStandby(const DeployRequest& request);

  // What Deploy and Finalize would do, for dry runs.
  virtual std::vector<std::string> Plan(const DeployRequest& request) = 0;

  // Throws util::ValidationError when a target image cannot be found.
  void CheckAvailable(const DeployRequest& request);

  // Throws util::ValidationError when the strategy lacks room to run.
  virtual void CheckHeadroom(const DeployRequest& request);

  std::vector<DeploymentUnit> Status();

  std::vector<DeploymentUnit> LiveUnits();

  // Version served by the live generation, empty before the first deploy.
  // Throws util::ValidationError when live units disagree.
  std::string CurrentVersion();

  std::vector<std::string> ImagesFor(const std::string& version) const;

 protected:
  // Routed generation; inferred from the units when no pointer exists.
  std::string LiveGeneration(const std::vector<RunningUnit>& units);

  std::vector<UnitSpec> GenerationSpecs(const std::string& generation, const std::string& version) const;

  // Starts the unit and waits for it to turn healthy, retrying a bounded
  // number of times and never past `deadline`. A failed attempt leaves
  // nothing running.
  void StartUnit(const UnitSpec& spec, util::TimePoint deadline = {});

  std::vector<RunningUnit> UnitsOf(const std::vector<RunningUnit>& units, const std::string& generation) const;

  DeploymentUnit ToDeploymentUnit(const RunningUnit& unit, const std::string& live) const;

  std::shared_ptr<ContainerRuntime>        runtime_;
  std::shared_ptr<TrafficRouter>           router_;
  std::shared_ptr<health::HealthEvaluator> health_;
  DriverOptions                            options_;
};

std::string ImageRef(const std::string& image, const std::string& version);

std::string UnitIdentity(const std::string& service, const std::string& generation, unsigned index);

} // namespace rollout::deploy
