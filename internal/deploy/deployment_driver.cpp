#include "deployment_driver.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

#include "internal/health/health_evaluator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rollout::deploy {

using rollout::manager::v1::HealthStatus;

DriverOptions MakeDriverOptions(const rollout::runtime::config::DeploymentConfig& config) {
  DriverOptions options;
  options.services.assign(config.services().begin(), config.services().end());
  options.unit_start_attempts = config.unit_start_attempts() == 0 ? 3 : config.unit_start_attempts();
  options.unit_retry_backoff  = util::ToMillis(config.unit_retry_backoff(), std::chrono::seconds(5));
  options.grace_period        = util::ToMillis(config.grace_period(), std::chrono::seconds(60));
  options.max_units           = config.max_units();
  return options;
}

std::string ImageRef(const std::string& image, const std::string& version) {
  return image + ":" + version;
}

std::string UnitIdentity(const std::string& service, const std::string& generation, unsigned index) {
  return service + "-" + generation + "-" + std::to_string(index);
}

DeploymentDriver::DeploymentDriver(std::shared_ptr<ContainerRuntime> runtime, std::shared_ptr<TrafficRouter> router,
                                   std::shared_ptr<health::HealthEvaluator> health, DriverOptions options)
    : runtime_(std::move(runtime)), router_(std::move(router)), health_(std::move(health)), options_(std::move(options)) {
  if (!runtime_ || !router_ || !health_) {
    throw std::invalid_argument("DeploymentDriver requires a runtime, a router and a health evaluator");
  }
  if (options_.unit_start_attempts == 0) options_.unit_start_attempts = 1;
}

std::vector<std::string> DeploymentDriver::ImagesFor(const std::string& version) const {
  std::vector<std::string> images;
  for (const auto& service : options_.services) {
    images.push_back(ImageRef(service.image(), version));
  }
  return images;
}

std::vector<UnitSpec> DeploymentDriver::GenerationSpecs(const std::string& generation, const std::string& version) const {
  std::vector<UnitSpec> specs;
  for (const auto& service : options_.services) {
    const unsigned replicas = service.replicas() == 0 ? 1 : service.replicas();
    for (unsigned i = 0; i < replicas; ++i) {
      UnitSpec spec;
      spec.identity   = UnitIdentity(service.name(), generation, i);
      spec.service    = service.name();
      spec.generation = generation;
      spec.version    = version;
      spec.image_ref  = ImageRef(service.image(), version);
      spec.run_args.assign(service.run_args().begin(), service.run_args().end());
      specs.push_back(std::move(spec));
    }
  }
  return specs;
}

std::vector<RunningUnit> DeploymentDriver::UnitsOf(const std::vector<RunningUnit>& units, const std::string& generation) const {
  std::vector<RunningUnit> out;
  std::copy_if(units.begin(), units.end(), std::back_inserter(out),
               [&](const RunningUnit& unit) { return unit.generation == generation; });
  std::sort(out.begin(), out.end(), [](const RunningUnit& a, const RunningUnit& b) { return a.identity < b.identity; });
  return out;
}

std::string DeploymentDriver::LiveGeneration(const std::vector<RunningUnit>& units) {
  auto routed = router_->Current();
  if (!routed.empty()) return routed;

  std::set<std::string> generations;
  for (const auto& unit : units) generations.insert(unit.generation);
  if (generations.empty()) return {};
  if (generations.size() == 1) return *generations.begin();

  throw util::ValidationError("no routing pointer and " + std::to_string(generations.size()) +
                              " generations running; cannot tell which one is live");
}

DeploymentUnit DeploymentDriver::ToDeploymentUnit(const RunningUnit& unit, const std::string& live) const {
  DeploymentUnit out;
  out.set_identity(unit.identity);
  out.set_service(unit.service);
  out.set_generation(unit.generation);
  out.set_current_version(unit.version);
  out.set_desired_version(unit.version);
  out.set_health_status(HealthStatus::HEALTH_UNKNOWN);
  out.set_live(unit.generation == live);
  return out;
}

std::vector<DeploymentUnit> DeploymentDriver::Status() {
  const auto units = runtime_->List();
  const auto live  = LiveGeneration(units);

  std::vector<DeploymentUnit> out;
  for (const auto& unit : units) {
    out.push_back(ToDeploymentUnit(unit, live));
  }
  std::sort(out.begin(), out.end(), [](const DeploymentUnit& a, const DeploymentUnit& b) { return a.identity() < b.identity(); });
  return out;
}

std::vector<DeploymentUnit> DeploymentDriver::LiveUnits() {
  auto units = Status();
  units.erase(std::remove_if(units.begin(), units.end(), [](const DeploymentUnit& u) { return !u.live(); }), units.end());
  return units;
}

std::string DeploymentDriver::CurrentVersion() {
  std::set<std::string> versions;
  for (const auto& unit : LiveUnits()) versions.insert(unit.current_version());

  if (versions.empty()) return {};
  if (versions.size() > 1) {
    std::string list;
    for (const auto& v : versions) list += (list.empty() ? "" : ", ") + v;
    throw util::ValidationError("live units run mixed versions: " + list);
  }
  return *versions.begin();
}

void DeploymentDriver::CheckHeadroom(const DeployRequest&) {
}

void DeploymentDriver::CheckAvailable(const DeployRequest& request) {
  std::vector<std::string> missing;
  for (const auto& image : ImagesFor(request.target_version)) {
    if (!runtime_->ImageAvailable(image, util::CapToDeadline(options_.image_timeout, request.deadline))) missing.push_back(image);
  }
  if (!missing.empty()) {
    std::string list;
    for (const auto& image : missing) list += " " + image;
    throw util::ValidationError("target version " + request.target_version + " is not available:" + list);
  }
}

void DeploymentDriver::RemoveStandby(const DeployRequest& request) {
  const auto live = router_->Current();
  if (live.empty()) {
    throw util::DeploymentError("routing pointer missing, cannot tell standby units from live ones");
  }
  for (const auto& unit : runtime_->List()) {
    if (unit.generation == live) continue;
    observability::LogInfo("removing standby unit", {observability::StringField("session_id", request.session_id),
                                                     observability::StringField("unit", unit.identity),
                                                     observability::StringField("version", unit.version)});
    runtime_->Remove(unit.identity);
  }
}

void DeploymentDriver::StartUnit(const UnitSpec& spec, util::TimePoint deadline) {
  util::RetryPolicy retry;
  retry.attempts = options_.unit_start_attempts;
  retry.backoff  = options_.unit_retry_backoff;
  retry.deadline = util::CapToDeadline(std::chrono::milliseconds(0), deadline);

  std::string last_error = "unit never became healthy";
  const auto  attempts   = util::RetryUntil(
      retry,
      [&](unsigned attempt) {
        try {
          runtime_->Start(spec);
        } catch (const util::DeploymentError& e) {
          last_error = e.what();
          observability::LogWarn("unit start failed", {observability::StringField("unit", spec.identity),
                                                       observability::IntField("attempt", attempt),
                                                       observability::StringField("error", e.what())});
          runtime_->Remove(spec.identity);
          return false;
        }

        DeploymentUnit unit;
        unit.set_identity(spec.identity);
        unit.set_service(spec.service);
        unit.set_generation(spec.generation);
        unit.set_current_version(spec.version);
        if (health_->WaitHealthy(unit, deadline)) {
          return true;
        }

        last_error = "unit never became healthy";
        observability::LogWarn("unit unhealthy after start", {observability::StringField("unit", spec.identity),
                                                              observability::IntField("attempt", attempt)});
        runtime_->Remove(spec.identity);
        return false;
      },
      options_.sleep);

  if (attempts == 0) {
    throw util::DeploymentError(spec.identity + " failed after " + std::to_string(options_.unit_start_attempts) +
                                " attempt(s): " + last_error);
  }
}

} // namespace rollout::deploy
