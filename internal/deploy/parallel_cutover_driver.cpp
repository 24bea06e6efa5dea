#include "parallel_cutover_driver.hpp"

#include <algorithm>

#include "internal/health/health_evaluator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/util/errors.hpp"

namespace rollout::deploy {

namespace {

constexpr const char* kBlue  = "blue";
constexpr const char* kGreen = "green";

// Generation whose units all run `version`, ignoring `exclude`.
std::string GenerationRunning(const std::vector<RunningUnit>& units, const std::string& version, const std::string& exclude) {
  std::map<std::string, bool> uniform;
  for (const auto& unit : units) {
    if (unit.generation == exclude) continue;
    auto [it, inserted] = uniform.emplace(unit.generation, true);
    if (unit.version != version) it->second = false;
  }
  for (const auto& [generation, all_match] : uniform) {
    if (all_match) return generation;
  }
  return {};
}

} // namespace

std::string ParallelCutoverDriver::OtherGeneration(const std::string& generation) {
  return generation == kBlue ? kGreen : kBlue;
}

void ParallelCutoverDriver::CheckHeadroom(const DeployRequest& request) {
  if (options_.max_units == 0) return;

  const auto units    = runtime_->List();
  const auto live     = LiveGeneration(units);
  const auto next     = live.empty() ? std::string(kBlue) : OtherGeneration(live);
  const auto kept     = units.size() - UnitsOf(units, next).size();
  const auto required = kept + GenerationSpecs(next, request.target_version).size();
  if (required > options_.max_units) {
    throw util::ValidationError("parallel cutover needs " + std::to_string(required) + " units, limit is " +
                                std::to_string(options_.max_units));
  }
}

std::vector<std::string> ParallelCutoverDriver::Plan(const DeployRequest& request) {
  const auto units = runtime_->List();
  const auto live  = LiveGeneration(units);
  const auto next  = live.empty() ? std::string(kBlue) : OtherGeneration(live);

  std::vector<std::string> plan;
  for (const auto& stale : UnitsOf(units, next)) {
    plan.push_back("remove stale unit " + stale.identity + " (" + stale.version + ")");
  }
  for (const auto& spec : GenerationSpecs(next, request.target_version)) {
    plan.push_back("start unit " + spec.identity + " from " + spec.image_ref);
  }
  plan.push_back("switch traffic from generation '" + live + "' to '" + next + "'");
  if (!live.empty()) {
    plan.push_back("retain generation '" + live + "' for " + std::to_string(options_.grace_period.count()) +
                   "ms, then remove it");
  }
  return plan;
}

void ParallelCutoverDriver::Deploy(const DeployRequest& request) {
  const auto units = runtime_->List();
  const auto live  = LiveGeneration(units);
  const auto next  = live.empty() ? std::string(kBlue) : OtherGeneration(live);

  for (const auto& stale : UnitsOf(units, next)) {
    runtime_->Remove(stale.identity);
  }

  const auto specs = GenerationSpecs(next, request.target_version);
  observability::LogInfo("starting new generation", {observability::StringField("session_id", request.session_id),
                                                      observability::StringField("generation", next),
                                                      observability::IntField("units", static_cast<std::int64_t>(specs.size()))});

  std::mutex                 failures_mutex;
  std::vector<std::string>   failures;
  std::vector<runtime::Task> tasks;
  for (const auto& spec : specs) {
    tasks.emplace_back([this, &spec, &request, &failures, &failures_mutex] {
      try {
        StartUnit(spec, request.deadline);
      } catch (const util::DeploymentError& e) {
        std::lock_guard lock(failures_mutex);
        failures.push_back(e.what());
      }
    });
  }
  runtime::RunBounded(std::move(tasks), specs.size(), "cutover-start");

  if (!failures.empty()) {
    std::string detail;
    for (const auto& failure : failures) detail += "; " + failure;
    throw util::DeploymentError(std::to_string(failures.size()) + " of " + std::to_string(specs.size()) +
                                " unit(s) in generation '" + next + "' failed" + detail);
  }

  router_->Switch(next);
  {
    std::lock_guard lock(mutex_);
    cutover_at_[request.session_id] = util::Now();
  }
  observability::LogInfo("cutover complete", {observability::StringField("session_id", request.session_id),
                                               observability::StringField("from", live),
                                               observability::StringField("to", next)});
}

void ParallelCutoverDriver::Rollback(const DeployRequest& request) {
  const auto units  = runtime_->List();
  const auto routed = router_->Current();

  const auto target_generation = GenerationRunning(units, request.target_version, {});
  const auto source_generation = GenerationRunning(units, request.source_version, target_generation);

  observability::LogWarn("rolling back cutover", {observability::StringField("session_id", request.session_id),
                                                  observability::StringField("routed", routed),
                                                  observability::StringField("source_generation", source_generation),
                                                  observability::StringField("target_generation", target_generation)});

  const bool cut_over = !routed.empty() && routed == target_generation;
  if (cut_over) {
    if (request.source_version.empty()) {
      router_->Clear();
    } else {
      const auto previous = UnitsOf(units, source_generation);
      if (source_generation.empty() || previous.empty()) {
        throw util::DeploymentError("previous generation running " + request.source_version + " no longer exists");
      }

      std::vector<DeploymentUnit> check;
      for (const auto& unit : previous) check.push_back(ToDeploymentUnit(unit, routed));
      const auto report = health_->Evaluate(check, false);
      if (report.verdict != health::Verdict::Healthy) {
        throw util::DeploymentError("previous generation '" + source_generation + "' is not healthy: " + report.detail);
      }
      router_->Switch(source_generation);
    }
  } else if (routed.empty() && !source_generation.empty()) {
    router_->Switch(source_generation);
  }

  if (!target_generation.empty() && target_generation != router_->Current()) {
    for (const auto& unit : UnitsOf(units, target_generation)) {
      runtime_->Remove(unit.identity);
    }
  }

  std::lock_guard lock(mutex_);
  cutover_at_.erase(request.session_id);
}

void ParallelCutoverDriver::Finalize(const DeployRequest& request) {
  std::chrono::milliseconds wait{0};
  {
    std::lock_guard lock(mutex_);
    auto            it = cutover_at_.find(request.session_id);
    if (it != cutover_at_.end()) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - it->second);
      wait               = std::max(std::chrono::milliseconds(0), options_.grace_period - elapsed);
      cutover_at_.erase(it);
    }
  }
  if (wait.count() > 0) {
    observability::LogInfo("holding previous generation for grace period",
                           {observability::StringField("session_id", request.session_id),
                            observability::IntField("wait_ms", wait.count())});
    options_.sleep(wait);
  }

  RemoveStandby(request);
}

void ParallelCutoverDriver::RemoveStandby(const DeployRequest& request) {
  DeploymentDriver::RemoveStandby(request);

  std::lock_guard lock(mutex_);
  cutover_at_.erase(request.session_id);
}

} // namespace rollout::deploy
