#include "sequential_replace_driver.hpp"

#include <algorithm>
#include <map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rollout::deploy {

namespace {

constexpr const char* kInitialGeneration = "blue";

UnitSpec SpecFrom(const UnitSpec& like, const RunningUnit& previous, const std::string& image) {
  UnitSpec spec   = like;
  spec.generation = previous.generation;
  spec.version    = previous.version;
  spec.image_ref  = ImageRef(image, previous.version);
  return spec;
}

} // namespace

std::vector<SequentialReplaceDriver::Step> SequentialReplaceDriver::Steps(const DeployRequest& request, std::string* generation) {
  const auto units = runtime_->List();
  auto       live  = LiveGeneration(units);
  if (live.empty()) live = kInitialGeneration;
  if (generation) *generation = live;

  std::map<std::string, RunningUnit> existing;
  for (const auto& unit : UnitsOf(units, live)) existing.emplace(unit.identity, unit);

  std::vector<Step> steps;
  for (auto& spec : GenerationSpecs(live, request.target_version)) {
    auto it = existing.find(spec.identity);
    if (it != existing.end() && it->second.version == request.target_version && it->second.running) {
      continue;
    }
    Step step{std::move(spec), std::nullopt};
    if (it != existing.end()) step.previous = it->second;
    steps.push_back(std::move(step));
  }
  std::sort(steps.begin(), steps.end(), [](const Step& a, const Step& b) { return a.spec.identity < b.spec.identity; });
  return steps;
}

std::vector<std::string> SequentialReplaceDriver::Plan(const DeployRequest& request) {
  std::vector<std::string> plan;
  for (const auto& step : Steps(request, nullptr)) {
    if (step.previous) {
      plan.push_back("replace unit " + step.spec.identity + " " + step.previous->version + " -> " + step.spec.version);
    } else {
      plan.push_back("start unit " + step.spec.identity + " from " + step.spec.image_ref);
    }
  }
  return plan;
}

std::vector<std::string> SequentialReplaceDriver::Restore(const std::vector<Step>& replaced) {
  std::map<std::string, std::string> images;
  for (const auto& service : options_.services) images[service.name()] = service.image();

  std::vector<std::string> failures;
  for (auto it = replaced.rbegin(); it != replaced.rend(); ++it) {
    try {
      runtime_->Remove(it->spec.identity);
      if (it->previous) {
        StartUnit(SpecFrom(it->spec, *it->previous, images[it->spec.service]));
      }
      observability::LogInfo("unit restored", {observability::StringField("unit", it->spec.identity),
                                               observability::StringField(
                                                   "version", it->previous ? it->previous->version : std::string("(removed)"))});
    } catch (const util::DeploymentError& e) {
      failures.push_back(e.what());
      observability::LogError("unit restore failed", {observability::StringField("unit", it->spec.identity),
                                                      observability::StringField("error", e.what())});
    }
  }
  return failures;
}

void SequentialReplaceDriver::Deploy(const DeployRequest& request) {
  std::string generation;
  const auto  steps = Steps(request, &generation);

  std::vector<Step> replaced;
  for (const auto& step : steps) {
    observability::LogInfo("replacing unit", {observability::StringField("session_id", request.session_id),
                                              observability::StringField("unit", step.spec.identity),
                                              observability::StringField("version", step.spec.version)});
    replaced.push_back(step);
    try {
      if (step.previous) runtime_->Remove(step.spec.identity);
      StartUnit(step.spec, request.deadline);
    } catch (const util::DeploymentError& e) {
      const auto failures = Restore(replaced);
      std::string message = step.spec.identity + " failed after " + std::to_string(replaced.size() - 1) + " of " +
                            std::to_string(steps.size()) + " unit(s) were replaced: " + e.what();
      if (!failures.empty()) {
        message += "; restore incomplete: " + failures.front();
      }
      throw util::DeploymentError(message);
    }
  }

  if (router_->Current().empty()) {
    router_->Switch(generation);
  }
}

void SequentialReplaceDriver::Rollback(const DeployRequest& request) {
  const auto units = runtime_->List();
  const auto live  = LiveGeneration(units);

  std::map<std::string, std::string> images;
  for (const auto& service : options_.services) images[service.name()] = service.image();

  // Rebuild the replaced set from the runtime: every live unit still on
  // the target version, restored in reverse identity order.
  std::vector<Step> replaced;
  for (const auto& unit : UnitsOf(units, live)) {
    if (unit.version != request.target_version) continue;

    Step step;
    step.spec.identity   = unit.identity;
    step.spec.service    = unit.service;
    step.spec.generation = unit.generation;
    step.spec.version    = unit.version;
    step.spec.image_ref  = ImageRef(images[unit.service], unit.version);
    for (const auto& service : options_.services) {
      if (service.name() == unit.service) step.spec.run_args.assign(service.run_args().begin(), service.run_args().end());
    }
    if (!request.source_version.empty()) {
      RunningUnit previous = unit;
      previous.version     = request.source_version;
      step.previous        = previous;
    }
    replaced.push_back(std::move(step));
  }

  observability::LogWarn("rolling back replaced units", {observability::StringField("session_id", request.session_id),
                                                         observability::IntField("units", static_cast<std::int64_t>(replaced.size()))});

  const auto failures = Restore(replaced);
  if (!failures.empty()) {
    throw util::DeploymentError(std::to_string(failures.size()) + " unit(s) could not be restored: " + failures.front());
  }
  if (request.source_version.empty() && !live.empty()) {
    router_->Clear();
  }
}

void SequentialReplaceDriver::Finalize(const DeployRequest& request) {
  observability::LogInfo("sequential replace finalized", {observability::StringField("session_id", request.session_id)});
}

} // namespace rollout::deploy
