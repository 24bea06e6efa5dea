#include "health_evaluator.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "internal/backup/store_adapter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/util/time.hpp"

namespace rollout::health {

using rollout::manager::v1::HealthStatus;

std::string_view VerdictName(Verdict verdict) {
  switch (verdict) {
    case Verdict::Healthy:
      return "healthy";
    case Verdict::Degraded:
      return "degraded";
    case Verdict::Unhealthy:
      return "unhealthy";
  }
  return "unknown";
}

HealthEvaluator::HealthEvaluator(std::shared_ptr<UnitProbe> probe, std::vector<std::shared_ptr<backup::StoreAdapter>> stores,
                                 HealthPolicy policy, util::SleepFn sleep)
    : probe_(std::move(probe)), stores_(std::move(stores)), policy_(policy), sleep_(std::move(sleep)) {
  if (!probe_) {
    throw std::invalid_argument("HealthEvaluator requires a unit probe");
  }
  if (policy_.attempts == 0) policy_.attempts = 1;
}

util::RetryPolicy HealthEvaluator::RetryPolicyFor(util::TimePoint deadline) const {
  util::RetryPolicy retry;
  retry.attempts = policy_.attempts;
  retry.backoff  = policy_.interval;
  retry.deadline = util::CapToDeadline(policy_.deadline, deadline);
  return retry;
}

void HealthEvaluator::ProbeRound(std::vector<DeploymentUnit>& units, std::map<std::string, bool>& stores,
                                 bool include_stores, std::chrono::milliseconds probe_timeout) const {
  std::vector<runtime::Task> tasks;

  for (auto& unit : units) {
    tasks.emplace_back([this, &unit, probe_timeout] {
      bool healthy = false;
      try {
        healthy = probe_->Probe(unit, probe_timeout);
      } catch (const std::exception& e) {
        observability::LogWarn("unit probe error", {observability::StringField("unit", unit.identity()),
                                                    observability::StringField("error", e.what())});
      }
      unit.set_health_status(healthy ? HealthStatus::HEALTH_HEALTHY : HealthStatus::HEALTH_UNHEALTHY);
      *unit.mutable_last_checked_at() = util::ToProto(util::Now());
    });
  }

  // Slots are created up front so the workers only write existing entries.
  std::vector<std::pair<std::shared_ptr<backup::StoreAdapter>, bool*>> store_slots;
  if (include_stores) {
    for (const auto& store : stores_) {
      store_slots.emplace_back(store, &stores[store->Id()]);
    }
  }
  for (auto& [store, slot] : store_slots) {
    tasks.emplace_back([store = store, slot = slot, probe_timeout] {
      bool healthy = false;
      try {
        healthy = store->Probe(probe_timeout);
      } catch (const std::exception& e) {
        observability::LogWarn("store probe error", {observability::StringField("store", store->Id()),
                                                     observability::StringField("error", e.what())});
      }
      *slot = healthy;
    });
  }

  runtime::RunBounded(std::move(tasks), units.size() + store_slots.size(), "health-evaluator");
}

HealthReport HealthEvaluator::Evaluate(const std::vector<DeploymentUnit>& units, bool include_stores,
                                       util::TimePoint deadline) const {
  HealthReport report;
  report.units = units;

  const auto rounds = util::RetryUntil(
      RetryPolicyFor(deadline),
      [&](unsigned attempt) {
        report.attempts = attempt;
        ProbeRound(report.units, report.stores, include_stores, util::CapToDeadline(policy_.probe_timeout, deadline));

        const bool units_ok = std::all_of(report.units.begin(), report.units.end(), [](const DeploymentUnit& u) {
          return u.health_status() == HealthStatus::HEALTH_HEALTHY;
        });
        const bool stores_ok =
            std::all_of(report.stores.begin(), report.stores.end(), [](const auto& entry) { return entry.second; });
        return units_ok && stores_ok;
      },
      sleep_);

  if (rounds > 0) {
    report.verdict = Verdict::Healthy;
    report.detail  = "all " + std::to_string(report.units.size()) + " unit(s) and " +
                    std::to_string(report.stores.size()) + " store(s) healthy after " + std::to_string(rounds) +
                    " attempt(s)";
    return report;
  }

  std::vector<std::string> failing;
  std::size_t              failing_units = 0;
  for (const auto& unit : report.units) {
    if (unit.health_status() != HealthStatus::HEALTH_HEALTHY) {
      failing.push_back(unit.identity());
      ++failing_units;
    }
  }
  bool store_down = false;
  for (const auto& [id, healthy] : report.stores) {
    if (!healthy) {
      failing.push_back("store:" + id);
      store_down = true;
    }
  }

  const bool all_units_down = !report.units.empty() && failing_units == report.units.size();
  report.verdict            = (store_down || all_units_down) ? Verdict::Unhealthy : Verdict::Degraded;

  report.detail = std::string(VerdictName(report.verdict)) + " after " + std::to_string(report.attempts) +
                  " attempt(s), failing:";
  for (const auto& name : failing) report.detail += " " + name;

  observability::LogWarn("health check did not pass", {observability::StringField("verdict", VerdictName(report.verdict)),
                                                        observability::StringField("detail", report.detail)});
  return report;
}

bool HealthEvaluator::WaitHealthy(const DeploymentUnit& unit, util::TimePoint deadline) const {
  const auto report = Evaluate({unit}, false, deadline);
  return report.verdict == Verdict::Healthy;
}

} // namespace rollout::health
