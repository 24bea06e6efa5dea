#include "state_machine.hpp"

namespace rollout::model {

std::string_view PhaseName(Phase phase) {
  switch (phase) {
    case Phase::PHASE_CREATED:
      return "created";
    case Phase::PHASE_VALIDATING:
      return "validating";
    case Phase::PHASE_BACKING_UP:
      return "backing_up";
    case Phase::PHASE_VERIFYING_SIGNATURES:
      return "verifying_signatures";
    case Phase::PHASE_DEPLOYING:
      return "deploying";
    case Phase::PHASE_HEALTH_CHECKING:
      return "health_checking";
    case Phase::PHASE_FINALIZING:
      return "finalizing";
    case Phase::PHASE_COMPLETED:
      return "completed";
    case Phase::PHASE_ROLLING_BACK:
      return "rolling_back";
    case Phase::PHASE_ROLLED_BACK:
      return "rolled_back";
    case Phase::PHASE_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

std::string_view OutcomeName(PhaseOutcome outcome) {
  switch (outcome) {
    case PhaseOutcome::OUTCOME_SUCCESS:
      return "success";
    case PhaseOutcome::OUTCOME_FAILURE:
      return "failure";
    case PhaseOutcome::OUTCOME_SKIPPED:
      return "skipped";
    case PhaseOutcome::OUTCOME_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

std::string_view StrategyName(Strategy strategy) {
  switch (strategy) {
    case Strategy::STRATEGY_PARALLEL_CUTOVER:
      return "parallel-cutover";
    case Strategy::STRATEGY_SEQUENTIAL_REPLACE:
      return "sequential-replace";
    default:
      return "unspecified";
  }
}

std::optional<Strategy> ParseStrategy(std::string_view name) {
  if (name == "parallel-cutover") {
    return Strategy::STRATEGY_PARALLEL_CUTOVER;
  }
  if (name == "sequential-replace") {
    return Strategy::STRATEGY_SEQUENTIAL_REPLACE;
  }
  return std::nullopt;
}

} // namespace rollout::model
