#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "rollout/manager/v1/session.pb.h"

namespace rollout::model {

using rollout::manager::v1::Phase;
using rollout::manager::v1::PhaseOutcome;
using rollout::manager::v1::Strategy;

constexpr bool IsTerminal(Phase phase) {
  return phase == Phase::PHASE_COMPLETED || phase == Phase::PHASE_ROLLED_BACK || phase == Phase::PHASE_FAILED;
}

// Phases in which nothing has been deployed yet; failure ends the session
// without a rollback.
constexpr bool IsPreMutation(Phase phase) {
  return phase == Phase::PHASE_CREATED || phase == Phase::PHASE_VALIDATING || phase == Phase::PHASE_BACKING_UP ||
         phase == Phase::PHASE_VERIFYING_SIGNATURES;
}

// Forward path: created -> validating -> backing_up -> verifying_signatures
// -> deploying -> health_checking -> finalizing -> completed, one step at a
// time. Failure branch: failed from pre-mutation phases, rolling_back from
// deploying onward, then rolled_back or failed.
constexpr bool CanTransition(Phase from, Phase to) {
  if (IsTerminal(from) || to == Phase::PHASE_UNSPECIFIED || to == Phase::PHASE_CREATED) {
    return false;
  }

  switch (to) {
    case Phase::PHASE_FAILED:
      return IsPreMutation(from) || from == Phase::PHASE_ROLLING_BACK;
    case Phase::PHASE_ROLLING_BACK:
      return from == Phase::PHASE_DEPLOYING || from == Phase::PHASE_HEALTH_CHECKING || from == Phase::PHASE_FINALIZING;
    case Phase::PHASE_ROLLED_BACK:
      return from == Phase::PHASE_ROLLING_BACK;
    default:
      break;
  }

  if (from == Phase::PHASE_ROLLING_BACK) {
    return false;
  }
  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

constexpr bool IsSuccessful(PhaseOutcome outcome) {
  return outcome == PhaseOutcome::OUTCOME_SUCCESS || outcome == PhaseOutcome::OUTCOME_SKIPPED;
}

std::string_view PhaseName(Phase phase);
std::string_view OutcomeName(PhaseOutcome outcome);
std::string_view StrategyName(Strategy strategy);

std::optional<Strategy> ParseStrategy(std::string_view name);

} // namespace rollout::model
