#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/deploy/deployment_driver.hpp"
#include "rollout/manager/v1/session.pb.h"
#include "rollout/manager/v1/update_service.pb.h"

namespace rollout::state {
class StateManager;
}
namespace rollout::backup {
class DatabaseMigrator;
}
namespace rollout::verify {
class SignatureVerifier;
}
namespace rollout::health {
class HealthEvaluator;
}
namespace rollout::deploy {
class DriverFactory;
}

namespace rollout::core {

using rollout::manager::v1::DeploymentUnit;
using rollout::manager::v1::Phase;
using rollout::manager::v1::PhaseOutcome;
using rollout::manager::v1::Strategy;
using rollout::manager::v1::TerminalOutcome;
using rollout::manager::v1::UpdateSession;

struct UpgradeRequest {
  std::string   target_version;
  Strategy      strategy          = Strategy::STRATEGY_UNSPECIFIED;
  bool          dry_run           = false;
  bool          skip_backup       = false;
  bool          verify_signatures = true;
  std::uint32_t timeout_seconds   = 0;
};

// Terminal result of a session, returned as data.
struct UpgradeOutcome {
  UpdateSession            session;
  TerminalOutcome          outcome                      = TerminalOutcome::TERMINAL_OUTCOME_UNSPECIFIED;
  bool                     manual_intervention_required = false;
  std::vector<std::string> plan;
  std::string              message;
};

struct StatusView {
  UpdateSession               session;
  std::vector<DeploymentUnit> units;
};

struct OrchestratorOptions {
  std::string               deployment_target = "default";
  Strategy                  default_strategy  = Strategy::STRATEGY_PARALLEL_CUTOVER;
  std::chrono::milliseconds phase_timeout{600000};
  std::uint64_t             min_free_bytes = 0;
};

/*
  Sequences one update session:

    created -> validating -> backing_up -> verifying_signatures
            -> deploying -> health_checking -> finalizing -> completed

  Failures before deploying end the session in failed. Failures from
  deploying on roll back: first through the deployment driver, then by
  restoring the sealed backups and redeploying the source version.
  Stores whose schema was migrated are restored on every rollback. A
  session that cannot be rolled back ends in failed with
  manual_intervention_required set.

  Once health checks pass the session always completes; finalizing
  records a failed cleanup in its detail and is never rolled back.

  Each phase is persisted before it runs and its outcome is appended
  when it ends. Every phase but finalizing runs against a deadline of
  phase_timeout that the components honor. Cancellation is observed
  between phases. Phases never overlap; concurrency lives inside the
  components.
*/
class UpdateOrchestrator {
 public:
  UpdateOrchestrator(std::shared_ptr<state::StateManager> state, std::shared_ptr<backup::DatabaseMigrator> migrator,
                     std::shared_ptr<verify::SignatureVerifier> verifier, std::shared_ptr<health::HealthEvaluator> health,
                     std::shared_ptr<deploy::DriverFactory> drivers, OrchestratorOptions options);

  // Blocks until the session is terminal. Throws util::SessionConflict
  // when the deployment target is busy and util::ValidationError on a
  // malformed request; every other failure is reported in the outcome.
  UpgradeOutcome Upgrade(const UpgradeRequest& request);

  // Rolls back `session_id`, or the most recent session that did not
  // complete when empty.
  UpgradeOutcome Rollback(const std::string& session_id);

  // Current (or most recent) session plus the units as the runtime
  // reports them right now.
  StatusView Status(const std::string& session_id);

  // Requests cancellation of an in-flight session. False when the
  // session is not running in this process.
  bool Abort(const std::string& session_id);

  // Finishes sessions left behind by a process that died.
  std::vector<UpgradeOutcome> RecoverInterruptedSessions();

 private:
  struct Context {
    UpdateSession                             session;
    deploy::DeployRequest                     request;
    std::shared_ptr<deploy::DeploymentDriver> driver;
    std::chrono::milliseconds                 phase_timeout{0};
    std::vector<std::string>                  plan;
    std::string                               source_error;
  };

  struct PhaseStep {
    PhaseOutcome outcome = PhaseOutcome::OUTCOME_SUCCESS;
    std::string  detail;
  };

  UpgradeOutcome Drive(Context& ctx);

  void RunPhase(Context& ctx, Phase phase, const std::function<PhaseStep()>& body);

  PhaseStep Validate(Context& ctx);
  PhaseStep BackUp(Context& ctx);
  PhaseStep VerifySignatures(Context& ctx);
  PhaseStep Deploy(Context& ctx);
  PhaseStep CheckHealth(Context& ctx);
  PhaseStep Finalize(Context& ctx);

  UpgradeOutcome Complete(Context& ctx);
  UpgradeOutcome Fail(Context& ctx, const std::string& reason, bool cancelled);
  UpgradeOutcome RollBack(Context& ctx, const std::string& reason);

  // Re-imports the rollback point's backups, or only those of migrated
  // stores. Returns the stores restored.
  std::vector<std::string> RestoreStores(Context& ctx, bool migrated_only);

  // Deployment-level rollback failed: restore stores, redeploy the source
  // and retire the target's units. Returns the phase detail.
  std::string RestoreAndRedeploy(Context& ctx);

  // Ends a failed rollback in failed with manual_intervention_required.
  UpgradeOutcome RequireOperator(Context& ctx, const std::string& message);

  UpgradeOutcome Recover(Context& ctx);
  UpgradeOutcome Finish(Context& ctx);

  Context ContextFor(const UpdateSession& session);

  void CheckCancel(const Context& ctx);
  void Track(const std::string& session_id);
  void Untrack(const std::string& session_id);
  bool InFlight(const std::string& session_id) const;

  std::shared_ptr<state::StateManager>       state_;
  std::shared_ptr<backup::DatabaseMigrator>  migrator_;
  std::shared_ptr<verify::SignatureVerifier> verifier_;
  std::shared_ptr<health::HealthEvaluator>   health_;
  std::shared_ptr<deploy::DriverFactory>     drivers_;
  OrchestratorOptions                        options_;

  mutable std::mutex    mutex_;
  std::set<std::string> in_flight_;
  std::set<std::string> cancel_requested_;
};

TerminalOutcome OutcomeOf(const UpdateSession& session);

} // namespace rollout::core
