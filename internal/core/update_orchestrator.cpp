#include "update_orchestrator.hpp"

#include <unistd.h>

#include <optional>
#include <stdexcept>

#include "internal/backup/database_migrator.hpp"
#include "internal/deploy/driver_factory.hpp"
#include "internal/health/health_evaluator.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/session_id.hpp"
#include "internal/verify/signature_verifier.hpp"

namespace rollout::core {

using observability::IntField;
using observability::StringField;
using rollout::manager::v1::BackupRecord;
using rollout::manager::v1::VerificationResult;

namespace {

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += separator;
    out += item;
  }
  return out;
}

bool LastRecordIs(const UpdateSession& session, Phase phase) {
  return session.phase_history_size() > 0 && session.phase_history(session.phase_history_size() - 1).phase() == phase;
}

bool HasTerminalRecord(const UpdateSession& session) {
  return model::IsTerminal(session.phase()) && LastRecordIs(session, session.phase());
}

std::string PhaseLabel(Phase phase) {
  return std::string(model::PhaseName(phase));
}

} // namespace

TerminalOutcome OutcomeOf(const UpdateSession& session) {
  switch (session.phase()) {
    case Phase::PHASE_COMPLETED:
      return TerminalOutcome::TERMINAL_OUTCOME_COMPLETED;
    case Phase::PHASE_ROLLED_BACK:
      return TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK;
    case Phase::PHASE_FAILED:
      return TerminalOutcome::TERMINAL_OUTCOME_FAILED;
    default:
      return TerminalOutcome::TERMINAL_OUTCOME_UNSPECIFIED;
  }
}

UpdateOrchestrator::UpdateOrchestrator(std::shared_ptr<state::StateManager> state, std::shared_ptr<backup::DatabaseMigrator> migrator,
                                       std::shared_ptr<verify::SignatureVerifier> verifier,
                                       std::shared_ptr<health::HealthEvaluator> health, std::shared_ptr<deploy::DriverFactory> drivers,
                                       OrchestratorOptions options)
    : state_(std::move(state)),
      migrator_(std::move(migrator)),
      verifier_(std::move(verifier)),
      health_(std::move(health)),
      drivers_(std::move(drivers)),
      options_(std::move(options)) {
  if (!state_ || !migrator_ || !verifier_ || !health_ || !drivers_) {
    throw std::invalid_argument("UpdateOrchestrator requires all collaborators");
  }
}

// ------------------------------------------------------------------
// In-flight bookkeeping
// ------------------------------------------------------------------

void UpdateOrchestrator::Track(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  in_flight_.insert(session_id);
}

void UpdateOrchestrator::Untrack(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  in_flight_.erase(session_id);
  cancel_requested_.erase(session_id);
}

bool UpdateOrchestrator::InFlight(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return in_flight_.contains(session_id);
}

void UpdateOrchestrator::CheckCancel(const Context& ctx) {
  std::lock_guard lock(mutex_);
  if (cancel_requested_.contains(ctx.session.session_id())) {
    throw util::Cancelled("cancelled by operator");
  }
}

bool UpdateOrchestrator::Abort(const std::string& session_id) {
  if (!InFlight(session_id)) {
    return false;
  }
  {
    std::lock_guard lock(mutex_);
    cancel_requested_.insert(session_id);
  }
  try {
    state_->MarkCancelRequested(session_id);
  } catch (const util::InvalidState&) {
    // Reached a terminal phase in the meantime.
    std::lock_guard lock(mutex_);
    cancel_requested_.erase(session_id);
    return false;
  }
  observability::LogWarn("abort requested", {StringField("session_id", session_id)});
  return true;
}

UpdateOrchestrator::Context UpdateOrchestrator::ContextFor(const UpdateSession& session) {
  Context ctx;
  ctx.session = session;
  ctx.request = {session.session_id(), session.source_version(), session.target_version()};
  ctx.driver  = drivers_->Create(session.strategy() == Strategy::STRATEGY_UNSPECIFIED ? options_.default_strategy
                                                                                      : session.strategy());
  ctx.phase_timeout = session.options().timeout_seconds() > 0 ? std::chrono::seconds(session.options().timeout_seconds())
                                                              : options_.phase_timeout;
  return ctx;
}

// ------------------------------------------------------------------
// Entry points
// ------------------------------------------------------------------

UpgradeOutcome UpdateOrchestrator::Upgrade(const UpgradeRequest& request) {
  if (request.target_version.empty()) {
    throw util::ValidationError("target_version is required");
  }
  const auto strategy = request.strategy == Strategy::STRATEGY_UNSPECIFIED ? options_.default_strategy : request.strategy;
  auto       driver   = drivers_->Create(strategy);

  std::string source_version;
  std::string source_error;
  try {
    source_version = driver->CurrentVersion();
  } catch (const util::ValidationError& e) {
    source_error = e.what();
  } catch (const util::DeploymentError& e) {
    source_error = std::string("cannot read the current deployment: ") + e.what();
  }

  UpdateSession session;
  session.set_session_id(util::NewSessionId());
  session.set_deployment_target(options_.deployment_target);
  session.set_strategy(strategy);
  session.set_source_version(source_version);
  session.set_target_version(request.target_version);
  session.set_dry_run(request.dry_run);

  auto* options = session.mutable_options();
  options->set_dry_run(request.dry_run);
  options->set_skip_backup(request.skip_backup);
  options->set_verify_signatures(request.verify_signatures);
  options->set_timeout_seconds(request.timeout_seconds);

  for (const auto& image : driver->ImagesFor(request.target_version)) {
    session.add_images(image);
  }

  session = state_->Create(std::move(session));

  Context ctx      = ContextFor(session);
  ctx.source_error = source_error;

  const auto session_id = session.session_id();
  Track(session_id);
  try {
    auto outcome = Drive(ctx);
    Untrack(session_id);
    return outcome;
  } catch (const std::exception&) {
    Untrack(session_id);
    throw;
  }
}

UpgradeOutcome UpdateOrchestrator::Rollback(const std::string& session_id) {
  std::optional<UpdateSession> found;

  if (session_id.empty()) {
    auto all = state_->ListAll();
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
      if (it->phase() != Phase::PHASE_COMPLETED) {
        found = *it;
        break;
      }
    }
    if (!found) {
      throw util::NotFound("no session that can be rolled back");
    }
  } else {
    found = state_->Get(session_id);
    if (!found) {
      throw util::NotFound("session not found: " + session_id);
    }
    if (found->phase() == Phase::PHASE_COMPLETED && HasTerminalRecord(*found)) {
      throw util::InvalidState("session " + session_id +
                               " completed and was finalized; start a new upgrade to " + found->source_version() +
                               " instead");
    }
  }

  const auto id = found->session_id();

  if (HasTerminalRecord(*found)) {
    auto ctx = ContextFor(*found);
    auto out = Finish(ctx);
    out.message = "session already " + PhaseLabel(found->phase()) + "; " + out.message;
    return out;
  }

  if (InFlight(id)) {
    Abort(id);
    auto ctx    = ContextFor(state_->Get(id).value_or(*found));
    auto out    = Finish(ctx);
    out.message = "cancellation requested; session " + id + " rolls back at its next phase boundary";
    return out;
  }

  if (!model::IsTerminal(found->phase())) {
    state_->Adopt(id);
  }

  Track(id);
  try {
    auto ctx     = ContextFor(*found);
    auto outcome = Recover(ctx);
    Untrack(id);
    return outcome;
  } catch (const std::exception&) {
    Untrack(id);
    throw;
  }
}

StatusView UpdateOrchestrator::Status(const std::string& session_id) {
  StatusView view;
  if (!session_id.empty()) {
    auto session = state_->Get(session_id);
    if (!session) {
      throw util::NotFound("session not found: " + session_id);
    }
    view.session = std::move(*session);
  } else {
    auto all = state_->ListAll();
    if (!all.empty()) view.session = all.back();
  }

  const auto strategy =
      view.session.strategy() == Strategy::STRATEGY_UNSPECIFIED ? options_.default_strategy : view.session.strategy();
  view.units = drivers_->Create(strategy)->Status();
  return view;
}

std::vector<UpgradeOutcome> UpdateOrchestrator::RecoverInterruptedSessions() {
  std::vector<UpgradeOutcome> outcomes;

  for (const auto& session : state_->ListAll()) {
    const auto& id = session.session_id();
    if (HasTerminalRecord(session) || InFlight(id)) continue;

    if (!model::IsTerminal(session.phase())) {
      try {
        state_->Adopt(id);
      } catch (const util::SessionConflict&) {
        observability::LogInfo("session owned by a live process, not recovering", {StringField("session_id", id)});
        continue;
      }
    }

    observability::LogWarn("recovering interrupted session",
                           {StringField("session_id", id), StringField("phase", model::PhaseName(session.phase())),
                            IntField("owner_pid", session.owner_pid())});

    Track(id);
    try {
      auto ctx = ContextFor(session);
      outcomes.push_back(Recover(ctx));
    } catch (const std::exception& e) {
      observability::LogCritical("session recovery failed",
                                 {StringField("session_id", id), StringField("error", e.what())});
    }
    Untrack(id);
  }
  return outcomes;
}

// ------------------------------------------------------------------
// Phase sequencing
// ------------------------------------------------------------------

void UpdateOrchestrator::RunPhase(Context& ctx, Phase phase, const std::function<PhaseStep()>& body) {
  const auto id   = ctx.session.session_id();
  const auto name = PhaseLabel(phase);

  ctx.session = state_->EnterPhase(id, phase);

  observability::LogContext phase_scope({StringField("phase", name)});
  observability::SpanScope  span("rollout.phase." + name);
  span.SetAttribute("session_id", id);
  observability::LogInfo("phase started");

  const auto started    = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  };

  // Finalizing is not time-boxed.
  const bool bounded   = phase != Phase::PHASE_FINALIZING;
  ctx.request.deadline = bounded ? util::Now() + ctx.phase_timeout : util::TimePoint{};

  PhaseStep step;
  try {
    step                 = body();
    ctx.request.deadline = {};
    if (bounded && elapsed_ms() > ctx.phase_timeout) {
      throw util::PhaseTimeout(name + " took " + std::to_string(elapsed_ms().count()) + "ms, limit is " +
                               std::to_string(ctx.phase_timeout.count()) + "ms");
    }
  } catch (const std::exception& e) {
    ctx.request.deadline = {};
    const auto outcome = dynamic_cast<const util::Cancelled*>(&e) ? PhaseOutcome::OUTCOME_CANCELLED : PhaseOutcome::OUTCOME_FAILURE;
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordPhase(name, model::OutcomeName(outcome));
    observability::Metrics::Instance().ObservePhaseDurationMs(name, static_cast<double>(elapsed_ms().count()));
    observability::LogError("phase failed",
                            {StringField("error", e.what()), observability::DurationField("elapsed", elapsed_ms())});

    ctx.session = state_->AppendPhase(id, phase, outcome, e.what());
    throw;
  }

  observability::Metrics::Instance().RecordPhase(name, model::OutcomeName(step.outcome));
  observability::Metrics::Instance().ObservePhaseDurationMs(name, static_cast<double>(elapsed_ms().count()));
  ctx.session = state_->AppendPhase(id, phase, step.outcome, step.detail);
}

UpgradeOutcome UpdateOrchestrator::Drive(Context& ctx) {
  const auto                id = ctx.session.session_id();
  observability::LogContext session_scope({StringField("session_id", id)});

  try {
    CheckCancel(ctx);
    RunPhase(ctx, Phase::PHASE_VALIDATING, [&] { return Validate(ctx); });
    if (ctx.session.dry_run()) {
      state_->ReleaseLock(id);
    }
    CheckCancel(ctx);
    RunPhase(ctx, Phase::PHASE_BACKING_UP, [&] { return BackUp(ctx); });
    CheckCancel(ctx);
    RunPhase(ctx, Phase::PHASE_VERIFYING_SIGNATURES, [&] { return VerifySignatures(ctx); });
    CheckCancel(ctx);
  } catch (const util::Cancelled& e) {
    return Fail(ctx, e.what(), true);
  } catch (const std::exception& e) {
    return Fail(ctx, e.what(), false);
  }

  try {
    RunPhase(ctx, Phase::PHASE_DEPLOYING, [&] { return Deploy(ctx); });
    CheckCancel(ctx);
    RunPhase(ctx, Phase::PHASE_HEALTH_CHECKING, [&] { return CheckHealth(ctx); });
    CheckCancel(ctx);
  } catch (const std::exception& e) {
    return RollBack(ctx, e.what());
  }

  // The target version stays live from here on, whatever finalizing reports.
  try {
    RunPhase(ctx, Phase::PHASE_FINALIZING, [&] { return Finalize(ctx); });
  } catch (const std::exception& e) {
    observability::LogError("finalize not recorded cleanly, completing", {StringField("error", e.what())});
    if (ctx.session.phase() != Phase::PHASE_FINALIZING) {
      throw;
    }
  }
  return Complete(ctx);
}

// ------------------------------------------------------------------
// Phases
// ------------------------------------------------------------------

UpdateOrchestrator::PhaseStep UpdateOrchestrator::Validate(Context& ctx) {
  const auto& request = ctx.request;

  if (!ctx.source_error.empty()) {
    throw util::ValidationError(ctx.source_error);
  }
  if (request.target_version == request.source_version) {
    throw util::ValidationError("deployment already runs " + request.target_version);
  }

  ctx.driver->CheckAvailable(request);

  const auto migrations = migrator_->PendingMigrations(request.target_version);
  if (!migrations.empty() && ctx.session.options().skip_backup()) {
    throw util::ValidationError("store(s) " + Join(migrations, ", ") + " migrate their schema for " +
                                request.target_version + "; skip_backup is not allowed");
  }

  const auto live   = ctx.driver->LiveUnits();
  const auto report = health_->Evaluate(live, true, request.deadline);
  if (report.verdict != health::Verdict::Healthy) {
    throw util::ValidationError("current deployment is " + std::string(health::VerdictName(report.verdict)) + ": " +
                                report.detail);
  }

  if (!ctx.session.dry_run()) {
    ctx.driver->CheckHeadroom(request);

    if (!ctx.session.options().skip_backup() && options_.min_free_bytes > 0 && !migrator_->StoreIds().empty()) {
      const auto free = migrator_->FreeBytes();
      if (free < options_.min_free_bytes) {
        throw util::ValidationError("backup directory has " + std::to_string(free) + " bytes free, " +
                                    std::to_string(options_.min_free_bytes) + " required");
      }
    }
  }

  return {PhaseOutcome::OUTCOME_SUCCESS, (request.source_version.empty() ? std::string("(none)") : request.source_version) +
                                             " -> " + request.target_version + ", " + std::to_string(live.size()) +
                                             " live unit(s) healthy"};
}

UpdateOrchestrator::PhaseStep UpdateOrchestrator::BackUp(Context& ctx) {
  const auto id     = ctx.session.session_id();
  const auto stores = migrator_->StoreIds();

  if (ctx.session.dry_run()) {
    for (const auto& store : stores) ctx.plan.push_back("back up store " + store);
    ctx.session = state_->SealRollbackPoint(id);
    return {PhaseOutcome::OUTCOME_SKIPPED, "dry run: " + std::to_string(stores.size()) + " store(s) would be backed up"};
  }

  if (ctx.session.options().skip_backup()) {
    observability::LogWarn("backup skipped by request; rollback cannot restore data", {StringField("session_id", id)});
    ctx.session = state_->SealRollbackPoint(id);
    return {PhaseOutcome::OUTCOME_SKIPPED, "skipped by request"};
  }

  // Nothing is linked to the session until every store is backed up.
  std::vector<BackupRecord> created;
  for (const auto& store : stores) {
    created.push_back(migrator_->Backup(store, "pre-update " + id, ctx.request.deadline));
  }
  std::vector<std::string> ids;
  for (const auto& record : created) {
    ctx.session = state_->RecordBackup(id, record);
    ids.push_back(record.backup_id());
  }
  ctx.session = state_->SealRollbackPoint(id);

  std::set<std::string> referenced;
  for (const auto& active : state_->ListActive()) {
    for (const auto& backup : active.backup_refs()) referenced.insert(backup.backup_id());
  }
  for (const auto& store : stores) {
    try {
      migrator_->PruneBackups(store, referenced);
    } catch (const std::exception& e) {
      observability::LogWarn("backup retention failed", {StringField("store", store), StringField("error", e.what())});
    }
  }

  return {PhaseOutcome::OUTCOME_SUCCESS,
          ids.empty() ? std::string("no stores configured") : std::to_string(ids.size()) + " backup(s): " + Join(ids, ", ")};
}

UpdateOrchestrator::PhaseStep UpdateOrchestrator::VerifySignatures(Context& ctx) {
  const auto id = ctx.session.session_id();

  if (!ctx.session.options().verify_signatures()) {
    observability::LogWarn("signature verification disabled by request", {StringField("session_id", id)});
    return {PhaseOutcome::OUTCOME_SKIPPED, "disabled by request"};
  }

  // Each ref is checked once per session. Results never carry over from
  // another session.
  std::vector<VerificationResult> results;
  std::vector<std::string>        pending;
  std::set<std::string>           seen;
  for (const auto& image : ctx.session.images()) {
    if (!seen.insert(image).second) continue;
    auto recorded = ctx.session.verification_results().find(image);
    if (recorded != ctx.session.verification_results().end()) {
      results.push_back(recorded->second);
    } else {
      pending.push_back(image);
    }
  }

  for (auto& result : verifier_->VerifyAll(pending, ctx.request.deadline)) {
    ctx.session = state_->RecordVerification(id, result);
    results.push_back(std::move(result));
  }

  const auto verdict = verify::SignatureVerifier::Aggregate(results);
  if (!verdict.passed) {
    throw util::VerificationError(verdict.message);
  }
  return {PhaseOutcome::OUTCOME_SUCCESS, verdict.message};
}

UpdateOrchestrator::PhaseStep UpdateOrchestrator::Deploy(Context& ctx) {
  const auto id         = ctx.session.session_id();
  const auto migrations = migrator_->PendingMigrations(ctx.request.target_version);

  if (ctx.session.dry_run()) {
    std::vector<std::string> steps;
    for (const auto& store : migrations) {
      steps.push_back("migrate store " + store + " schema to " + ctx.request.target_version);
    }
    auto deploy_steps = ctx.driver->Plan(ctx.request);
    steps.insert(steps.end(), deploy_steps.begin(), deploy_steps.end());
    ctx.plan.insert(ctx.plan.end(), steps.begin(), steps.end());
    return {PhaseOutcome::OUTCOME_SKIPPED, "dry run: " + std::to_string(steps.size()) + " deployment step(s) planned"};
  }

  // Recorded before it runs, so a rollback after a crash mid-migration
  // still restores the store.
  for (const auto& store : migrations) {
    ctx.session = state_->RecordMigration(id, store);
    migrator_->MigrateSchema(store, ctx.request.target_version, ctx.request.deadline);
  }

  ctx.driver->Deploy(ctx.request);

  std::string detail = std::string(model::StrategyName(ctx.driver->Kind())) + " deployed " + ctx.request.target_version;
  if (!migrations.empty()) {
    detail += " after migrating " + Join(migrations, ", ");
  }
  return {PhaseOutcome::OUTCOME_SUCCESS, detail};
}

UpdateOrchestrator::PhaseStep UpdateOrchestrator::CheckHealth(Context& ctx) {
  if (ctx.session.dry_run()) {
    return {PhaseOutcome::OUTCOME_SKIPPED, "dry run: nothing deployed"};
  }

  const auto units = ctx.driver->LiveUnits();
  if (units.empty() && ctx.session.images_size() > 0) {
    throw util::HealthCheckError("no live units after deploy");
  }
  for (const auto& unit : units) {
    if (unit.current_version() != ctx.request.target_version) {
      throw util::HealthCheckError("live unit " + unit.identity() + " runs " + unit.current_version() + ", expected " +
                                   ctx.request.target_version);
    }
  }

  const auto report = health_->Evaluate(units, true, ctx.request.deadline);
  if (report.verdict != health::Verdict::Healthy) {
    throw util::HealthCheckError(report.detail);
  }
  return {PhaseOutcome::OUTCOME_SUCCESS, report.detail};
}

UpdateOrchestrator::PhaseStep UpdateOrchestrator::Finalize(Context& ctx) {
  if (ctx.session.dry_run()) {
    ctx.plan.push_back("finalize " + std::string(model::StrategyName(ctx.driver->Kind())) + " deployment");
    return {PhaseOutcome::OUTCOME_SKIPPED, "dry run"};
  }

  // Nothing here can undo the deploy; a failed cleanup is reported.
  try {
    ctx.driver->Finalize(ctx.request);
  } catch (const std::exception& e) {
    observability::LogError("finalize cleanup incomplete",
                            {StringField("session_id", ctx.session.session_id()), StringField("error", e.what())});
    return {PhaseOutcome::OUTCOME_SUCCESS, std::string("finalized; cleanup incomplete: ") + e.what()};
  }
  return {PhaseOutcome::OUTCOME_SUCCESS, "finalized"};
}

// ------------------------------------------------------------------
// Terminal branches
// ------------------------------------------------------------------

UpgradeOutcome UpdateOrchestrator::Complete(Context& ctx) {
  const auto id  = ctx.session.session_id();
  const bool dry = ctx.session.dry_run();

  ctx.session = state_->EnterPhase(id, Phase::PHASE_COMPLETED);
  ctx.session = state_->AppendPhase(id, Phase::PHASE_COMPLETED, dry ? PhaseOutcome::OUTCOME_SKIPPED : PhaseOutcome::OUTCOME_SUCCESS,
                                    dry ? "dry run" : ctx.request.target_version + " is live");
  return Finish(ctx);
}

UpgradeOutcome UpdateOrchestrator::Fail(Context& ctx, const std::string& reason, bool cancelled) {
  const auto id = ctx.session.session_id();

  ctx.session = state_->RecordFailure(id, reason, false);
  ctx.session = state_->EnterPhase(id, Phase::PHASE_FAILED);
  ctx.session = state_->AppendPhase(id, Phase::PHASE_FAILED,
                                    cancelled ? PhaseOutcome::OUTCOME_CANCELLED : PhaseOutcome::OUTCOME_FAILURE, reason);
  return Finish(ctx);
}

std::vector<std::string> UpdateOrchestrator::RestoreStores(Context& ctx, bool migrated_only) {
  const auto& session = ctx.session;

  std::set<std::string> migrated(session.migrated_stores().begin(), session.migrated_stores().end());
  std::set<std::string> covered;

  std::vector<const BackupRecord*> records;
  for (const auto& backup_id : session.rollback_point().backup_refs()) {
    const BackupRecord* record = nullptr;
    for (const auto& candidate : session.backup_refs()) {
      if (candidate.backup_id() == backup_id) record = &candidate;
    }
    if (!record) {
      throw util::RollbackError("backup " + backup_id + " in the rollback point is not recorded in the session");
    }
    covered.insert(record->store_id());
    if (!migrated_only || migrated.contains(record->store_id())) records.push_back(record);
  }
  for (const auto& store : migrated) {
    if (!covered.contains(store)) {
      throw util::RollbackError("store " + store + " was migrated but the rollback point holds no backup of it");
    }
  }

  std::vector<std::string> restored;
  for (const auto* record : records) {
    migrator_->Restore(record->store_id(), *record);
    restored.push_back(record->store_id());
  }
  return restored;
}

std::string UpdateOrchestrator::RestoreAndRedeploy(Context& ctx) {
  const auto restored = RestoreStores(ctx, false);

  if (ctx.request.source_version.empty()) {
    throw util::RollbackError("no previous version to redeploy");
  }

  const deploy::DeployRequest redeploy{ctx.session.session_id(), ctx.request.target_version, ctx.request.source_version};
  ctx.driver->Deploy(redeploy);

  const auto report = health_->Evaluate(ctx.driver->LiveUnits(), true);
  if (report.verdict != health::Verdict::Healthy) {
    throw util::RollbackError(ctx.request.source_version + " is not healthy after redeploy: " + report.detail);
  }

  std::string detail = std::to_string(restored.size()) + " store(s) restored and " + ctx.request.source_version + " redeployed";
  try {
    ctx.driver->RemoveStandby(redeploy);
  } catch (const util::DeploymentError& e) {
    observability::LogError("units of " + ctx.request.target_version + " left behind after redeploy",
                            {StringField("session_id", ctx.session.session_id()), StringField("error", e.what())});
    detail += "; cleanup incomplete: " + std::string(e.what());
  }
  return detail;
}

UpgradeOutcome UpdateOrchestrator::RequireOperator(Context& ctx, const std::string& message) {
  const auto id = ctx.session.session_id();
  observability::LogCritical("manual intervention required", {StringField("session_id", id), StringField("error", message)});

  ctx.session = state_->RecordFailure(id, message, true);
  ctx.session = state_->AppendPhase(id, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_FAILURE, message);
  ctx.session = state_->EnterPhase(id, Phase::PHASE_FAILED);
  ctx.session = state_->AppendPhase(id, Phase::PHASE_FAILED, PhaseOutcome::OUTCOME_FAILURE, message);
  return Finish(ctx);
}

UpgradeOutcome UpdateOrchestrator::RollBack(Context& ctx, const std::string& reason) {
  const auto                id = ctx.session.session_id();
  observability::LogContext session_scope({StringField("session_id", id)});

  observability::LogWarn("rolling back", {StringField("phase", model::PhaseName(ctx.session.phase())), StringField("reason", reason)});
  observability::SpanScope span("rollout.rollback");
  span.SetAttribute("session_id", id);

  ctx.request.deadline = {};
  if (ctx.session.failure_reason().empty()) {
    ctx.session = state_->RecordFailure(id, reason, false);
  }
  if (ctx.session.phase() != Phase::PHASE_ROLLING_BACK) {
    ctx.session = state_->EnterPhase(id, Phase::PHASE_ROLLING_BACK);
  }

  if (ctx.session.dry_run()) {
    ctx.session = state_->AppendPhase(id, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_SKIPPED, "dry run: nothing to undo");
  } else {
    std::string detail;
    bool        stores_restored = false;
    try {
      ctx.driver->Rollback(ctx.request);
      observability::Metrics::Instance().RecordRollback("deployment", true);
      detail = "deployment rolled back to " + ctx.request.source_version;
    } catch (const std::exception& driver_error) {
      observability::Metrics::Instance().RecordRollback("deployment", false);
      observability::LogError("deployment rollback failed, restoring stores",
                              {StringField("session_id", id), StringField("error", driver_error.what())});
      try {
        detail          = std::string("deployment rollback failed (") + driver_error.what() + "); " + RestoreAndRedeploy(ctx);
        stores_restored = true;
        observability::Metrics::Instance().RecordRollback("restore", true);
      } catch (const std::exception& restore_error) {
        observability::Metrics::Instance().RecordRollback("restore", false);
        span.RecordException(restore_error.what());
        return RequireOperator(ctx, "rollback after '" + reason + "' failed: " + driver_error.what() +
                                        "; restore: " + restore_error.what());
      }
    }

    // Stores already on the new schema go back to their backup even when
    // the units rolled back cleanly.
    if (!stores_restored && ctx.session.migrated_stores_size() > 0) {
      try {
        const auto restored = RestoreStores(ctx, true);
        observability::Metrics::Instance().RecordRollback("restore", true);
        detail += "; migrated store(s) restored: " + Join(restored, ", ");
      } catch (const std::exception& restore_error) {
        observability::Metrics::Instance().RecordRollback("restore", false);
        span.RecordException(restore_error.what());
        return RequireOperator(ctx, "rollback after '" + reason + "' could not restore migrated stores: " +
                                        restore_error.what());
      }
    }

    ctx.session = state_->AppendPhase(id, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_SUCCESS, detail);
  }

  ctx.session = state_->EnterPhase(id, Phase::PHASE_ROLLED_BACK);
  ctx.session = state_->AppendPhase(id, Phase::PHASE_ROLLED_BACK, PhaseOutcome::OUTCOME_SUCCESS, reason);
  return Finish(ctx);
}

UpgradeOutcome UpdateOrchestrator::Recover(Context& ctx) {
  const auto  id     = ctx.session.session_id();
  const auto  phase  = ctx.session.phase();
  std::string reason = "interrupted in " + PhaseLabel(phase);
  if (ctx.session.owner_pid() > 0 && ctx.session.owner_pid() != static_cast<std::int64_t>(::getpid())) {
    reason += " (owner pid " + std::to_string(ctx.session.owner_pid()) + " exited)";
  }

  // Terminal phase entered but never recorded.
  if (model::IsTerminal(phase)) {
    const auto outcome = phase == Phase::PHASE_FAILED ? PhaseOutcome::OUTCOME_FAILURE : PhaseOutcome::OUTCOME_SUCCESS;
    ctx.session        = state_->AppendPhase(id, phase, outcome, "recorded after restart");
    return Finish(ctx);
  }

  // Health checks passed before the interruption; finish the cleanup.
  if (phase == Phase::PHASE_FINALIZING) {
    if (!LastRecordIs(ctx.session, phase)) {
      const auto step = Finalize(ctx);
      ctx.session     = state_->AppendPhase(id, phase, step.outcome, step.detail + " (" + reason + ")");
    }
    return Complete(ctx);
  }

  if (phase == Phase::PHASE_ROLLING_BACK && LastRecordIs(ctx.session, phase)) {
    const auto& last = ctx.session.phase_history(ctx.session.phase_history_size() - 1);
    const auto  next = model::IsSuccessful(last.outcome()) ? Phase::PHASE_ROLLED_BACK : Phase::PHASE_FAILED;
    ctx.session      = state_->EnterPhase(id, next);
    ctx.session      = state_->AppendPhase(id, next,
                                           next == Phase::PHASE_FAILED ? PhaseOutcome::OUTCOME_FAILURE : PhaseOutcome::OUTCOME_SUCCESS,
                                           ctx.session.failure_reason());
    return Finish(ctx);
  }

  if (phase != Phase::PHASE_ROLLING_BACK && !LastRecordIs(ctx.session, phase)) {
    ctx.session = state_->AppendPhase(id, phase, PhaseOutcome::OUTCOME_FAILURE, reason);
  }

  if (model::IsPreMutation(phase)) {
    return Fail(ctx, reason, false);
  }
  return RollBack(ctx, reason);
}

UpgradeOutcome UpdateOrchestrator::Finish(Context& ctx) {
  UpgradeOutcome out;
  out.session                      = ctx.session;
  out.outcome                      = OutcomeOf(ctx.session);
  out.manual_intervention_required = ctx.session.manual_intervention_required();
  out.plan                         = ctx.plan;

  switch (ctx.session.phase()) {
    case Phase::PHASE_COMPLETED:
      out.message = ctx.session.dry_run() ? "dry run completed: " + std::to_string(ctx.plan.size()) + " planned action(s)"
                                          : "completed: " + ctx.session.target_version() + " is live";
      break;
    case Phase::PHASE_ROLLED_BACK:
      out.message = "rolled back: " + ctx.session.failure_reason();
      break;
    case Phase::PHASE_FAILED:
      out.message = out.manual_intervention_required
                        ? "rollback failed, manual intervention required: " + ctx.session.failure_reason()
                        : "failed: " + ctx.session.failure_reason();
      break;
    default:
      out.message = "in progress: " + PhaseLabel(ctx.session.phase());
      break;
  }

  if (model::IsTerminal(ctx.session.phase())) {
    observability::Metrics::Instance().RecordSessionOutcome(model::StrategyName(ctx.session.strategy()),
                                                            model::PhaseName(ctx.session.phase()));
    const auto level = out.manual_intervention_required ? spdlog::level::critical : spdlog::level::info;
    observability::Log(level, "session finished",
                       {StringField("session_id", ctx.session.session_id()), StringField("phase", model::PhaseName(ctx.session.phase())),
                        StringField("message", out.message)});
  }
  return out;
}

} // namespace rollout::core
