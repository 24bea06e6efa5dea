#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

#include "internal/backup/database_migrator.hpp"
#include "internal/core/update_orchestrator.hpp"
#include "internal/db/file/file_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/deploy/driver_factory.hpp"
#include "internal/health/health_evaluator.hpp"
#include "internal/state/session_lock.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "internal/verify/signature_verifier.hpp"
#include "support/fakes.hpp"

using namespace rollout;
using namespace std::chrono_literals;
using rollout::manager::v1::Phase;
using rollout::manager::v1::PhaseOutcome;
using rollout::manager::v1::Strategy;
using rollout::manager::v1::TerminalOutcome;
using rollout::manager::v1::UpdateSession;

namespace {

// Unit readiness from the runtime, plus versions that fail only while
// they take traffic (live) or only while they sit behind the pointer.
// `on_live_failure` runs once, the first time a live unit fails.
class TrafficAwareProbe final : public health::UnitProbe {
 public:
  TrafficAwareProbe(std::shared_ptr<testing::FakeRuntime> runtime, std::shared_ptr<testing::FakeRouter> router)
      : runtime_(std::move(runtime)), router_(std::move(router)) {
  }

  bool Probe(const health::DeploymentUnit& unit, std::chrono::milliseconds timeout) override {
    if (!runtime_->IsHealthy(unit.identity(), timeout)) return false;
    const bool      live = router_->Current() == unit.generation();
    std::lock_guard lock(mutex);
    if (live && failing_live.contains(unit.current_version())) {
      if (on_live_failure) std::exchange(on_live_failure, nullptr)();
      return false;
    }
    if (!live && failing_standby.contains(unit.current_version())) return false;
    return true;
  }

  std::mutex            mutex;
  std::set<std::string> failing_live;
  std::set<std::string> failing_standby;
  std::function<void()> on_live_failure;

 private:
  std::shared_ptr<testing::FakeRuntime> runtime_;
  std::shared_ptr<testing::FakeRouter>  router_;
};

// Blocks every lookup until released.
class GatedLookup final : public verify::SignatureLookup {
 public:
  verify::LookupResult Lookup(const std::string&, std::chrono::milliseconds) override {
    if (!signalled.exchange(true)) entered.set_value();
    released.wait();
    return {verify::LookupStatus::Verified, "verified by test signer"};
  }

  std::atomic<bool>        signalled{false};
  std::promise<void>       entered;
  std::promise<void>       release;
  std::shared_future<void> released = release.get_future().share();
};

class SlowLookup final : public verify::SignatureLookup {
 public:
  verify::LookupResult Lookup(const std::string&, std::chrono::milliseconds) override {
    std::this_thread::sleep_for(1100ms);
    return {verify::LookupStatus::Verified, "verified by test signer"};
  }
};

// Hangs until its timeout runs out, like a registry that never answers.
class HangingLookup final : public verify::SignatureLookup {
 public:
  verify::LookupResult Lookup(const std::string&, std::chrono::milliseconds timeout) override {
    {
      std::lock_guard lock(mutex);
      longest = std::max(longest, timeout);
    }
    std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(timeout, 10s));
    return {verify::LookupStatus::Unknown, "registry did not answer"};
  }

  std::mutex                mutex;
  std::chrono::milliseconds longest{0};
};

rollout::runtime::config::DeploymentConfig TestDeployment() {
  rollout::runtime::config::DeploymentConfig config;
  auto*                                      api = config.add_services();
  api->set_name("api");
  api->set_image("registry/api");
  api->set_replicas(2);
  auto* worker = config.add_services();
  worker->set_name("worker");
  worker->set_image("registry/worker");
  worker->set_replicas(1);
  return config;
}

struct Harness {
  explicit Harness(const std::string& name, bool file_backed = false) : dir(testing::FreshDir(name)) {
    if (file_backed) {
      repository = std::make_shared<db::file::FileRepository>(dir / "sessions");
    } else {
      repository = std::make_shared<db::memory::MemoryRepository>();
    }

    runtime->Seed("api", "blue", 0, "1.0");
    runtime->Seed("api", "blue", 1, "1.0");
    runtime->Seed("worker", "blue", 0, "1.0");
    router->current = "blue";

    state = std::make_shared<state::StateManager>(repository, dir / "locks");

    backup::MigratorOptions migrator_options;
    migrator_options.dir         = dir / "backups";
    migrator_options.max_backups = 5;
    migrator = std::make_shared<backup::DatabaseMigrator>(std::vector<std::shared_ptr<backup::StoreAdapter>>{store},
                                                          migrator_options);

    UseLookup(lookup);

    health::HealthPolicy policy;
    policy.attempts      = 2;
    policy.interval      = 0ms;
    policy.deadline      = 0ms;
    policy.probe_timeout = 100ms;
    evaluator = std::make_shared<health::HealthEvaluator>(probe, std::vector<std::shared_ptr<backup::StoreAdapter>>{store},
                                                          policy, testing::NoSleep);

    drivers = std::make_shared<deploy::DriverFactory>(runtime, router, evaluator, DriverOptions());

    Build();
  }

  static deploy::DriverOptions DriverOptions() {
    auto options                = deploy::MakeDriverOptions(TestDeployment());
    options.unit_start_attempts = 2;
    options.unit_retry_backoff  = 0ms;
    options.grace_period        = 0ms;
    options.sleep               = testing::NoSleep;
    return options;
  }

  // Holds the previous generation for `grace` of real time at finalize.
  void UseGracePeriod(std::chrono::milliseconds grace) {
    auto options         = DriverOptions();
    options.grace_period = grace;
    options.sleep        = util::RealSleep;
    drivers              = std::make_shared<deploy::DriverFactory>(runtime, router, evaluator, options);
    Build();
  }

  void UseLookup(std::shared_ptr<verify::SignatureLookup> replacement) {
    verifier = std::make_shared<verify::SignatureVerifier>(std::move(replacement), 4, 5000ms);
    if (orchestrator) Build();
  }

  void Build(core::OrchestratorOptions options = {}) {
    orchestrator = std::make_shared<core::UpdateOrchestrator>(state, migrator, verifier, evaluator, drivers, options);
  }

  bool LockHeld() const {
    return state::SessionLock::IsHeld(state->LockPath("default"));
  }

  std::filesystem::path                       dir;
  std::shared_ptr<db::SessionRepository>      repository;
  std::shared_ptr<testing::FakeRuntime>       runtime = std::make_shared<testing::FakeRuntime>();
  std::shared_ptr<testing::FakeRouter>        router  = std::make_shared<testing::FakeRouter>();
  std::shared_ptr<testing::FakeStore>         store   = std::make_shared<testing::FakeStore>("appdb");
  std::shared_ptr<testing::FakeLookup>        lookup  = std::make_shared<testing::FakeLookup>();
  std::shared_ptr<TrafficAwareProbe>          probe   = std::make_shared<TrafficAwareProbe>(runtime, router);
  std::shared_ptr<state::StateManager>        state;
  std::shared_ptr<backup::DatabaseMigrator>   migrator;
  std::shared_ptr<verify::SignatureVerifier>  verifier;
  std::shared_ptr<health::HealthEvaluator>    evaluator;
  std::shared_ptr<deploy::DriverFactory>      drivers;
  std::shared_ptr<core::UpdateOrchestrator>   orchestrator;
};

core::UpgradeRequest Request(const std::string& version) {
  core::UpgradeRequest request;
  request.target_version = version;
  return request;
}

bool HasRecord(const UpdateSession& session, Phase phase, PhaseOutcome outcome) {
  for (const auto& record : session.phase_history()) {
    if (record.phase() == phase && record.outcome() == outcome) return true;
  }
  return false;
}

const rollout::manager::v1::PhaseRecord& LastRecord(const UpdateSession& session) {
  return session.phase_history(session.phase_history_size() - 1);
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestUpgradeCompletesAndFreesTarget() {
  Harness h("orchestrator_complete");

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(!out.manual_intervention_required);
  assert(Contains(out.message, "2.0 is live"));

  const auto& session = out.session;
  assert(session.phase() == Phase::PHASE_COMPLETED);
  assert(session.source_version() == "1.0");
  assert(session.phase_history_size() == 8);
  for (const auto& record : session.phase_history()) {
    assert(record.outcome() == PhaseOutcome::OUTCOME_SUCCESS);
  }
  assert(session.backup_refs_size() == 1);
  assert(session.rollback_point().sealed());
  assert(session.rollback_point().backup_refs_size() == 1);
  assert(session.verification_results_size() == 2);

  assert(h.router->Current() == "green");
  assert(h.runtime->VersionOf("api-green-0") == "2.0");
  assert(h.runtime->VersionOf("worker-green-0") == "2.0");
  assert(h.runtime->VersionOf("api-blue-0").empty());
  assert(h.store->imports == 0);
  assert(!h.LockHeld());

  auto next = h.orchestrator->Upgrade(Request("3.0"));
  assert(next.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(next.session.source_version() == "2.0");
  assert(h.router->Current() == "blue");
  assert(h.runtime->VersionOf("api-blue-1") == "3.0");

  auto view = h.orchestrator->Status("");
  assert(view.session.session_id() == next.session.session_id());
  assert(view.units.size() == 3);
  for (const auto& unit : view.units) {
    assert(unit.live());
    assert(unit.current_version() == "3.0");
  }
}

void TestSequentialUpgradeReplacesInPlace() {
  Harness h("orchestrator_sequential");

  auto request     = Request("2.0");
  request.strategy = Strategy::STRATEGY_SEQUENTIAL_REPLACE;
  auto out         = h.orchestrator->Upgrade(request);

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(out.session.strategy() == Strategy::STRATEGY_SEQUENTIAL_REPLACE);
  assert(h.router->Current() == "blue");
  assert(h.runtime->VersionOf("api-blue-0") == "2.0");
  assert(h.runtime->VersionOf("api-blue-1") == "2.0");
  assert(h.runtime->VersionOf("worker-blue-0") == "2.0");
  assert(h.runtime->VersionOf("api-green-0").empty());
}

void TestUnreachableTargetFailsBeforeAnyMutation() {
  Harness h("orchestrator_unreachable");
  h.runtime->missing_images.insert("registry/api:9.9");

  auto out = h.orchestrator->Upgrade(Request("9.9"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(!out.manual_intervention_required);
  assert(Contains(out.message, "not available"));
  assert(HasRecord(out.session, Phase::PHASE_VALIDATING, PhaseOutcome::OUTCOME_FAILURE));
  assert(LastRecord(out.session).phase() == Phase::PHASE_FAILED);
  assert(out.session.backup_refs_size() == 0);
  assert(h.store->exports == 0);
  assert(h.runtime->CountEvents("start") == 0);
  assert(h.router->Current() == "blue");
  assert(!h.LockHeld());

  // The target is free again.
  auto retry = h.orchestrator->Upgrade(Request("2.0"));
  assert(retry.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
}

void TestSameVersionIsRejected() {
  Harness h("orchestrator_same_version");

  auto out = h.orchestrator->Upgrade(Request("1.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(Contains(out.message, "already runs 1.0"));
  assert(h.store->exports == 0);
}

void TestHealthFailureRollsBackWithoutRestore() {
  Harness h("orchestrator_health_rollback");
  h.probe->failing_live.insert("2.0");

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK);
  assert(!out.manual_intervention_required);
  assert(Contains(out.message, "rolled back"));

  assert(HasRecord(out.session, Phase::PHASE_DEPLOYING, PhaseOutcome::OUTCOME_SUCCESS));
  assert(HasRecord(out.session, Phase::PHASE_HEALTH_CHECKING, PhaseOutcome::OUTCOME_FAILURE));
  assert(HasRecord(out.session, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_SUCCESS));
  assert(LastRecord(out.session).phase() == Phase::PHASE_ROLLED_BACK);
  assert(!HasRecord(out.session, Phase::PHASE_FINALIZING, PhaseOutcome::OUTCOME_SUCCESS));

  assert(h.router->Current() == "blue");
  assert(h.runtime->VersionOf("api-blue-0") == "1.0");
  assert(h.runtime->VersionOf("api-green-0").empty());
  assert(h.store->imports == 0);
  assert(h.store->Contents() == "v1-data");
  assert(!h.LockHeld());
}

void TestFailedRollbackRequiresManualIntervention() {
  Harness h("orchestrator_manual");
  h.probe->failing_live.insert("2.0");
  h.probe->failing_standby.insert("1.0");
  h.store->fail_import = true;

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(out.manual_intervention_required);
  assert(out.session.manual_intervention_required());
  assert(Contains(out.message, "manual intervention"));

  assert(HasRecord(out.session, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_FAILURE));
  assert(LastRecord(out.session).phase() == Phase::PHASE_FAILED);
  assert(LastRecord(out.session).outcome() == PhaseOutcome::OUTCOME_FAILURE);
  // The import and the re-import of the safety backup.
  assert(h.store->imports == 2);
  assert(!h.LockHeld());

  bool threw = false;
  try {
    h.state->AppendPhase(out.session.session_id(), Phase::PHASE_FAILED, PhaseOutcome::OUTCOME_FAILURE);
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestDryRunTouchesNothing() {
  Harness h("orchestrator_dry_run");

  auto request    = Request("2.0");
  request.dry_run = true;
  auto out        = h.orchestrator->Upgrade(request);

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(out.session.dry_run());
  assert(!out.plan.empty());
  bool mentions_switch = false;
  for (const auto& step : out.plan) {
    if (Contains(step, "switch traffic")) mentions_switch = true;
  }
  assert(mentions_switch);
  assert(Contains(out.message, "dry run completed"));

  assert(HasRecord(out.session, Phase::PHASE_BACKING_UP, PhaseOutcome::OUTCOME_SKIPPED));
  assert(HasRecord(out.session, Phase::PHASE_DEPLOYING, PhaseOutcome::OUTCOME_SKIPPED));
  assert(HasRecord(out.session, Phase::PHASE_COMPLETED, PhaseOutcome::OUTCOME_SKIPPED));
  assert(out.session.backup_refs_size() == 0);
  assert(h.store->exports == 0);
  assert(h.runtime->CountEvents("start") == 0);
  assert(h.runtime->CountEvents("remove") == 0);
  assert(h.router->switches == 0);
  assert(!h.LockHeld());
}

void TestBusyTargetConflicts() {
  Harness h("orchestrator_conflict");

  auto other = state::SessionLock::TryAcquire(h.state->LockPath("default"), "another manager");
  assert(other);

  bool threw = false;
  try {
    h.orchestrator->Upgrade(Request("2.0"));
  } catch (const util::SessionConflict&) {
    threw = true;
  }
  assert(threw);
  assert(h.state->ListAll().empty());
  assert(h.runtime->CountEvents("start") == 0);

  other.reset();
  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
}

void TestSignatureFailureStopsBeforeDeploy() {
  Harness h("orchestrator_signature");
  h.lookup->results["registry/worker:2.0"] = {verify::LookupStatus::Unverified, "no matching signatures"};

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(!out.manual_intervention_required);
  assert(Contains(out.message, "registry/worker:2.0"));
  assert(!Contains(out.message, "registry/api:2.0"));
  assert(HasRecord(out.session, Phase::PHASE_VERIFYING_SIGNATURES, PhaseOutcome::OUTCOME_FAILURE));

  const auto& results = out.session.verification_results();
  assert(results.size() == 2);
  assert(results.at("registry/api:2.0").verified());
  assert(!results.at("registry/worker:2.0").verified());

  assert(out.session.backup_refs_size() == 1);
  assert(h.runtime->CountEvents("start") == 0);
  assert(h.router->Current() == "blue");
}

void TestEverySessionVerifiesItsOwnImages() {
  Harness h("orchestrator_verify_each_session");
  h.probe->failing_live.insert("2.0");

  auto first = h.orchestrator->Upgrade(Request("2.0"));
  assert(first.outcome == TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK);
  assert(h.lookup->calls == 2);

  // The signer revoked the worker image after the first session passed.
  h.probe->failing_live.clear();
  h.lookup->results["registry/worker:2.0"] = {verify::LookupStatus::Unverified, "signature revoked"};

  auto second = h.orchestrator->Upgrade(Request("2.0"));
  assert(h.lookup->calls == 4);
  assert(second.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(Contains(second.message, "registry/worker:2.0"));
  assert(HasRecord(second.session, Phase::PHASE_VERIFYING_SIGNATURES, PhaseOutcome::OUTCOME_FAILURE));
  assert(h.runtime->CountEvents("start") == 3);

  h.lookup->results.clear();
  auto third = h.orchestrator->Upgrade(Request("2.0"));
  assert(third.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(h.lookup->calls == 6);
  for (const auto& [ref, result] : third.session.verification_results()) {
    assert(result.verified());
    assert(result.reason() == "verified by test signer");
  }
}

void TestAbortCancelsAtPhaseBoundary() {
  Harness h("orchestrator_abort");
  auto    gated = std::make_shared<GatedLookup>();
  h.UseLookup(gated);

  auto running = std::async(std::launch::async, [&h] { return h.orchestrator->Upgrade(Request("2.0")); });
  gated->entered.get_future().wait();

  auto active = h.state->ListActive();
  assert(active.size() == 1);
  const auto id = active.front().session_id();
  assert(h.orchestrator->Abort(id));
  gated->release.set_value();

  auto out = running.get();
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(out.session.cancel_requested());
  assert(LastRecord(out.session).outcome() == PhaseOutcome::OUTCOME_CANCELLED);
  assert(h.runtime->CountEvents("start") == 0);
  assert(!h.orchestrator->Abort(id));
  assert(!h.LockHeld());
}

void TestPhaseTimeoutIsEnforced() {
  Harness h("orchestrator_phase_timeout");
  h.UseLookup(std::make_shared<SlowLookup>());

  auto request            = Request("2.0");
  request.timeout_seconds = 1;
  auto out                = h.orchestrator->Upgrade(request);

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(HasRecord(out.session, Phase::PHASE_VERIFYING_SIGNATURES, PhaseOutcome::OUTCOME_FAILURE));
  assert(Contains(out.message, "limit is"));
  assert(h.runtime->CountEvents("start") == 0);
}

UpdateSession CrashedSession(const std::string& id) {
  UpdateSession session;
  session.set_session_id(id);
  session.set_deployment_target("default");
  session.set_strategy(Strategy::STRATEGY_PARALLEL_CUTOVER);
  session.set_source_version("1.0");
  session.set_target_version("2.0");
  session.add_images("registry/api:2.0");
  session.add_images("registry/worker:2.0");
  session.mutable_options()->set_verify_signatures(true);
  return session;
}

void TestRecoveryRollsBackInterruptedDeploy() {
  Harness h("orchestrator_recovery", true);

  {
    state::StateManager crashed(h.repository, h.dir / "locks");
    crashed.Create(CrashedSession("crashed-1"));
    for (auto phase : {Phase::PHASE_VALIDATING, Phase::PHASE_BACKING_UP, Phase::PHASE_VERIFYING_SIGNATURES}) {
      crashed.EnterPhase("crashed-1", phase);
      if (phase == Phase::PHASE_BACKING_UP) crashed.SealRollbackPoint("crashed-1");
      crashed.AppendPhase("crashed-1", phase, PhaseOutcome::OUTCOME_SUCCESS);
    }
    crashed.EnterPhase("crashed-1", Phase::PHASE_DEPLOYING);

    // Died right after the cutover.
    h.runtime->Seed("api", "green", 0, "2.0");
    h.runtime->Seed("api", "green", 1, "2.0");
    h.runtime->Seed("worker", "green", 0, "2.0");
    h.router->current = "green";
  }

  assert(std::filesystem::exists(h.dir / "sessions" / "crashed-1.json"));

  auto outcomes = h.orchestrator->RecoverInterruptedSessions();
  assert(outcomes.size() == 1);
  const auto& out = outcomes.front();
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK);
  assert(HasRecord(out.session, Phase::PHASE_DEPLOYING, PhaseOutcome::OUTCOME_FAILURE));
  bool interrupted = false;
  for (const auto& record : out.session.phase_history()) {
    if (record.phase() == Phase::PHASE_DEPLOYING && Contains(record.detail(), "interrupted in")) interrupted = true;
  }
  assert(interrupted);

  assert(h.router->Current() == "blue");
  assert(h.runtime->VersionOf("api-blue-0") == "1.0");
  assert(h.runtime->VersionOf("api-green-0").empty());
  assert(!h.LockHeld());

  assert(h.orchestrator->RecoverInterruptedSessions().empty());

  // A fresh state manager over the same directory sees the sealed record.
  state::StateManager reopened(std::make_shared<db::file::FileRepository>(h.dir / "sessions"), h.dir / "locks");
  auto                stored = reopened.Get("crashed-1");
  assert(stored && stored->phase() == Phase::PHASE_ROLLED_BACK);
}

void TestRollbackOfOrphanBeforeMutationFailsIt() {
  Harness h("orchestrator_orphan");

  auto owner = std::make_unique<state::StateManager>(h.repository, h.dir / "locks");
  owner->Create(CrashedSession("orphan-1"));
  owner->EnterPhase("orphan-1", Phase::PHASE_VALIDATING);
  owner->AppendPhase("orphan-1", Phase::PHASE_VALIDATING, PhaseOutcome::OUTCOME_SUCCESS);
  owner->EnterPhase("orphan-1", Phase::PHASE_BACKING_UP);

  // Owner still alive: left alone.
  assert(h.orchestrator->RecoverInterruptedSessions().empty());
  assert(h.state->Get("orphan-1")->phase() == Phase::PHASE_BACKING_UP);

  owner.reset();

  auto out = h.orchestrator->Rollback("");
  assert(out.session.session_id() == "orphan-1");
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(!out.manual_intervention_required);
  assert(HasRecord(out.session, Phase::PHASE_BACKING_UP, PhaseOutcome::OUTCOME_FAILURE));
  assert(h.runtime->CountEvents("start") == 0);
  assert(!h.LockHeld());

  // Sealed sessions come back as they are.
  auto again = h.orchestrator->Rollback("orphan-1");
  assert(again.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(Contains(again.message, "session already"));
}

void TestRollbackRules() {
  Harness h("orchestrator_rollback_rules");

  bool not_found = false;
  try {
    h.orchestrator->Rollback("");
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  auto completed = h.orchestrator->Upgrade(Request("2.0"));
  assert(completed.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);

  bool finalized = false;
  try {
    h.orchestrator->Rollback(completed.session.session_id());
  } catch (const util::InvalidState&) {
    finalized = true;
  }
  assert(finalized);

  not_found = false;
  try {
    h.orchestrator->Rollback("");
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  not_found = false;
  try {
    h.orchestrator->Status("no-such-session");
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  assert(!h.orchestrator->Abort(completed.session.session_id()));
}

void TestFinalizeOutlastsThePhaseTimeout() {
  Harness h("orchestrator_finalize_timeout");
  h.UseGracePeriod(1200ms);

  auto request            = Request("2.0");
  request.timeout_seconds = 1;
  auto out                = h.orchestrator->Upgrade(request);

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(HasRecord(out.session, Phase::PHASE_FINALIZING, PhaseOutcome::OUTCOME_SUCCESS));
  assert(!HasRecord(out.session, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_SUCCESS));
  assert(h.router->Current() == "green");
  assert(h.runtime->VersionOf("api-blue-0").empty());
  assert(!h.LockHeld());

  auto next = h.orchestrator->Upgrade(Request("3.0"));
  assert(next.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(h.router->Current() == "blue");
}

void TestFinalizeCleanupFailureStillCompletes() {
  Harness h("orchestrator_finalize_cleanup");
  h.runtime->failing_removes.insert("api-blue-0");

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(!out.manual_intervention_required);
  bool reported = false;
  for (const auto& record : out.session.phase_history()) {
    if (record.phase() == Phase::PHASE_FINALIZING && Contains(record.detail(), "cleanup incomplete")) reported = true;
  }
  assert(reported);
  assert(h.router->Current() == "green");
  assert(h.runtime->VersionOf("api-blue-0") == "1.0");
  assert(!h.LockHeld());

  // The leftover unit is cleared by the next cutover into its generation.
  h.runtime->failing_removes.clear();
  auto next = h.orchestrator->Upgrade(Request("3.0"));
  assert(next.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(h.runtime->VersionOf("api-blue-0") == "3.0");
}

void TestRecoveryCompletesInterruptedFinalize() {
  Harness h("orchestrator_recover_finalize", true);

  {
    state::StateManager crashed(h.repository, h.dir / "locks");
    crashed.Create(CrashedSession("crashed-2"));
    for (auto phase : {Phase::PHASE_VALIDATING, Phase::PHASE_BACKING_UP, Phase::PHASE_VERIFYING_SIGNATURES,
                       Phase::PHASE_DEPLOYING, Phase::PHASE_HEALTH_CHECKING}) {
      crashed.EnterPhase("crashed-2", phase);
      if (phase == Phase::PHASE_BACKING_UP) crashed.SealRollbackPoint("crashed-2");
      crashed.AppendPhase("crashed-2", phase, PhaseOutcome::OUTCOME_SUCCESS);
    }
    crashed.EnterPhase("crashed-2", Phase::PHASE_FINALIZING);

    h.runtime->Seed("api", "green", 0, "2.0");
    h.runtime->Seed("api", "green", 1, "2.0");
    h.runtime->Seed("worker", "green", 0, "2.0");
    h.router->current = "green";
  }

  auto outcomes = h.orchestrator->RecoverInterruptedSessions();
  assert(outcomes.size() == 1);
  const auto& out = outcomes.front();
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(out.session.phase() == Phase::PHASE_COMPLETED);
  assert(!HasRecord(out.session, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_SUCCESS));
  assert(!HasRecord(out.session, Phase::PHASE_ROLLING_BACK, PhaseOutcome::OUTCOME_FAILURE));

  bool interrupted = false;
  for (const auto& record : out.session.phase_history()) {
    if (record.phase() != Phase::PHASE_FINALIZING) continue;
    assert(record.outcome() == PhaseOutcome::OUTCOME_SUCCESS);
    assert(!Contains(record.detail(), "owner pid"));
    if (Contains(record.detail(), "interrupted in finalizing")) interrupted = true;
  }
  assert(interrupted);

  assert(h.router->Current() == "green");
  assert(h.runtime->VersionOf("api-green-0") == "2.0");
  assert(h.runtime->VersionOf("api-blue-0").empty());
  assert(h.runtime->VersionOf("worker-blue-0").empty());
  assert(h.store->imports == 0);
  assert(!h.LockHeld());
}

void TestRestoreAndRedeployRetiresTargetUnits() {
  Harness h("orchestrator_redeploy");
  h.probe->failing_live.insert("2.0");
  // The previous generation disappears while 2.0 takes traffic, so the
  // cutover cannot simply be reversed.
  h.probe->on_live_failure = [&h] {
    h.runtime->Remove("api-blue-0");
    h.runtime->Remove("api-blue-1");
    h.runtime->Remove("worker-blue-0");
  };

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK);
  assert(!out.manual_intervention_required);

  bool redeployed = false;
  for (const auto& record : out.session.phase_history()) {
    if (record.phase() == Phase::PHASE_ROLLING_BACK && Contains(record.detail(), "redeployed")) {
      assert(record.outcome() == PhaseOutcome::OUTCOME_SUCCESS);
      assert(!Contains(record.detail(), "cleanup incomplete"));
      redeployed = true;
    }
  }
  assert(redeployed);

  assert(h.store->imports == 1);
  assert(h.store->Contents() == "v1-data");
  assert(h.router->Current() == "blue");
  assert(h.runtime->VersionOf("api-blue-0") == "1.0");
  assert(h.runtime->VersionOf("worker-blue-0") == "1.0");
  assert(h.runtime->VersionOf("api-green-0").empty());
  assert(h.runtime->VersionOf("worker-green-0").empty());
  assert(h.runtime->List().size() == 3);
  assert(!h.LockHeld());
}

void TestSequentialFailureRestoresOnlyReplacedUnits() {
  Harness h("orchestrator_sequential_rollback");
  h.runtime->failing_starts.insert("api-blue-1@2.0");

  auto request     = Request("2.0");
  request.strategy = Strategy::STRATEGY_SEQUENTIAL_REPLACE;
  auto out         = h.orchestrator->Upgrade(request);

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK);
  assert(HasRecord(out.session, Phase::PHASE_DEPLOYING, PhaseOutcome::OUTCOME_FAILURE));
  assert(Contains(out.message, "api-blue-1"));
  assert(h.router->Current() == "blue");
  assert(h.runtime->VersionOf("api-blue-0") == "1.0");
  assert(h.runtime->VersionOf("api-blue-1") == "1.0");
  assert(h.runtime->VersionOf("worker-blue-0") == "1.0");
  assert(h.runtime->CountEvents("start worker-blue-0") == 0);
  assert(h.runtime->CountEvents("remove worker-blue-0") == 0);
  assert(h.store->imports == 0);
  assert(!h.LockHeld());
}

void TestSchemaMigrationRunsBeforeDeploy() {
  Harness h("orchestrator_migration");
  h.store->migrations_for.insert("2.0");

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(h.store->exports == 1);
  assert(h.store->migrations == 1);
  assert(h.store->Contents() == "v1-data+schema-2.0");
  assert(out.session.migrated_stores_size() == 1);
  assert(out.session.migrated_stores(0) == "appdb");

  bool noted = false;
  for (const auto& record : out.session.phase_history()) {
    if (record.phase() == Phase::PHASE_DEPLOYING && Contains(record.detail(), "after migrating appdb")) noted = true;
  }
  assert(noted);

  // No migration ships with 3.0.
  auto next = h.orchestrator->Upgrade(Request("3.0"));
  assert(next.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(h.store->migrations == 1);
  assert(next.session.migrated_stores_size() == 0);
}

void TestRollbackRestoresMigratedStores() {
  Harness h("orchestrator_migration_rollback");
  h.store->migrations_for.insert("2.0");
  h.probe->failing_live.insert("2.0");

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK);
  assert(!out.manual_intervention_required);
  assert(h.store->migrations == 1);
  assert(h.store->imports == 1);
  assert(h.store->Contents() == "v1-data");
  assert(h.router->Current() == "blue");

  bool restored = false;
  for (const auto& record : out.session.phase_history()) {
    if (record.phase() == Phase::PHASE_ROLLING_BACK && Contains(record.detail(), "migrated store(s) restored: appdb")) {
      restored = true;
    }
  }
  assert(restored);
  assert(!h.LockHeld());
}

void TestFailedMigrationRollsBackBeforeAnyStart() {
  Harness h("orchestrator_migration_failure");
  h.store->migrations_for.insert("2.0");
  h.store->fail_migrate = true;

  auto out = h.orchestrator->Upgrade(Request("2.0"));
  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_ROLLED_BACK);
  assert(HasRecord(out.session, Phase::PHASE_DEPLOYING, PhaseOutcome::OUTCOME_FAILURE));
  assert(Contains(out.message, "migration to 2.0 failed"));
  assert(out.session.migrated_stores_size() == 1);
  assert(h.runtime->CountEvents("start") == 0);
  assert(h.store->imports == 1);
  assert(h.store->Contents() == "v1-data");
  assert(h.router->Current() == "blue");
}

void TestMigrationRefusesSkipBackup() {
  Harness h("orchestrator_migration_skip_backup");
  h.store->migrations_for.insert("2.0");

  auto request        = Request("2.0");
  request.skip_backup = true;
  auto out            = h.orchestrator->Upgrade(request);

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(Contains(out.message, "skip_backup is not allowed"));
  assert(HasRecord(out.session, Phase::PHASE_VALIDATING, PhaseOutcome::OUTCOME_FAILURE));
  assert(h.store->exports == 0);
  assert(h.store->migrations == 0);
  assert(h.runtime->CountEvents("start") == 0);
}

void TestDryRunPlansMigrations() {
  Harness h("orchestrator_migration_dry_run");
  h.store->migrations_for.insert("2.0");

  auto request    = Request("2.0");
  request.dry_run = true;
  auto out        = h.orchestrator->Upgrade(request);

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_COMPLETED);
  assert(!out.plan.empty());
  assert(std::find(out.plan.begin(), out.plan.end(), "migrate store appdb schema to 2.0") != out.plan.end());
  assert(h.store->migrations == 0);
  assert(h.store->Contents() == "v1-data");
}

void TestPhaseDeadlineBoundsLookups() {
  Harness h("orchestrator_phase_deadline");
  auto    hanging = std::make_shared<HangingLookup>();
  h.UseLookup(hanging);

  auto request            = Request("2.0");
  request.timeout_seconds = 1;
  const auto started      = std::chrono::steady_clock::now();
  auto       out          = h.orchestrator->Upgrade(request);
  const auto elapsed      = std::chrono::steady_clock::now() - started;

  assert(out.outcome == TerminalOutcome::TERMINAL_OUTCOME_FAILED);
  assert(HasRecord(out.session, Phase::PHASE_VERIFYING_SIGNATURES, PhaseOutcome::OUTCOME_FAILURE));
  assert(elapsed < 4s);
  {
    std::lock_guard lock(hanging->mutex);
    assert(hanging->longest > 0ms);
    assert(hanging->longest <= 1000ms);
  }
  assert(h.runtime->CountEvents("start") == 0);
  assert(!h.LockHeld());
}

} // namespace

int main() {
  TestUpgradeCompletesAndFreesTarget();
  TestSequentialUpgradeReplacesInPlace();
  TestUnreachableTargetFailsBeforeAnyMutation();
  TestSameVersionIsRejected();
  TestHealthFailureRollsBackWithoutRestore();
  TestFailedRollbackRequiresManualIntervention();
  TestDryRunTouchesNothing();
  TestBusyTargetConflicts();
  TestSignatureFailureStopsBeforeDeploy();
  TestEverySessionVerifiesItsOwnImages();
  TestAbortCancelsAtPhaseBoundary();
  TestPhaseTimeoutIsEnforced();
  TestRecoveryRollsBackInterruptedDeploy();
  TestRollbackOfOrphanBeforeMutationFailsIt();
  TestRollbackRules();
  TestFinalizeOutlastsThePhaseTimeout();
  TestFinalizeCleanupFailureStillCompletes();
  TestRecoveryCompletesInterruptedFinalize();
  TestRestoreAndRedeployRetiresTargetUnits();
  TestSequentialFailureRestoresOnlyReplacedUnits();
  TestSchemaMigrationRunsBeforeDeploy();
  TestRollbackRestoresMigratedStores();
  TestFailedMigrationRollsBackBeforeAnyStart();
  TestMigrationRefusesSkipBackup();
  TestDryRunPlansMigrations();
  TestPhaseDeadlineBoundsLookups();

  std::cout << "update_orchestrator_test: pass\n";
  return 0;
}
