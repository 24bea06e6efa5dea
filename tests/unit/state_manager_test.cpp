#include <cassert>
#include <iostream>
#include <memory>
#include <set>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/session_lock.hpp"
#include "internal/state/state_manager.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/session_id.hpp"
#include "support/fakes.hpp"

using namespace rollout;
using rollout::manager::v1::Phase;
using rollout::manager::v1::PhaseOutcome;
using rollout::manager::v1::UpdateSession;

namespace {

UpdateSession NewSession(const std::string& id, bool dry_run = false) {
  UpdateSession session;
  session.set_session_id(id);
  session.set_deployment_target("default");
  session.set_source_version("1.0");
  session.set_target_version("2.0");
  session.set_dry_run(dry_run);
  return session;
}

struct Fixture {
  explicit Fixture(const std::string& name)
      : dir(testing::FreshDir(name)), repository(std::make_shared<db::memory::MemoryRepository>()),
        state(repository, dir / "locks") {
  }

  // Walks a session through one phase: enter, then record the outcome.
  void Step(const std::string& id, Phase phase, PhaseOutcome outcome = PhaseOutcome::OUTCOME_SUCCESS) {
    state.EnterPhase(id, phase);
    state.AppendPhase(id, phase, outcome);
  }

  bool LockHeld() const {
    return state::SessionLock::IsHeld(state.LockPath("default"));
  }

  std::filesystem::path                              dir;
  std::shared_ptr<db::memory::MemoryRepository>      repository;
  state::StateManager                                state;
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestCreateTakesTheTargetLock() {
  Fixture f("state_manager_create");

  auto created = f.state.Create(NewSession("s1"));
  assert(created.phase() == Phase::PHASE_CREATED);
  assert(created.phase_history_size() == 1);
  assert(created.owner_pid() > 0);
  assert(created.rollback_point().source_version() == "1.0");
  assert(f.state.OwnsLock("s1"));
  assert(f.LockHeld());

  assert(Throws<util::SessionConflict>([&] { f.state.Create(NewSession("s2")); }));
  assert(f.state.ListAll().size() == 1);

  // A second manager on the same lock directory sees the lock too.
  state::StateManager other(std::make_shared<db::memory::MemoryRepository>(), f.dir / "locks");
  assert(Throws<util::SessionConflict>([&] { other.Create(NewSession("s3")); }));

  assert(Throws<std::invalid_argument>([&] { f.state.Create(NewSession("")); }));
}

void TestUnsafeTargetNamesAreRejected() {
  Fixture f("state_manager_target_name");
  auto    session = NewSession("s1");
  session.set_deployment_target("../etc");
  assert(Throws<util::ValidationError>([&] { f.state.Create(session); }));
}

void TestPhaseChangesAreChecked() {
  Fixture f("state_manager_transitions");
  f.state.Create(NewSession("s1"));

  assert(Throws<util::InvalidState>([&] { f.state.EnterPhase("s1", Phase::PHASE_DEPLOYING); }));
  // Outcome only for the phase the session is in.
  assert(Throws<util::InvalidState>(
      [&] { f.state.AppendPhase("s1", Phase::PHASE_VALIDATING, PhaseOutcome::OUTCOME_SUCCESS); }));

  auto entered = f.state.EnterPhase("s1", Phase::PHASE_VALIDATING);
  assert(entered.phase() == Phase::PHASE_VALIDATING);
  assert(entered.phase_history_size() == 1);

  auto recorded = f.state.AppendPhase("s1", Phase::PHASE_VALIDATING, PhaseOutcome::OUTCOME_SUCCESS, "ok");
  assert(recorded.phase_history_size() == 2);
  assert(recorded.phase_history(1).detail() == "ok");
  assert(recorded.phase_history(1).started_at().seconds() == entered.phase_entered_at().seconds());

  assert(Throws<util::NotFound>([&] { f.state.EnterPhase("missing", Phase::PHASE_VALIDATING); }));
}

void TestTerminalRecordSealsAndReleases() {
  Fixture f("state_manager_seal");
  f.state.Create(NewSession("s1"));
  f.Step("s1", Phase::PHASE_VALIDATING);
  f.state.RecordFailure("s1", "preflight failed", false);
  f.state.EnterPhase("s1", Phase::PHASE_FAILED);

  // Entered but not yet recorded: still owned.
  assert(f.LockHeld());

  auto sealed = f.state.AppendPhase("s1", Phase::PHASE_FAILED, PhaseOutcome::OUTCOME_FAILURE, "preflight failed");
  assert(sealed.failure_reason() == "preflight failed");
  assert(!f.state.OwnsLock("s1"));
  assert(!f.LockHeld());

  assert(Throws<util::InvalidState>([&] { f.state.RecordFailure("s1", "again", true); }));
  assert(Throws<util::InvalidState>([&] { f.state.MarkCancelRequested("s1"); }));
  assert(f.state.Get("s1")->failure_reason() == "preflight failed");

  // The target is free for the next session.
  auto next = f.state.Create(NewSession("s2"));
  assert(next.phase() == Phase::PHASE_CREATED);
}

void TestBackupsAndVerifications() {
  Fixture f("state_manager_records");
  f.state.Create(NewSession("s1"));
  f.Step("s1", Phase::PHASE_VALIDATING);
  f.state.EnterPhase("s1", Phase::PHASE_BACKING_UP);

  rollout::manager::v1::BackupRecord backup;
  backup.set_backup_id("backup-1");
  backup.set_store_id("appdb");
  f.state.RecordBackup("s1", backup);
  auto sealed = f.state.SealRollbackPoint("s1");
  assert(sealed.rollback_point().sealed());
  assert(sealed.rollback_point().backup_refs_size() == 1);
  assert(sealed.rollback_point().backup_refs(0) == "backup-1");

  backup.set_backup_id("backup-2");
  assert(Throws<util::InvalidState>([&] { f.state.RecordBackup("s1", backup); }));
  assert(Throws<util::InvalidState>([&] { f.state.SealRollbackPoint("s1"); }));

  rollout::manager::v1::VerificationResult result;
  result.set_image_ref("registry/api:2.0");
  result.set_verified(true);
  f.state.RecordVerification("s1", result);
  result.set_verified(false);
  assert(Throws<util::InvalidState>([&] { f.state.RecordVerification("s1", result); }));
  assert(f.state.Get("s1")->verification_results().at("registry/api:2.0").verified());
}

void TestDryRunDoesNotBlockTarget() {
  Fixture f("state_manager_dry_run");
  f.state.Create(NewSession("dry", true));
  f.Step("dry", Phase::PHASE_VALIDATING);
  f.state.ReleaseLock("dry");
  assert(!f.LockHeld());

  auto real = f.state.Create(NewSession("real"));
  assert(real.phase() == Phase::PHASE_CREATED);
  assert(f.state.ListActive().size() == 2);

  // A non-terminal real session does block, even with the lock free.
  f.state.ReleaseLock("real");
  assert(Throws<util::SessionConflict>([&] { f.state.Create(NewSession("third")); }));
}

void TestAbandonOnlyBeforeMutation() {
  Fixture f("state_manager_abandon");
  f.state.Create(NewSession("s1"));
  f.Step("s1", Phase::PHASE_VALIDATING);
  f.Step("s1", Phase::PHASE_BACKING_UP);
  f.Step("s1", Phase::PHASE_VERIFYING_SIGNATURES);
  f.state.EnterPhase("s1", Phase::PHASE_DEPLOYING);

  assert(Throws<util::InvalidState>([&] { f.state.Abandon("s1", "operator gave up"); }));

  Fixture g("state_manager_abandon_early");
  g.state.Create(NewSession("s2"));
  g.state.EnterPhase("s2", Phase::PHASE_VALIDATING);
  auto abandoned = g.state.Abandon("s2", "operator gave up");
  assert(abandoned.phase() == Phase::PHASE_FAILED);
  const auto& last = abandoned.phase_history(abandoned.phase_history_size() - 1);
  assert(last.phase() == Phase::PHASE_FAILED);
  assert(last.outcome() == PhaseOutcome::OUTCOME_CANCELLED);
  assert(!g.LockHeld());
  assert(Throws<util::InvalidState>([&] { g.state.Abandon("s2", "twice"); }));
  assert(Throws<util::NotFound>([&] { g.state.Abandon("missing", "x"); }));
}

void TestAdoptOrphan() {
  Fixture f("state_manager_adopt");
  {
    state::StateManager previous(f.repository, f.dir / "locks");
    previous.Create(NewSession("orphan"));
    previous.EnterPhase("orphan", Phase::PHASE_VALIDATING);

    assert(Throws<util::SessionConflict>([&] { f.state.Adopt("orphan"); }));
  }

  f.state.Adopt("orphan");
  assert(f.state.OwnsLock("orphan"));
  assert(f.LockHeld());
  // Adopting twice is a no-op.
  f.state.Adopt("orphan");

  f.state.AppendPhase("orphan", Phase::PHASE_VALIDATING, PhaseOutcome::OUTCOME_FAILURE, "interrupted");
  f.state.EnterPhase("orphan", Phase::PHASE_FAILED);
  f.state.AppendPhase("orphan", Phase::PHASE_FAILED, PhaseOutcome::OUTCOME_FAILURE);
  assert(!f.LockHeld());
  assert(Throws<util::InvalidState>([&] { f.state.Adopt("orphan"); }));
  assert(Throws<util::NotFound>([&] { f.state.Adopt("missing"); }));
}

void TestPruneKeepsNewestTerminalSessions() {
  Fixture f("state_manager_prune");
  for (const auto* id : {"a", "b", "c", "d"}) {
    f.state.Create(NewSession(id));
    f.state.EnterPhase(id, Phase::PHASE_FAILED);
    f.state.AppendPhase(id, Phase::PHASE_FAILED, PhaseOutcome::OUTCOME_FAILURE);
  }
  f.state.Create(NewSession("active"));

  assert(f.state.Prune(10) == 0);
  assert(f.state.Prune(2) == 2);

  const auto remaining = f.state.ListAll();
  assert(remaining.size() == 3);
  assert(!f.state.Get("a"));
  assert(!f.state.Get("b"));
  assert(f.state.Get("c"));
  assert(f.state.Get("d"));
  assert(f.state.Get("active"));

  assert(f.state.Prune(0) == 2);
  assert(f.state.ListAll().size() == 1);
}

void TestMigratedStoresAreRecordedOnce() {
  Fixture f("state_manager_migrations");
  f.state.Create(NewSession("s1"));

  f.state.RecordMigration("s1", "appdb");
  f.state.RecordMigration("s1", "search");
  auto recorded = f.state.RecordMigration("s1", "appdb");
  assert(recorded.migrated_stores_size() == 2);
  assert(recorded.migrated_stores(0) == "appdb");
  assert(recorded.migrated_stores(1) == "search");
  assert(Throws<util::NotFound>([&] { f.state.RecordMigration("missing", "appdb"); }));
}

void TestSessionLockLifecycle() {
  const auto dir  = testing::FreshDir("session_lock_lifecycle");
  const auto path = dir / "locks" / "default.lock";

  assert(!state::SessionLock::IsHeld(path));

  auto first = state::SessionLock::TryAcquire(path, "session s1");
  assert(first);
  assert(first->Path() == path);
  assert(state::SessionLock::IsHeld(path));
  // Checking leaves the holder in place.
  assert(state::SessionLock::IsHeld(path));

  const auto body = util::ReadFile(path);
  assert(body && body->rfind("session s1 pid=", 0) == 0);

  assert(!state::SessionLock::TryAcquire(path, "session s2"));
  assert(state::SessionLock::IsHeld(path));

  first->Release();
  first->Release();
  assert(!state::SessionLock::IsHeld(path));

  auto second = state::SessionLock::TryAcquire(path, "session s2");
  assert(second);
  second.reset();
  assert(!state::SessionLock::IsHeld(path));

  // Repeated refusals do not leak descriptors.
  auto holder = state::SessionLock::TryAcquire(path, "session s3");
  for (int i = 0; i < 2000; ++i) {
    assert(!state::SessionLock::TryAcquire(path, "contender"));
  }
  holder.reset();
  assert(state::SessionLock::TryAcquire(path, "session s4"));
}

void TestSessionIds() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    const auto id = rollout::util::NewSessionId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(id.find_first_not_of("0123456789abcdef-") == std::string::npos);
    seen.insert(id);
  }
  assert(seen.size() == 1000);
}

} // namespace

int main() {
  TestCreateTakesTheTargetLock();
  TestUnsafeTargetNamesAreRejected();
  TestPhaseChangesAreChecked();
  TestTerminalRecordSealsAndReleases();
  TestBackupsAndVerifications();
  TestDryRunDoesNotBlockTarget();
  TestAbandonOnlyBeforeMutation();
  TestAdoptOrphan();
  TestPruneKeepsNewestTerminalSessions();
  TestMigratedStoresAreRecordedOnce();
  TestSessionLockLifecycle();
  TestSessionIds();

  std::cout << "state_manager_test: pass\n";
  return 0;
}
