#include "state_manager.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rollout::state {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + (result.message.empty() ? std::string(db::ErrorCodeName(result.code)) : result.message);
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::SessionConflict(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

// A terminal session whose last history entry names its terminal phase.
bool IsSealed(const UpdateSession& session) {
  if (!model::IsTerminal(session.phase()) || session.phase_history_size() == 0) return false;
  return session.phase_history(session.phase_history_size() - 1).phase() == session.phase();
}

bool IsSafeTargetName(const std::string& target) {
  if (target.empty() || target.front() == '.') return false;
  return std::all_of(target.begin(), target.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
  });
}

} // namespace

StateManager::StateManager(std::shared_ptr<db::SessionRepository> repository, std::filesystem::path lock_dir)
    : repository_(std::move(repository)), lock_dir_(std::move(lock_dir)) {
  if (!repository_) {
    throw std::invalid_argument("StateManager requires a session repository");
  }
}

std::filesystem::path StateManager::LockPath(const std::string& deployment_target) const {
  if (!IsSafeTargetName(deployment_target)) {
    throw util::ValidationError("invalid deployment target name: '" + deployment_target + "'");
  }
  return lock_dir_ / (deployment_target + ".lock");
}

UpdateSession StateManager::Create(UpdateSession session) {
  if (session.session_id().empty()) {
    throw std::invalid_argument("session id is required");
  }

  std::lock_guard lock(mutex_);

  auto held = SessionLock::TryAcquire(LockPath(session.deployment_target()), session.session_id());
  if (!held) {
    throw util::SessionConflict("deployment target '" + session.deployment_target() +
                                "' is locked by another update session");
  }

  auto tx = repository_->Begin();
  for (const auto& existing : repository_->ListSessions(*tx)) {
    if (existing.deployment_target() == session.deployment_target() && !model::IsTerminal(existing.phase()) &&
        !existing.dry_run()) {
      throw util::SessionConflict("session " + existing.session_id() + " on '" + session.deployment_target() +
                                  "' is not terminal and must be rolled back or abandoned first");
    }
  }

  const auto now = util::ToProto(util::Now());
  session.set_phase(Phase::PHASE_CREATED);
  *session.mutable_started_at()       = now;
  *session.mutable_updated_at()       = now;
  *session.mutable_phase_entered_at() = now;
  session.set_owner_pid(::getpid());
  session.mutable_rollback_point()->set_source_version(session.source_version());

  auto* record = session.add_phase_history();
  record->set_phase(Phase::PHASE_CREATED);
  *record->mutable_started_at()  = now;
  *record->mutable_finished_at() = now;
  record->set_outcome(PhaseOutcome::OUTCOME_SUCCESS);

  ThrowIfDbError(repository_->InsertSession(*tx, session), "create session " + session.session_id());
  tx->Commit();

  locks_[session.session_id()] = std::move(held);

  observability::LogInfo("session created", {observability::StringField("session_id", session.session_id()),
                                             observability::StringField("target", session.deployment_target()),
                                             observability::StringField("source_version", session.source_version()),
                                             observability::StringField("target_version", session.target_version())});
  return session;
}

UpdateSession StateManager::Mutate(const std::string& session_id, const std::function<void(UpdateSession&)>& change) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetSession(*tx, session_id);
  if (!current) {
    throw util::NotFound("session not found: " + session_id);
  }
  if (IsSealed(*current)) {
    throw util::InvalidState("session " + session_id + " is terminal and immutable");
  }

  change(*current);
  *current->mutable_updated_at() = util::ToProto(util::Now());

  ThrowIfDbError(repository_->ReplaceSession(*tx, *current), "update session " + session_id);
  tx->Commit();
  return *current;
}

UpdateSession StateManager::EnterPhase(const std::string& session_id, Phase phase) {
  std::lock_guard lock(mutex_);
  return Mutate(session_id, [&](UpdateSession& session) {
    if (!model::CanTransition(session.phase(), phase)) {
      throw util::InvalidState("illegal transition " + std::string(model::PhaseName(session.phase())) + " -> " +
                               std::string(model::PhaseName(phase)) + " for session " + session_id);
    }
    session.set_phase(phase);
    *session.mutable_phase_entered_at() = util::ToProto(util::Now());
  });
}

UpdateSession StateManager::AppendPhase(const std::string& session_id, Phase phase, PhaseOutcome outcome,
                                        const std::string& detail) {
  std::lock_guard lock(mutex_);
  auto            stored = Mutate(session_id, [&](UpdateSession& session) {
    if (session.phase() != phase) {
      throw util::InvalidState("session " + session_id + " is in " + std::string(model::PhaseName(session.phase())) +
                               ", cannot record outcome for " + std::string(model::PhaseName(phase)));
    }
    auto* record = session.add_phase_history();
    record->set_phase(phase);
    *record->mutable_started_at()  = session.phase_entered_at();
    *record->mutable_finished_at() = util::ToProto(util::Now());
    record->set_outcome(outcome);
    record->set_detail(detail);
  });

  if (model::IsTerminal(phase)) {
    locks_.erase(session_id);
  }

  observability::LogInfo("phase recorded", {observability::StringField("session_id", session_id),
                                            observability::StringField("phase", model::PhaseName(phase)),
                                            observability::StringField("outcome", model::OutcomeName(outcome)),
                                            observability::StringField("detail", detail)});
  return stored;
}

UpdateSession StateManager::RecordBackup(const std::string& session_id, const BackupRecord& backup) {
  std::lock_guard lock(mutex_);
  return Mutate(session_id, [&](UpdateSession& session) {
    if (session.rollback_point().sealed()) {
      throw util::InvalidState("rollback point of session " + session_id + " is already sealed");
    }
    *session.add_backup_refs() = backup;
  });
}

UpdateSession StateManager::RecordVerification(const std::string& session_id, const VerificationResult& result) {
  std::lock_guard lock(mutex_);
  return Mutate(session_id, [&](UpdateSession& session) {
    auto* results = session.mutable_verification_results();
    if (results->contains(result.image_ref())) {
      throw util::InvalidState("verification of " + result.image_ref() + " already recorded for session " +
                               session_id);
    }
    (*results)[result.image_ref()] = result;
  });
}

UpdateSession StateManager::RecordMigration(const std::string& session_id, const std::string& store_id) {
  std::lock_guard lock(mutex_);
  return Mutate(session_id, [&](UpdateSession& session) {
    for (const auto& migrated : session.migrated_stores()) {
      if (migrated == store_id) return;
    }
    session.add_migrated_stores(store_id);
  });
}

UpdateSession StateManager::SealRollbackPoint(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  return Mutate(session_id, [&](UpdateSession& session) {
    auto* point = session.mutable_rollback_point();
    if (point->sealed()) {
      throw util::InvalidState("rollback point of session " + session_id + " is already sealed");
    }
    point->clear_backup_refs();
    for (const auto& backup : session.backup_refs()) {
      point->add_backup_refs(backup.backup_id());
    }
    point->set_sealed(true);
  });
}

UpdateSession StateManager::MarkCancelRequested(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  return Mutate(session_id, [](UpdateSession& session) { session.set_cancel_requested(true); });
}

UpdateSession StateManager::RecordFailure(const std::string& session_id, const std::string& reason,
                                          bool manual_intervention) {
  std::lock_guard lock(mutex_);
  return Mutate(session_id, [&](UpdateSession& session) {
    session.set_failure_reason(reason);
    if (manual_intervention) session.set_manual_intervention_required(true);
  });
}

std::optional<UpdateSession> StateManager::Get(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->GetSession(*tx, session_id);
}

std::vector<UpdateSession> StateManager::ListAll() {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ListSessions(*tx);
}

std::vector<UpdateSession> StateManager::ListActive() {
  auto all = ListAll();
  all.erase(std::remove_if(all.begin(), all.end(),
                           [](const UpdateSession& session) { return model::IsTerminal(session.phase()); }),
            all.end());
  return all;
}

void StateManager::ReleaseLock(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  locks_.erase(session_id);
}

void StateManager::Adopt(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  if (locks_.contains(session_id)) return;

  auto tx      = repository_->Begin();
  auto session = repository_->GetSession(*tx, session_id);
  if (!session) {
    throw util::NotFound("session not found: " + session_id);
  }
  if (model::IsTerminal(session->phase())) {
    throw util::InvalidState("session " + session_id + " is terminal");
  }

  auto held = SessionLock::TryAcquire(LockPath(session->deployment_target()), session_id);
  if (!held) {
    throw util::SessionConflict("session " + session_id + " is still owned by a running process");
  }
  locks_[session_id] = std::move(held);
}

bool StateManager::OwnsLock(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return locks_.contains(session_id);
}

UpdateSession StateManager::Abandon(const std::string& session_id, const std::string& reason) {
  std::unique_lock lock(mutex_);
  auto             current = [&] {
    auto tx = repository_->Begin();
    return repository_->GetSession(*tx, session_id);
  }();
  if (!current) {
    throw util::NotFound("session not found: " + session_id);
  }
  if (model::IsTerminal(current->phase())) {
    throw util::InvalidState("session " + session_id + " is already terminal");
  }
  if (!model::CanTransition(current->phase(), Phase::PHASE_FAILED)) {
    throw util::InvalidState("session " + session_id + " has deployed changes and must be rolled back, not abandoned");
  }
  lock.unlock();

  RecordFailure(session_id, reason, false);
  EnterPhase(session_id, Phase::PHASE_FAILED);
  auto stored = AppendPhase(session_id, Phase::PHASE_FAILED, PhaseOutcome::OUTCOME_CANCELLED, reason);

  observability::LogWarn("session abandoned", {observability::StringField("session_id", session_id),
                                               observability::StringField("reason", reason)});
  return stored;
}

std::size_t StateManager::Prune(std::size_t keep) {
  std::lock_guard lock(mutex_);
  auto            tx       = repository_->Begin();
  auto            sessions = repository_->ListSessions(*tx);

  std::vector<const UpdateSession*> terminal;
  for (const auto& session : sessions) {
    if (model::IsTerminal(session.phase())) terminal.push_back(&session);
  }
  if (terminal.size() <= keep) return 0;

  const std::size_t removed = terminal.size() - keep;
  for (std::size_t i = 0; i < removed; ++i) {
    ThrowIfDbError(repository_->DeleteSession(*tx, terminal[i]->session_id()),
                   "prune session " + terminal[i]->session_id());
  }
  tx->Commit();

  observability::LogInfo("sessions pruned", {observability::IntField("removed", static_cast<std::int64_t>(removed)),
                                             observability::IntField("kept", static_cast<std::int64_t>(keep))});
  return removed;
}

} // namespace rollout::state
