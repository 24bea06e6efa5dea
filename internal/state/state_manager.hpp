#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/session_repository.hpp"
#include "rollout/manager/v1/session.pb.h"
#include "session_lock.hpp"

namespace rollout::state {

using rollout::manager::v1::BackupRecord;
using rollout::manager::v1::Phase;
using rollout::manager::v1::PhaseOutcome;
using rollout::manager::v1::UpdateSession;
using rollout::manager::v1::VerificationResult;

/*
  Durable, lock-protected record of update sessions.

  Every method persists before returning and hands back the stored
  record. Phase changes are two writes: EnterPhase records the new
  phase before any work starts, AppendPhase adds the history entry once
  the outcome is known. A terminal history entry releases the
  deployment target lock and freezes the record.

  No business rules live here beyond the legal-transition and conflict
  checks.
*/
class StateManager {
 public:
  StateManager(std::shared_ptr<db::SessionRepository> repository, std::filesystem::path lock_dir);

  // Takes the deployment target lock and persists `session` in phase
  // created. Throws util::SessionConflict when the target is busy.
  UpdateSession Create(UpdateSession session);

  UpdateSession EnterPhase(const std::string& session_id, Phase phase);

  UpdateSession AppendPhase(const std::string& session_id, Phase phase, PhaseOutcome outcome,
                            const std::string& detail = {});

  UpdateSession RecordBackup(const std::string& session_id, const BackupRecord& backup);

  // Set once per image. A second result for the same image is rejected.
  UpdateSession RecordVerification(const std::string& session_id, const VerificationResult& result);

  // Notes that `store_id` now carries the target version's schema.
  UpdateSession RecordMigration(const std::string& session_id, const std::string& store_id);

  // Freezes the recorded backups into the rollback point.
  UpdateSession SealRollbackPoint(const std::string& session_id);

  UpdateSession MarkCancelRequested(const std::string& session_id);

  UpdateSession RecordFailure(const std::string& session_id, const std::string& reason, bool manual_intervention);

  std::optional<UpdateSession> Get(const std::string& session_id);

  std::vector<UpdateSession> ListActive();
  std::vector<UpdateSession> ListAll();

  // Drops the lock while leaving the session non-terminal. Dry runs
  // give the target back once validation is over.
  void ReleaseLock(const std::string& session_id);

  // Takes the lock for an orphaned session found at startup.
  void Adopt(const std::string& session_id);

  bool OwnsLock(const std::string& session_id) const;

  // Operator abandonment: ends the session in failed and frees the target.
  UpdateSession Abandon(const std::string& session_id, const std::string& reason);

  // Deletes the oldest terminal records beyond `keep`. Returns the count removed.
  std::size_t Prune(std::size_t keep);

  std::filesystem::path LockPath(const std::string& deployment_target) const;

 private:
  UpdateSession Mutate(const std::string& session_id, const std::function<void(UpdateSession&)>& change);

  std::shared_ptr<db::SessionRepository> repository_;
  std::filesystem::path                  lock_dir_;

  mutable std::mutex                                            mutex_;
  std::unordered_map<std::string, std::unique_ptr<SessionLock>> locks_;
};

} // namespace rollout::state
