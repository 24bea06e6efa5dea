#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "internal/db/api/session_repository.hpp"

namespace rollout::db::memory {

class MemoryTransaction;

// Process-local session store. Used by tests and by `state.backend: memory`.
// Committed state is an immutable map swapped on every commit; a
// transaction reads its snapshot through its own pending writes.
class MemoryRepository final : public db::SessionRepository {
 public:
  using Sessions = std::map<std::string, SessionRecord>;

  MemoryRepository() = default;

  std::unique_ptr<Transaction> Begin() override;

  Result                       InsertSession(Transaction&, const SessionRecord&) override;
  Result                       ReplaceSession(Transaction&, const SessionRecord&) override;
  std::optional<SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<SessionRecord>   ListSessions(Transaction&) override;
  Result                       DeleteSession(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  static MemoryTransaction& TX(Transaction& tx);

  std::mutex                      mutex_;
  std::shared_ptr<const Sessions> committed_  = std::make_shared<const Sessions>();
  std::uint64_t                   generation_ = 0;
};

} // namespace rollout::db::memory
