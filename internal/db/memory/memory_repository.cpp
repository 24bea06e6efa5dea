#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace rollout::db::memory {

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRepository::TX(Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertSession(Transaction& t, const SessionRecord& session) {
  auto& tx = TX(t);
  if (tx.Find(session.session_id())) {
    return Result::Err(ErrorCode::AlreadyExists, "session exists: " + session.session_id());
  }
  tx.Put(session);
  return Result::Ok();
}

Result MemoryRepository::ReplaceSession(Transaction& t, const SessionRecord& session) {
  auto& tx = TX(t);
  if (!tx.Find(session.session_id())) {
    return Result::Err(ErrorCode::NotFound, "session not found: " + session.session_id());
  }
  tx.Put(session);
  return Result::Ok();
}

std::optional<SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& session_id) {
  if (const auto* found = TX(t).Find(session_id)) return *found;
  return std::nullopt;
}

std::vector<SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  auto out = TX(t).All();
  SortByStartTime(out);
  return out;
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& session_id) {
  if (!TX(t).Erase(session_id)) {
    return Result::Err(ErrorCode::NotFound, "session not found: " + session_id);
  }
  return Result::Ok();
}

} // namespace rollout::db::memory
