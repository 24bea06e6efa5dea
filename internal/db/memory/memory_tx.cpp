#include "memory_tx.hpp"

#include <stdexcept>

namespace rollout::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_   = repo_.committed_;
  generation_ = repo_.generation_;
}

const SessionRecord* MemoryTransaction::Find(const std::string& session_id) const {
  if (auto w = writes_.find(session_id); w != writes_.end()) {
    return w->second ? &*w->second : nullptr;
  }
  auto it = snapshot_->find(session_id);
  return it == snapshot_->end() ? nullptr : &it->second;
}

void MemoryTransaction::Put(const SessionRecord& session) {
  RequireOpen();
  writes_[session.session_id()] = session;
}

bool MemoryTransaction::Erase(const std::string& session_id) {
  RequireOpen();
  if (!Find(session_id)) return false;
  writes_[session_id] = std::nullopt;
  return true;
}

std::vector<SessionRecord> MemoryTransaction::All() const {
  std::vector<SessionRecord> out;
  for (const auto& [id, session] : *snapshot_) {
    if (!writes_.contains(id)) out.push_back(session);
  }
  for (const auto& [id, pending] : writes_) {
    if (pending) out.push_back(*pending);
  }
  return out;
}

void MemoryTransaction::Commit() {
  RequireOpen();
  finished_ = true;
  if (writes_.empty()) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.generation_ != generation_) {
    throw std::runtime_error("session store changed by a concurrent transaction");
  }

  auto next = std::make_shared<MemoryRepository::Sessions>(*snapshot_);
  for (auto& [id, pending] : writes_) {
    if (pending) {
      (*next)[id] = std::move(*pending);
    } else {
      next->erase(id);
    }
  }
  repo_.committed_ = std::move(next);
  ++repo_.generation_;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  finished_ = true;
}

void MemoryTransaction::RequireOpen() const {
  if (finished_) throw std::logic_error("session transaction already finished");
}

} // namespace rollout::db::memory
