#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace rollout::db::memory {

// Snapshot of the committed sessions plus a write set. A pending write of
// nullopt is a delete.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const SessionRecord*       Find(const std::string& session_id) const;
  void                       Put(const SessionRecord& session);
  bool                       Erase(const std::string& session_id);
  std::vector<SessionRecord> All() const;

 private:
  void RequireOpen() const;

  MemoryRepository&                                      repo_;
  std::shared_ptr<const MemoryRepository::Sessions>      snapshot_;
  std::uint64_t                                          generation_;
  std::map<std::string, std::optional<SessionRecord>>    writes_;
  bool                                                   committed_ = false;
  bool                                                   finished_  = false;
};

} // namespace rollout::db::memory
