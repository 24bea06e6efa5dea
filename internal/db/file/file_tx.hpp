#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "file_repository.hpp"
#include "internal/db/api/transaction.hpp"

namespace rollout::db::file {

/*
  Staged write set over the session directory.

  A nullopt entry is a pending delete. Commit applies entries in id
  order; each applied entry is durable on its own.
*/
class FileTransaction final : public db::Transaction {
 public:
  explicit FileTransaction(FileRepository& repo);
  ~FileTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  std::map<std::string, std::optional<SessionRecord>>& Staged() {
    return staged_;
  }

 private:
  FileRepository&                                     repo_;
  std::unique_lock<std::mutex>                        lock_;
  std::map<std::string, std::optional<SessionRecord>> staged_;
  bool                                                committed_ = false;
};

} // namespace rollout::db::file
