#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace rollout::db::sqlite {

// Write transaction on the shared connection. BEGIN IMMEDIATE takes the
// write lock up front, so a concurrent daemon fails at Begin with Busy
// instead of midway through a phase update.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  std::shared_ptr<SqliteDB> db_;
  State                     state_ = State::kOpen;
};

} // namespace rollout::db::sqlite
