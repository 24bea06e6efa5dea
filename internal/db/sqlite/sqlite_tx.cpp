#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace rollout::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

// An abandoned transaction leaves the stored session as it was.
SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    observability::LogWarn("session transaction rollback failed",
                           {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) throw std::logic_error("commit on a finished session transaction");
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace rollout::db::sqlite
