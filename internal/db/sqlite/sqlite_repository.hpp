#pragma once

#include <memory>

#include "internal/db/api/session_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace rollout::db::sqlite {

/*
  Session store on a single sqlite file.

  Each row carries the protobuf JSON of the session plus the columns
  needed for ordering and lookup.
*/
class SqliteRepository final : public db::SessionRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                       InsertSession(Transaction&, const SessionRecord&) override;
  Result                       ReplaceSession(Transaction&, const SessionRecord&) override;
  std::optional<SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<SessionRecord>   ListSessions(Transaction&) override;
  Result                       DeleteSession(Transaction&, const std::string&) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  void Migrate();

  std::shared_ptr<SqliteDB> db_;
};

} // namespace rollout::db::sqlite
