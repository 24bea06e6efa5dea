#include "sqlite_repository.hpp"

#include <stdexcept>

#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace rollout::db::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

SessionRecord Decode(const Statement& st) {
  SessionRecord session;
  util::FromJson(st.Text(0), &session);
  return session;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Migrate();
}

void SqliteRepository::Migrate() {
  const int version = db_->UserVersion();
  if (version == kSchemaVersion) return;
  if (version > kSchemaVersion) {
    throw std::runtime_error(db_->Path() + ": session schema version " + std::to_string(version) + " is newer than this build (" +
                             std::to_string(kSchemaVersion) + ")");
  }

  SqliteTransaction tx(db_);
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS update_session ("
      " session_id TEXT PRIMARY KEY,"
      " deployment_target TEXT NOT NULL,"
      " phase INTEGER NOT NULL,"
      " started_at_ms INTEGER NOT NULL,"
      " record TEXT NOT NULL"
      ");"
      "CREATE INDEX IF NOT EXISTS update_session_started ON update_session(started_at_ms, session_id);");
  db_->SetUserVersion(kSchemaVersion);
  tx.Commit();
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const std::string message = sqlite3_errmsg(db);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::AlreadyExists, message);
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

Result SqliteRepository::InsertSession(Transaction& t, const SessionRecord& session) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO update_session(session_id,deployment_target,phase,started_at_ms,record)"
               " VALUES(?,?,?,?,?);");

  st.Bind(1, session.session_id())
      .Bind(2, session.deployment_target())
      .Bind(3, static_cast<std::int64_t>(session.phase()))
      .Bind(4, static_cast<std::int64_t>(util::ToUnixMillis(util::FromProto(session.started_at()))))
      .Bind(5, util::ToJson(session));

  return Translate(db, st.Step());
}

Result SqliteRepository::ReplaceSession(Transaction& t, const SessionRecord& session) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE update_session SET phase=?, record=? WHERE session_id=?;");
  st.Bind(1, static_cast<std::int64_t>(session.phase())).Bind(2, util::ToJson(session)).Bind(3, session.session_id());

  if (auto r = Translate(db, st.Step()); !r) return r;
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "session not found: " + session.session_id());
  }
  return Result::Ok();
}

std::optional<SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& session_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT record FROM update_session WHERE session_id=?;");
  st.Bind(1, session_id);

  const int rc = st.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error("read session " + session_id + ": " + sqlite3_errmsg(db));
  }
  return Decode(st);
}

std::vector<SessionRecord> SqliteRepository::ListSessions(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT record FROM update_session ORDER BY started_at_ms, session_id;");

  std::vector<SessionRecord> out;
  int                        rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    out.push_back(Decode(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("list sessions: ") + sqlite3_errmsg(db));
  }
  return out;
}

Result SqliteRepository::DeleteSession(Transaction& t, const std::string& session_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM update_session WHERE session_id=?;");
  st.Bind(1, session_id);

  if (auto r = Translate(db, st.Step()); !r) return r;
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "session not found: " + session_id);
  }
  return Result::Ok();
}

} // namespace rollout::db::sqlite
