#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

namespace rollout::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open session database " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + msg);
  }
}

int SqliteDB::UserVersion() {
  Statement st(db_, "PRAGMA user_version;");
  if (st.Step() != SQLITE_ROW) {
    throw std::runtime_error(path_ + ": cannot read schema version: " + sqlite3_errmsg(db_));
  }
  return std::stoi(st.Text(0));
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  // Readers (status, list) proceed while an orchestrator writes.
  Exec("PRAGMA journal_mode=WAL;");
  // A phase record is durable before the phase is acted on.
  Exec("PRAGMA synchronous=FULL;");
  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");
}

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  sqlite3_finalize(st_);
}

Statement& Statement::Bind(int index, const std::string& value) {
  ThrowIf(sqlite3_bind_text(st_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT), db_, "sqlite bind");
  return *this;
}

Statement& Statement::Bind(int index, std::int64_t value) {
  ThrowIf(sqlite3_bind_int64(st_, index, static_cast<sqlite3_int64>(value)), db_, "sqlite bind");
  return *this;
}

int Statement::Step() {
  return sqlite3_step(st_);
}

std::string Statement::Text(int column) const {
  const unsigned char* text = sqlite3_column_text(st_, column);
  if (!text) return {};
  return {reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(st_, column))};
}

} // namespace rollout::db::sqlite
