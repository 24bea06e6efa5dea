#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace rollout::db::sqlite {

/*
  One sqlite connection to the session database.

  The parent directory is created on open. The connection is shared by
  every transaction of a repository; the state manager serializes them.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Pragmas, schema and transaction control.
  void Exec(const std::string& sql);

  int  UserVersion();
  void SetUserVersion(int version);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Prepared statement, finalized on destruction.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Bind(int index, const std::string& value);
  Statement& Bind(int index, std::int64_t value);

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

  std::string Text(int column) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

} // namespace rollout::db::sqlite
