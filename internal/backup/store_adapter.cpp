#include "store_adapter.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace rollout::backup {

namespace {

std::string ExpandStoreTemplate(const std::string& command, const std::string& path, const std::filesystem::path& artifact) {
  return util::ExpandTemplate(util::ExpandTemplate(command, "path", artifact.string()), "store", path);
}

void RunStoreCommand(const std::string& store_id, const std::string& what, const std::string& command,
                     std::chrono::milliseconds timeout) {
  auto result = util::RunShell(command, timeout);
  if (result.timed_out) {
    throw util::BackupError(store_id + " " + what + " timed out after " + std::to_string(timeout.count()) + "ms");
  }
  if (result.exit_code != 0) {
    throw util::BackupError(store_id + " " + what + " failed with exit code " + std::to_string(result.exit_code) +
                            ": " + util::Summarize(result));
  }
}

// RAII sqlite handle for one adapter operation.
class Connection {
 public:
  Connection(const std::string& path, int flags, std::chrono::milliseconds timeout) {
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
      std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
      Close();
      throw util::BackupError("open " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
  }

  ~Connection() {
    Close();
  }

  Connection(const Connection&)            = delete;
  Connection& operator=(const Connection&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

 private:
  void Close() {
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
  }

  sqlite3* db_ = nullptr;
};

void Copy(sqlite3* from, sqlite3* to, const std::string& what) {
  sqlite3_backup* op = sqlite3_backup_init(to, "main", from, "main");
  if (!op) {
    throw util::BackupError(what + ": " + sqlite3_errmsg(to));
  }
  const int step = sqlite3_backup_step(op, -1);
  const int rc   = sqlite3_backup_finish(op);
  if (step != SQLITE_DONE || rc != SQLITE_OK) {
    throw util::BackupError(what + ": " + sqlite3_errmsg(to));
  }
}

bool QuickCheck(const std::string& path, std::chrono::milliseconds timeout) {
  Connection    conn(path, SQLITE_OPEN_READONLY, timeout);
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(conn.Handle(), "PRAGMA quick_check;", -1, &st, nullptr) != SQLITE_OK) {
    return false;
  }
  bool ok = false;
  if (sqlite3_step(st) == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(st, 0);
    ok                        = text && std::string(reinterpret_cast<const char*>(text)) == "ok";
  }
  sqlite3_finalize(st);
  return ok;
}

} // namespace

CommandStoreAdapter::CommandStoreAdapter(const rollout::runtime::config::StoreConfig& config)
    : id_(config.id()),
      export_command_(config.export_command()),
      import_command_(config.import_command()),
      probe_command_(config.probe_command()),
      migrate_command_(config.migrate_command()),
      path_(config.path()) {
  if (export_command_.empty() || import_command_.empty()) {
    throw std::invalid_argument("store " + id_ + " needs export_command and import_command");
  }
}

void CommandStoreAdapter::Export(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) {
  RunStoreCommand(id_, "export", ExpandStoreTemplate(export_command_, path_, artifact), timeout);
  if (!std::filesystem::exists(artifact)) {
    throw util::BackupError(id_ + " export produced no artifact at " + artifact.string());
  }
}

void CommandStoreAdapter::Import(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) {
  RunStoreCommand(id_, "import", ExpandStoreTemplate(import_command_, path_, artifact), timeout);
}

bool CommandStoreAdapter::CheckArtifact(const std::filesystem::path& artifact, std::chrono::milliseconds) {
  std::error_code ec;
  if (std::filesystem::is_directory(artifact, ec)) {
    return !std::filesystem::is_empty(artifact, ec) && !ec;
  }
  return std::filesystem::is_regular_file(artifact, ec) && std::filesystem::file_size(artifact, ec) > 0 && !ec;
}

bool CommandStoreAdapter::Probe(std::chrono::milliseconds timeout) {
  if (probe_command_.empty()) {
    return true;
  }
  auto result = util::RunShell(util::ExpandTemplate(probe_command_, "store", path_), timeout);
  if (!result.Ok()) {
    observability::LogWarn("store probe failed", {observability::StringField("store", id_),
                                                  observability::BoolField("timed_out", result.timed_out),
                                                  observability::IntField("exit_code", result.exit_code),
                                                  observability::StringField("output", util::Summarize(result))});
  }
  return result.Ok();
}

bool CommandStoreAdapter::HasMigration(const std::string&) const {
  return !migrate_command_.empty();
}

void CommandStoreAdapter::Migrate(const std::string& target_version, std::chrono::milliseconds timeout) {
  if (migrate_command_.empty()) {
    return;
  }
  RunStoreCommand(id_, "migration to " + target_version,
                  util::ExpandTemplate(util::ExpandTemplate(migrate_command_, "version", target_version), "store", path_),
                  timeout);
}

SqliteStoreAdapter::SqliteStoreAdapter(const rollout::runtime::config::StoreConfig& config)
    : id_(config.id()), path_(config.path()), migrations_dir_(config.migrations_dir()) {
  if (path_.empty()) {
    throw std::invalid_argument("sqlite store " + id_ + " needs a path");
  }
}

void SqliteStoreAdapter::Export(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) {
  Connection source(path_, SQLITE_OPEN_READONLY, timeout);
  Connection target(artifact.string(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, timeout);
  Copy(source.Handle(), target.Handle(), id_ + " export");
}

void SqliteStoreAdapter::Import(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) {
  Connection source(artifact.string(), SQLITE_OPEN_READONLY, timeout);
  Connection target(path_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, timeout);
  Copy(source.Handle(), target.Handle(), id_ + " import");
}

bool SqliteStoreAdapter::CheckArtifact(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) {
  try {
    return QuickCheck(artifact.string(), timeout);
  } catch (const util::BackupError& e) {
    observability::LogWarn("sqlite artifact check failed",
                           {observability::StringField("store", id_), observability::StringField("error", e.what())});
    return false;
  }
}

bool SqliteStoreAdapter::Probe(std::chrono::milliseconds timeout) {
  try {
    return QuickCheck(path_, timeout);
  } catch (const util::BackupError& e) {
    observability::LogWarn("sqlite store probe failed",
                           {observability::StringField("store", id_), observability::StringField("error", e.what())});
    return false;
  }
}

std::filesystem::path SqliteStoreAdapter::MigrationScript(const std::string& target_version) const {
  return migrations_dir_ / (target_version + ".sql");
}

bool SqliteStoreAdapter::HasMigration(const std::string& target_version) const {
  if (migrations_dir_.empty()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(MigrationScript(target_version), ec);
}

void SqliteStoreAdapter::Migrate(const std::string& target_version, std::chrono::milliseconds timeout) {
  if (!HasMigration(target_version)) {
    return;
  }
  const auto script = util::ReadFile(MigrationScript(target_version));
  if (!script) {
    throw util::BackupError(id_ + " migration script " + MigrationScript(target_version).string() + " is unreadable");
  }

  Connection conn(path_, SQLITE_OPEN_READWRITE, timeout);
  const auto exec = [&](const std::string& sql) {
    char*     err = nullptr;
    const int rc  = sqlite3_exec(conn.Handle(), sql.c_str(), nullptr, nullptr, &err);
    if (rc == SQLITE_OK) {
      return std::string();
    }
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    return msg;
  };
  const auto rollback = [&] {
    if (auto err = exec("ROLLBACK;"); !err.empty()) {
      observability::LogWarn("sqlite migration rollback failed",
                             {observability::StringField("store", id_), observability::StringField("error", err)});
    }
  };

  if (auto err = exec("BEGIN IMMEDIATE;"); !err.empty()) {
    throw util::BackupError(id_ + " migration to " + target_version + ": " + err);
  }
  if (auto err = exec(*script); !err.empty()) {
    rollback();
    throw util::BackupError(id_ + " migration to " + target_version + " failed, schema left unchanged: " + err);
  }
  if (auto err = exec("COMMIT;"); !err.empty()) {
    rollback();
    throw util::BackupError(id_ + " migration to " + target_version + " could not commit: " + err);
  }
  observability::LogInfo("sqlite migration applied", {observability::StringField("store", id_),
                                                        observability::StringField("script", MigrationScript(target_version).string())});
}

std::shared_ptr<StoreAdapter> MakeStoreAdapter(const rollout::runtime::config::StoreConfig& config) {
  if (config.kind() == "sqlite") {
    return std::make_shared<SqliteStoreAdapter>(config);
  }
  if (config.kind().empty() || config.kind() == "command") {
    return std::make_shared<CommandStoreAdapter>(config);
  }
  throw std::invalid_argument("unknown store kind '" + config.kind() + "' for store " + config.id());
}

} // namespace rollout::backup
