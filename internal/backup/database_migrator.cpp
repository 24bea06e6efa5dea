#include "database_migrator.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace rollout::backup {

namespace {

constexpr const char* kArtifactName = "data";
constexpr const char* kMetadataName = "metadata.json";
constexpr const char* kBackupPrefix = "backup-";

std::filesystem::path ArtifactPath(const BackupRecord& record) {
  return std::filesystem::path(record.location()) / kArtifactName;
}

std::int64_t CreatedNanos(const BackupRecord& record) {
  return record.created_at().seconds() * 1000000000LL + record.created_at().nanos();
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    observability::LogWarn("failed to remove backup directory",
                           {observability::StringField("path", path.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace

std::string ArtifactDigest(const std::filesystem::path& artifact, std::uint64_t* size_bytes) {
  std::uint64_t total = 0;

  if (std::filesystem::is_regular_file(artifact)) {
    total = std::filesystem::file_size(artifact);
    if (size_bytes) *size_bytes = total;
    return util::Sha256File(artifact.string());
  }

  if (!std::filesystem::is_directory(artifact)) {
    throw std::runtime_error("artifact missing: " + artifact.string());
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(artifact)) {
    if (entry.is_regular_file()) files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::string manifest;
  for (const auto& file : files) {
    total += std::filesystem::file_size(file);
    manifest += std::filesystem::relative(file, artifact).generic_string();
    manifest += '\t';
    manifest += util::Sha256File(file.string());
    manifest += '\n';
  }
  if (size_bytes) *size_bytes = total;
  return util::Sha256(manifest);
}

DatabaseMigrator::DatabaseMigrator(std::vector<std::shared_ptr<StoreAdapter>> stores, MigratorOptions options)
    : options_(std::move(options)) {
  for (auto& store : stores) {
    if (!store) continue;
    const auto id = store->Id();
    if (!stores_.emplace(id, std::move(store)).second) {
      throw std::invalid_argument("duplicate store id: " + id);
    }
  }
}

StoreAdapter& DatabaseMigrator::Store(const std::string& store_id) const {
  auto it = stores_.find(store_id);
  if (it == stores_.end()) {
    throw util::NotFound("unknown store: " + store_id);
  }
  return *it->second;
}

std::filesystem::path DatabaseMigrator::StoreDir(const std::string& store_id) const {
  return options_.dir / store_id;
}

std::vector<std::string> DatabaseMigrator::StoreIds() const {
  std::vector<std::string> ids;
  for (const auto& [id, store] : stores_) ids.push_back(id);
  return ids;
}

std::uint64_t DatabaseMigrator::FreeBytes() const {
  std::filesystem::create_directories(options_.dir);
  return std::filesystem::space(options_.dir).available;
}

BackupRecord DatabaseMigrator::Backup(const std::string& store_id, const std::string& reason, util::TimePoint deadline) {
  auto& store = Store(store_id);

  const auto now   = util::Now();
  auto       stamp = util::CompactStamp(now);
  auto       dir   = StoreDir(store_id) / (kBackupPrefix + stamp);
  for (int n = 1; std::filesystem::exists(dir); ++n) {
    dir = StoreDir(store_id) / (kBackupPrefix + stamp + "-" + std::to_string(n));
  }
  std::filesystem::create_directories(dir);

  BackupRecord record;
  record.set_backup_id(store_id + "-" + dir.filename().string().substr(std::char_traits<char>::length(kBackupPrefix)));
  record.set_store_id(store_id);
  record.set_location(dir.string());
  record.set_reason(reason);
  *record.mutable_created_at() = util::ToProto(now);

  observability::LogInfo("backup started", {observability::StringField("store", store_id),
                                             observability::StringField("backup_id", record.backup_id()),
                                             observability::StringField("reason", reason)});

  try {
    store.Export(ArtifactPath(record), util::CapToDeadline(options_.timeout, deadline));

    std::uint64_t size = 0;
    record.set_sha256(ArtifactDigest(ArtifactPath(record), &size));
    record.set_size_bytes(size);
  } catch (const util::BackupError&) {
    RemoveQuietly(dir);
    throw;
  } catch (const std::exception& e) {
    RemoveQuietly(dir);
    throw util::BackupError(store_id + " backup failed: " + e.what());
  }

  if (!Verify(record)) {
    RemoveQuietly(dir);
    throw util::BackupError(store_id + " backup " + record.backup_id() + " failed checksum verification");
  }

  util::WriteFileAtomic(dir / kMetadataName, util::ToJson(record));

  observability::LogInfo("backup created", {observability::StringField("store", store_id),
                                             observability::StringField("backup_id", record.backup_id()),
                                             observability::StringField("sha256", record.sha256()),
                                             observability::IntField("size_bytes", static_cast<std::int64_t>(record.size_bytes()))});
  return record;
}

bool DatabaseMigrator::Verify(const BackupRecord& record) const {
  if (record.sha256().empty() || record.location().empty()) {
    return false;
  }

  try {
    std::uint64_t size   = 0;
    const auto    digest = ArtifactDigest(ArtifactPath(record), &size);
    if (digest != record.sha256() || size != record.size_bytes()) {
      observability::LogWarn("backup checksum mismatch", {observability::StringField("backup_id", record.backup_id()),
                                                           observability::StringField("expected", record.sha256()),
                                                           observability::StringField("actual", digest)});
      return false;
    }
    return Store(record.store_id()).CheckArtifact(ArtifactPath(record), options_.timeout);
  } catch (const std::exception& e) {
    observability::LogWarn("backup verification failed", {observability::StringField("backup_id", record.backup_id()),
                                                            observability::StringField("error", e.what())});
    return false;
  }
}

void DatabaseMigrator::Restore(const std::string& store_id, const BackupRecord& record) {
  if (record.store_id() != store_id) {
    throw util::BackupError("backup " + record.backup_id() + " belongs to store " + record.store_id() + ", not " +
                            store_id);
  }
  if (!Verify(record)) {
    throw util::BackupError("backup " + record.backup_id() + " failed checksum verification, refusing to restore");
  }

  auto& store  = Store(store_id);
  auto  safety = Backup(store_id, "pre-restore-safety");

  observability::LogInfo("restore started", {observability::StringField("store", store_id),
                                              observability::StringField("backup_id", record.backup_id()),
                                              observability::StringField("safety_backup_id", safety.backup_id())});

  try {
    store.Import(ArtifactPath(record), options_.timeout);
  } catch (const util::BackupError& import_error) {
    observability::LogError("restore import failed, re-importing safety backup",
                            {observability::StringField("store", store_id),
                             observability::StringField("backup_id", record.backup_id()),
                             observability::StringField("error", import_error.what())});
    try {
      store.Import(ArtifactPath(safety), options_.timeout);
    } catch (const util::BackupError& safety_error) {
      throw util::BackupError("restore of " + record.backup_id() + " failed (" + import_error.what() +
                              ") and safety backup " + safety.backup_id() + " could not be re-imported (" +
                              safety_error.what() + ")");
    }
    throw util::BackupError("restore of " + record.backup_id() + " failed, store returned to safety backup " +
                            safety.backup_id() + ": " + import_error.what());
  }

  observability::LogInfo("restore completed", {observability::StringField("store", store_id),
                                                observability::StringField("backup_id", record.backup_id())});
}

std::vector<BackupRecord> DatabaseMigrator::ListBackups(const std::string& store_id) const {
  Store(store_id);

  std::vector<BackupRecord> backups;
  const auto                dir = StoreDir(store_id);
  if (!std::filesystem::is_directory(dir)) {
    return backups;
  }

  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_directory() || entry.path().filename().string().rfind(kBackupPrefix, 0) != 0) continue;

    auto metadata = util::ReadFile(entry.path() / kMetadataName);
    if (!metadata) continue;

    BackupRecord record;
    try {
      util::FromJson(*metadata, &record);
    } catch (const std::runtime_error& e) {
      observability::LogWarn("unreadable backup metadata skipped",
                             {observability::StringField("path", entry.path().string()),
                              observability::StringField("error", e.what())});
      continue;
    }
    record.set_location(entry.path().string());
    backups.push_back(std::move(record));
  }

  std::sort(backups.begin(), backups.end(),
            [](const BackupRecord& a, const BackupRecord& b) { return CreatedNanos(a) > CreatedNanos(b); });
  return backups;
}

std::optional<BackupRecord> DatabaseMigrator::FindBackup(const std::string& backup_id) const {
  for (const auto& [id, store] : stores_) {
    for (auto& record : ListBackups(id)) {
      if (record.backup_id() == backup_id) return record;
    }
  }
  return std::nullopt;
}

std::size_t DatabaseMigrator::PruneBackups(const std::string& store_id, const std::set<std::string>& keep) {
  if (options_.max_backups == 0) return 0;

  auto        backups = ListBackups(store_id);
  std::size_t removed = 0;
  std::size_t counted = 0;
  for (const auto& record : backups) {
    if (keep.contains(record.backup_id())) continue;
    if (++counted <= options_.max_backups) continue;

    RemoveQuietly(record.location());
    ++removed;
    observability::LogInfo("backup pruned", {observability::StringField("store", store_id),
                                              observability::StringField("backup_id", record.backup_id())});
  }
  return removed;
}

bool DatabaseMigrator::ProbeStore(const std::string& store_id, std::chrono::milliseconds timeout) const {
  return Store(store_id).Probe(timeout);
}

std::vector<std::string> DatabaseMigrator::PendingMigrations(const std::string& target_version) const {
  std::vector<std::string> ids;
  for (const auto& [id, store] : stores_) {
    if (store->HasMigration(target_version)) ids.push_back(id);
  }
  return ids;
}

bool DatabaseMigrator::MigrateSchema(const std::string& store_id, const std::string& target_version,
                                     util::TimePoint deadline) {
  auto& store = Store(store_id);
  if (!store.HasMigration(target_version)) {
    return false;
  }

  observability::LogInfo("schema migration started", {observability::StringField("store", store_id),
                                                        observability::StringField("version", target_version)});

  store.Migrate(target_version, util::CapToDeadline(options_.timeout, deadline));

  if (!store.Probe(util::CapToDeadline(options_.timeout, deadline))) {
    throw util::BackupError(store_id + " is not healthy after migrating to " + target_version);
  }

  observability::LogInfo("schema migration completed", {observability::StringField("store", store_id),
                                                          observability::StringField("version", target_version)});
  return true;
}

} // namespace rollout::backup
