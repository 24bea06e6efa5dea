#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "rollout/manager/v1/session.pb.h"
#include "store_adapter.hpp"

namespace rollout::backup {

using rollout::manager::v1::BackupRecord;

struct MigratorOptions {
  std::filesystem::path     dir;
  std::size_t               max_backups = 10;
  std::chrono::milliseconds timeout{300000};
  std::uint64_t             min_free_bytes = 0;
};

/*
  Backup catalog over the configured stores.

  Layout: <dir>/<store_id>/backup-<stamp>/{data, metadata.json}. A
  backup exists once metadata.json is in place; directories without it
  are leftovers of an interrupted export and are ignored.
*/
class DatabaseMigrator {
 public:
  DatabaseMigrator(std::vector<std::shared_ptr<StoreAdapter>> stores, MigratorOptions options);

  // Exports, checksums and verifies one store. A backup that does not
  // verify is deleted and reported as util::BackupError. The export is
  // cut short at `deadline` when one is given.
  BackupRecord Backup(const std::string& store_id, const std::string& reason, util::TimePoint deadline = {});

  // Re-imports `record` after taking a safety backup of the current
  // contents. If the import fails the safety backup is re-imported and
  // util::BackupError is thrown.
  void Restore(const std::string& store_id, const BackupRecord& record);

  bool Verify(const BackupRecord& record) const;

  // Newest first.
  std::vector<BackupRecord> ListBackups(const std::string& store_id) const;

  std::optional<BackupRecord> FindBackup(const std::string& backup_id) const;

  // Deletes the oldest backups beyond max_backups, skipping ids in `keep`.
  std::size_t PruneBackups(const std::string& store_id, const std::set<std::string>& keep);

  bool ProbeStore(const std::string& store_id, std::chrono::milliseconds timeout) const;

  // Stores that carry a schema migration for `target_version`.
  std::vector<std::string> PendingMigrations(const std::string& target_version) const;

  // Applies the store's migration for `target_version`, then requires the
  // store to probe healthy. Returns false when there was nothing to apply.
  // A store left unhealthy is reported as util::BackupError; restoring its
  // data is up to the caller.
  bool MigrateSchema(const std::string& store_id, const std::string& target_version, util::TimePoint deadline = {});

  std::vector<std::string> StoreIds() const;

  // Bytes available to new backups.
  std::uint64_t FreeBytes() const;

  const MigratorOptions& Options() const {
    return options_;
  }

 private:
  StoreAdapter& Store(const std::string& store_id) const;

  std::filesystem::path StoreDir(const std::string& store_id) const;

  std::map<std::string, std::shared_ptr<StoreAdapter>> stores_;
  MigratorOptions                                      options_;
};

// Digest over a file, or over the sorted (path, digest) list of a directory.
std::string ArtifactDigest(const std::filesystem::path& artifact, std::uint64_t* size_bytes);

} // namespace rollout::backup
