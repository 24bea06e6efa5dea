#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "config/config.pb.h"

namespace rollout::backup {

/*
  One persistent store's export/import pair.

  Export writes a consistent point-in-time snapshot of the store to
  `artifact` (a file or a directory, at the adapter's choice); Import
  replaces the store's contents with an artifact. Both are idempotent
  and bounded by `timeout`. Failures throw util::BackupError.
*/
class StoreAdapter {
 public:
  virtual ~StoreAdapter() = default;

  virtual const std::string& Id() const = 0;

  virtual void Export(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) = 0;

  virtual void Import(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) = 0;

  // Adapter-level sanity check of a freshly written artifact.
  virtual bool CheckArtifact(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) = 0;

  // Readiness of the live store.
  virtual bool Probe(std::chrono::milliseconds timeout) = 0;

  // Whether Migrate has schema changes to apply for `target_version`.
  virtual bool HasMigration(const std::string& /*target_version*/) const {
    return false;
  }

  // Brings the live store's schema to what `target_version` expects.
  virtual void Migrate(const std::string& /*target_version*/, std::chrono::milliseconds /*timeout*/) {
  }
};

// export_command / import_command / probe_command / migrate_command shell
// templates with a `{path}` placeholder for the artifact and `{version}`
// for the migration target.
class CommandStoreAdapter final : public StoreAdapter {
 public:
  explicit CommandStoreAdapter(const rollout::runtime::config::StoreConfig& config);

  const std::string& Id() const override {
    return id_;
  }

  void Export(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) override;
  void Import(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) override;
  bool CheckArtifact(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) override;
  bool Probe(std::chrono::milliseconds timeout) override;
  bool HasMigration(const std::string& target_version) const override;
  void Migrate(const std::string& target_version, std::chrono::milliseconds timeout) override;

 private:
  std::string id_;
  std::string export_command_;
  std::string import_command_;
  std::string probe_command_;
  std::string migrate_command_;
  std::string path_;
};

// A sqlite database file, copied with the online backup API. Migrations
// are `<migrations_dir>/<version>.sql`, run in one transaction.
class SqliteStoreAdapter final : public StoreAdapter {
 public:
  explicit SqliteStoreAdapter(const rollout::runtime::config::StoreConfig& config);

  const std::string& Id() const override {
    return id_;
  }

  void Export(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) override;
  void Import(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) override;
  bool CheckArtifact(const std::filesystem::path& artifact, std::chrono::milliseconds timeout) override;
  bool Probe(std::chrono::milliseconds timeout) override;
  bool HasMigration(const std::string& target_version) const override;
  void Migrate(const std::string& target_version, std::chrono::milliseconds timeout) override;

 private:
  std::filesystem::path MigrationScript(const std::string& target_version) const;

  std::string           id_;
  std::string           path_;
  std::filesystem::path migrations_dir_;
};

std::shared_ptr<StoreAdapter> MakeStoreAdapter(const rollout::runtime::config::StoreConfig& config);

} // namespace rollout::backup
