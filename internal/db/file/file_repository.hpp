#pragma once

#include <filesystem>
#include <mutex>

#include "internal/db/api/session_repository.hpp"

namespace rollout::db::file {

class FileTransaction;

/*
  One JSON document per session under <dir>/<session_id>.json.

  Records are human-readable and survive a crash at any point: each
  write is an atomic replace of a single file. Transactions serialize
  on a process-wide mutex, the cross-process guarantee comes from the
  deployment target lock held by the writer.
*/
class FileRepository final : public db::SessionRepository {
 public:
  explicit FileRepository(std::filesystem::path dir);

  std::unique_ptr<Transaction> Begin() override;

  Result                       InsertSession(Transaction&, const SessionRecord&) override;
  Result                       ReplaceSession(Transaction&, const SessionRecord&) override;
  std::optional<SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<SessionRecord>   ListSessions(Transaction&) override;
  Result                       DeleteSession(Transaction&, const std::string&) override;

  const std::filesystem::path& Directory() const {
    return dir_;
  }

 private:
  friend class FileTransaction;

  static FileTransaction& TX(Transaction& t);

  std::filesystem::path        PathFor(const std::string& session_id) const;
  std::optional<SessionRecord> Load(const std::filesystem::path& path) const;

  std::filesystem::path dir_;
  std::mutex            mutex_;
};

} // namespace rollout::db::file
