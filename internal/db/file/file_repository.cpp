#include "file_repository.hpp"

#include <map>
#include <stdexcept>

#include "file_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/atomic_file.hpp"
#include "internal/util/proto_json.hpp"

namespace rollout::db::file {

namespace {

constexpr const char* kExtension = ".json";

} // namespace

FileRepository::FileRepository(std::filesystem::path dir) : dir_(std::move(dir)) {
  std::filesystem::create_directories(dir_);
}

std::unique_ptr<db::Transaction> FileRepository::Begin() {
  return std::make_unique<FileTransaction>(*this);
}

FileTransaction& FileRepository::TX(Transaction& t) {
  return static_cast<FileTransaction&>(t);
}

std::filesystem::path FileRepository::PathFor(const std::string& session_id) const {
  if (session_id.empty() || session_id.find('/') != std::string::npos || session_id.front() == '.') {
    throw std::invalid_argument("invalid session id: " + session_id);
  }
  return dir_ / (session_id + kExtension);
}

std::optional<SessionRecord> FileRepository::Load(const std::filesystem::path& path) const {
  auto contents = util::ReadFile(path);
  if (!contents) return std::nullopt;

  SessionRecord session;
  util::FromJson(*contents, &session);
  return session;
}

Result FileRepository::InsertSession(Transaction& t, const SessionRecord& session) {
  if (GetSession(t, session.session_id())) {
    return Result::Err(ErrorCode::AlreadyExists, "session exists: " + session.session_id());
  }
  TX(t).Staged()[session.session_id()] = session;
  return Result::Ok();
}

Result FileRepository::ReplaceSession(Transaction& t, const SessionRecord& session) {
  if (!GetSession(t, session.session_id())) {
    return Result::Err(ErrorCode::NotFound, "session not found: " + session.session_id());
  }
  TX(t).Staged()[session.session_id()] = session;
  return Result::Ok();
}

std::optional<SessionRecord> FileRepository::GetSession(Transaction& t, const std::string& session_id) {
  auto& staged = TX(t).Staged();
  if (auto it = staged.find(session_id); it != staged.end()) {
    return it->second;
  }
  try {
    return Load(PathFor(session_id));
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

std::vector<SessionRecord> FileRepository::ListSessions(Transaction& t) {
  std::map<std::string, SessionRecord> merged;

  for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
    if (!entry.is_regular_file() || entry.path().extension() != kExtension) continue;
    const auto name = entry.path().filename().string();
    if (name.front() == '.') continue; // in-flight temp file

    try {
      if (auto session = Load(entry.path())) {
        merged[session->session_id()] = std::move(*session);
      }
    } catch (const std::runtime_error& e) {
      observability::LogError("unreadable session record skipped",
                              {observability::StringField("path", entry.path().string()),
                               observability::StringField("error", e.what())});
    }
  }

  for (const auto& [id, record] : TX(t).Staged()) {
    if (record) {
      merged[id] = *record;
    } else {
      merged.erase(id);
    }
  }

  std::vector<SessionRecord> out;
  out.reserve(merged.size());
  for (auto& [id, session] : merged) {
    out.push_back(std::move(session));
  }
  SortByStartTime(out);
  return out;
}

Result FileRepository::DeleteSession(Transaction& t, const std::string& session_id) {
  if (!GetSession(t, session_id)) {
    return Result::Err(ErrorCode::NotFound, "session not found: " + session_id);
  }
  TX(t).Staged()[session_id] = std::nullopt;
  return Result::Ok();
}

} // namespace rollout::db::file
