#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"
#include "rollout/manager/v1/session.pb.h"
#include "transaction.hpp"

namespace rollout::db {

using SessionRecord = rollout::manager::v1::UpdateSession;

/*
  Durable store of update session records.

  A record is the full UpdateSession message. Writers must call through a
  transaction from Begin(); ListSessions returns records ordered by
  started_at, oldest first.
*/
class SessionRepository {
 public:
  virtual ~SessionRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // AlreadyExists when the id is taken.
  virtual Result InsertSession(Transaction& tx, const SessionRecord& session) = 0;

  // NotFound when the id is unknown.
  virtual Result ReplaceSession(Transaction& tx, const SessionRecord& session) = 0;

  virtual std::optional<SessionRecord> GetSession(Transaction& tx, const std::string& session_id) = 0;

  virtual std::vector<SessionRecord> ListSessions(Transaction& tx) = 0;

  virtual Result DeleteSession(Transaction& tx, const std::string& session_id) = 0;
};

inline void SortByStartTime(std::vector<SessionRecord>& sessions) {
  std::sort(sessions.begin(), sessions.end(), [](const SessionRecord& a, const SessionRecord& b) {
    const auto as = a.started_at().seconds() * 1000000000LL + a.started_at().nanos();
    const auto bs = b.started_at().seconds() * 1000000000LL + b.started_at().nanos();
    if (as != bs) return as < bs;
    return a.session_id() < b.session_id();
  });
}

} // namespace rollout::db
