#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace rollout::state {

/*
  Exclusive advisory lock on one deployment target.

  Backed by flock(2) on <lock_dir>/<target>.lock. The kernel drops the
  lock when the holder dies, so a stale lock never outlives its process.
  The file body names the holding session for operators.
*/
class SessionLock {
  // Only TryAcquire and IsHeld construct locks.
  struct Token {
    explicit Token() = default;
  };

 public:
  // nullptr when another holder has the lock.
  static std::unique_ptr<SessionLock> TryAcquire(const std::filesystem::path& path, const std::string& holder);

  // True while some open file description holds the lock, this process included.
  static bool IsHeld(const std::filesystem::path& path);

  // Opens the lock file without locking it.
  SessionLock(Token, std::filesystem::path path);

  ~SessionLock();

  SessionLock(const SessionLock&)            = delete;
  SessionLock& operator=(const SessionLock&) = delete;

  void Release();

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  bool TryLock();

  std::filesystem::path path_;
  int                   fd_ = -1;
};

} // namespace rollout::state
