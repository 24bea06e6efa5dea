#include "session_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace rollout::state {

namespace {

int OpenLockFile(const std::filesystem::path& path) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::runtime_error("open lock " + path.string() + ": " + std::strerror(errno));
  }
  return fd;
}

} // namespace

SessionLock::SessionLock(Token, std::filesystem::path path) : path_(std::move(path)), fd_(OpenLockFile(path_)) {
}

bool SessionLock::TryLock() {
  while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    if (errno == EINTR) continue;
    if (errno == EWOULDBLOCK) return false;
    throw std::runtime_error("flock " + path_.string() + ": " + std::strerror(errno));
  }
  return true;
}

std::unique_ptr<SessionLock> SessionLock::TryAcquire(const std::filesystem::path& path, const std::string& holder) {
  auto lock = std::make_unique<SessionLock>(Token{}, path);
  if (!lock->TryLock()) {
    return nullptr;
  }

  const std::string body = holder + " pid=" + std::to_string(::getpid()) + "\n";
  if (::ftruncate(lock->fd_, 0) != 0 || ::pwrite(lock->fd_, body.data(), body.size(), 0) < 0) {
    throw std::runtime_error("write lock " + path.string() + ": " + std::strerror(errno));
  }
  return lock;
}

bool SessionLock::IsHeld(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) return false;

  SessionLock check(Token{}, path);
  return !check.TryLock();
}

SessionLock::~SessionLock() {
  Release();
}

void SessionLock::Release() {
  if (fd_ < 0) return;
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

} // namespace rollout::state
