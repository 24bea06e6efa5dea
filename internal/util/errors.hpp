#pragma once

#include <stdexcept>
#include <string>

namespace rollout::util {

/*
  Central error types.

  Phase errors are caught by the orchestrator and turned into phase
  outcomes; the rest get translated to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another non-terminal session already holds the deployment target lock.
class SessionConflict : public std::runtime_error {
 public:
  explicit SessionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An external command failed to run, exited non-zero or timed out.
class CommandError : public std::runtime_error {
 public:
  CommandError(const std::string& msg, bool timed_out = false) : std::runtime_error(msg), timed_out_(timed_out) {
  }

  bool TimedOut() const {
    return timed_out_;
  }

 private:
  bool timed_out_;
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BackupError : public std::runtime_error {
 public:
  explicit BackupError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Trust failure. Never retried.
class VerificationError : public std::runtime_error {
 public:
  explicit VerificationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeploymentError : public std::runtime_error {
 public:
  explicit DeploymentError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class HealthCheckError : public std::runtime_error {
 public:
  explicit HealthCheckError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Rollback could not restore a healthy prior state. Requires an operator.
class RollbackError : public std::runtime_error {
 public:
  explicit RollbackError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A phase ran past its timeout.
class PhaseTimeout : public std::runtime_error {
 public:
  explicit PhaseTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operator abort observed at a phase boundary.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace rollout::util
