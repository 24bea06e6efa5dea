#pragma once

#include <string>
#include <string_view>

namespace rollout::db {

// Backend-neutral outcome of a session store write. The state manager maps
// these onto its exception types; sqlite and filesystem errors stop here.
enum class ErrorCode {
  OK = 0,
  NotFound,      // no session with that id
  AlreadyExists, // insert of a duplicate session id
  Conflict,      // a concurrent writer committed first
  Busy,          // the store is locked by another process
  IOError,
  Corruption,    // a stored record could not be read back
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace rollout::db
