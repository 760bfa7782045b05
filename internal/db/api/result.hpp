#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ridedispatch::db {

/*
  Backend-neutral outcome of a repository call.

  Every backend maps its native failures (pqxx exceptions, sqlite return
  codes, memory-store checks) onto ErrorCode. Conflict is the lost
  compare-and-set of a ride status or driver availability update; callers
  treat it as a normal outcome, not an error.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,
  ConstraintViolation,

  IOError,
  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
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

// For writes that cannot legitimately fail once the caller holds the ride.
inline void ThrowIfError(const Result& result, const std::string& what) {
  if (result) return;
  throw std::runtime_error(what + ": " + std::string(ToString(result.code)) +
                           (result.message.empty() ? "" : " (" + result.message + ")"));
}

} // namespace ridedispatch::db
