#pragma once

#include <string>
#include <utility>

namespace photosift::db {

/*
  Outcome of a repository write.

  Backends map their native failures onto these codes; nothing above
  internal/db sees sqlite return values.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,      // referenced photo is not in the store
  AlreadyExists, // write-once value (decision, hash, path, scan pair) is already set
  ConstraintViolation,

  Busy, // database locked by another process
  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io error";
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

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace photosift::db
