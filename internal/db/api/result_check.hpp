#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace photosift::db {

/*
  Converts a failed write into the matching util:: exception. Stage runners
  call this so a failed write aborts (and rolls back) the whole stage.
*/
inline void ThrowIfFailed(const Result& result, const std::string& what) {
  if (result) {
    return;
  }
  std::string message = what + " (" + ToString(result.code) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::Busy:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace photosift::db
