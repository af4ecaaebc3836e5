#pragma once

#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace ledger::db {

/*
  Portable result of a repository write.

  Backends translate sqlite/pqxx errors into these codes; nothing
  above internal/db sees a backend error type. Reads do not return
  a Result, they throw util::StorageFailure directly.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  // optimistic check lost (stream version moved, row changed underneath)
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

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

/*
  Throws the util exception for a failed write. Conflicts on append
  are handled by the journal before this is reached; anywhere else
  they count as storage failures and go through the retry wrapper.
*/
inline void ThrowIfError(const Result& result, const std::string& op) {
  if (result) return;

  const std::string msg = op + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(msg);
    case ErrorCode::Unsupported:
      throw util::InvalidState(msg);
    default:
      throw util::StorageFailure(msg);
  }
}

} // namespace ledger::db
