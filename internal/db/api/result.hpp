#pragma once

#include <string>

namespace demonlist::db {

/*
  Outcome of a repository write.

  Commands inspect NotFound and AlreadyExists to raise the matching
  domain error (ModelNotFound, NameTaken, DemonExists). Every other code
  is a storage failure and goes through ThrowIfDbError. sqlite and pqxx
  error types stop at the backend.
*/

enum class ErrorCode {
  OK = 0,

  // row level, meaningful to callers
  NotFound,
  AlreadyExists,
  ConstraintViolation,

  // backend level
  Busy,
  SerializationFailure,
  IOError,
  Corruption,
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

const char* ToString(ErrorCode code);

// Throws util::DatabaseError for any non-OK result.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace demonlist::db
