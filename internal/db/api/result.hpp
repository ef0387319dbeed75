#pragma once

#include <string>

namespace blobkeep::db {

/*
  Outcome of a record index mutation.

  Insert and Delete report expected outcomes (duplicate key, absent
  record) as codes instead of exceptions, because the store treats
  them as control flow: a duplicate ends a Put, an absent record makes
  a Delete benign. Engine-specific codes never leave the index.
*/

enum class ErrorCode {
  OK = 0,

  // expected outcomes
  NotFound,
  AlreadyExists,

  // engine trouble
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,

  // the index was closed before the call
  Closed,

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

  bool Is(ErrorCode c) const {
    return code == c;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

} // namespace blobkeep::db
