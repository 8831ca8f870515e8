#pragma once

#include <string>

namespace todolist::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  The store never depends on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  ConstraintViolation,

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

  bool IsNotFound() const {
    return code == ErrorCode::NotFound;
  }
};

const char* ToString(ErrorCode code);

} // namespace todolist::db
