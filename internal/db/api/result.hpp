#pragma once

#include <string>

namespace bidsub::db {

/*
  Backend-neutral outcome of a repository call.

  Backends map their native errors onto ErrorCode; nothing above db/
  sees sqlite status codes. The orchestrator turns NotFound into
  NotFoundError, AlreadyExists and Conflict into InvalidStateError, and
  everything else into a job store fault.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ErrorCodeName(ErrorCode code);

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

  // "io_error: disk full"
  std::string Describe() const;
};

} // namespace bidsub::db
