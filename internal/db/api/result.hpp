#pragma once

#include <string>

namespace relay::db {

/*
  Outcome of one repository call.

  Backends translate their native failures (sqlite result codes, snapshot
  conflicts) into ErrorCode. OffsetStore turns any non-OK result into
  util::StorageError carrying the code, so nothing above it sees sqlite.

  An absent cursor row is not an error: GetCursor reports it as nullopt.
*/
enum class ErrorCode {
  OK = 0,
  Busy,                 // lock held elsewhere or snapshot conflict; retry later
  ConstraintViolation,  // schema check failed (e.g. a second cursor row)
  IOError,              // disk full, read-only file, open failure
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

} // namespace relay::db
