#include "internal/db/api/result.hpp"

namespace relay::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace relay::db
