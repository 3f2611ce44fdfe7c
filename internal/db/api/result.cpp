#include "result.hpp"

namespace liveviewer::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InvalidArgument: return "invalid_argument";
    case ErrorCode::InternalError: break;
  }
  return "internal_error";
}

} // namespace liveviewer::db
