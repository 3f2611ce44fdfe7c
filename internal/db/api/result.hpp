#pragma once

#include <string>
#include <utility>

namespace liveviewer::db {

/*
  Outcome of a viewer store write.

  Backends map their native failures onto ErrorCode so ingestion and reward
  code never see sqlite status values.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  // duplicate viewer key, dangling sign record
  ConstraintViolation,

  IOError,
  Corruption,

  InvalidArgument,
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

} // namespace liveviewer::db
