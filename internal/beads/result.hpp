#pragma once

#include <string>

namespace refinery::beads {

/*
  Portable store result codes.

  Backends translate their own failures into these. Upper layers never see
  sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

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

// Throws util::NotFound / util::InvalidArgument / util::StoreError for a failed result.
void ThrowIfStoreError(const Result& r, const std::string& what);

} // namespace refinery::beads
