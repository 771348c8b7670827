#include "result.hpp"

#include "internal/util/errors.hpp"

namespace refinery::beads {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfStoreError(const Result& r, const std::string& what) {
  if (r) return;

  const std::string message = what + ": " + (r.message.empty() ? ToString(r.code) : r.message);
  switch (r.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::InvalidArgument:
      throw util::InvalidArgument(message);
    default:
      throw util::StoreError(message);
  }
}

} // namespace refinery::beads
