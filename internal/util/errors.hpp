#pragma once

#include <stdexcept>
#include <string>

namespace refinery::util {

/*
  Central error types.

  These get translated later to gRPC status codes.

  SlotContentionTimeout is transient and the MR stays queued. Everything
  else surfaces to an operator.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backing store (issue tracker, slot store) is broken, not merely busy.
class InfrastructureError : public std::runtime_error {
 public:
  explicit InfrastructureError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public InfrastructureError {
 public:
  explicit StoreError(const std::string& msg) : InfrastructureError(msg) {
  }
};

class GitError : public std::runtime_error {
 public:
  explicit GitError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Merge slot retries exhausted while another holder kept it.
class SlotContentionTimeout : public std::runtime_error {
 public:
  explicit SlotContentionTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace refinery::util
