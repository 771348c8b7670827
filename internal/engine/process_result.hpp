#pragma once

#include <string>

namespace refinery::engine {

// Outcome of one merge attempt.
struct ProcessResult {
  bool        success = false;
  std::string merge_commit;
  std::string error;

  bool conflict     = false;
  bool tests_failed = false;
  bool slot_timeout = false; // push slot contention, not a defect in the branch

  static ProcessResult Failure(std::string error) {
    ProcessResult r;
    r.error = std::move(error);
    return r;
  }
};

} // namespace refinery::engine
