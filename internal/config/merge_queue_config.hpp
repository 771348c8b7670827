#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace refinery::config {

/*
  Typed view of the merge_queue section with defaults applied.
*/
struct MergeQueueConfig {
  bool        enabled = true;
  std::string on_conflict{"assign_back"};
  bool        run_tests = true;
  std::string test_command;
  bool        delete_merged_branches = true;
  int         retry_flaky_tests      = 1;
  int         max_concurrent         = 1;

  util::Duration poll_interval       = std::chrono::seconds(30);
  util::Duration stale_claim_timeout = std::chrono::minutes(30);
  util::Duration test_timeout        = std::chrono::minutes(30);
  util::Duration git_timeout         = std::chrono::minutes(5);
};

// Throws util::InvalidArgument on a bad duration, a non-positive stale claim
// timeout or an unknown on_conflict strategy.
MergeQueueConfig MergeQueueConfigFromProto(const refinery::runtime::config::MergeQueueConfig& proto);

} // namespace refinery::config
