#include "merge_queue_config.hpp"

#include "internal/util/errors.hpp"

namespace refinery::config {

namespace {

util::Duration DurationOr(const std::string& value, util::Duration fallback, const char* name) {
  if (value.empty()) {
    return fallback;
  }
  try {
    return util::ParseDuration(value);
  } catch (const util::InvalidArgument& e) {
    throw util::InvalidArgument(std::string("merge_queue.") + name + ": " + e.what());
  }
}

} // namespace

MergeQueueConfig MergeQueueConfigFromProto(const refinery::runtime::config::MergeQueueConfig& proto) {
  MergeQueueConfig cfg;

  if (proto.has_enabled()) cfg.enabled = proto.enabled();
  if (!proto.on_conflict().empty()) cfg.on_conflict = proto.on_conflict();
  if (proto.has_run_tests()) cfg.run_tests = proto.run_tests();
  cfg.test_command = proto.test_command();
  if (proto.has_delete_merged_branches()) cfg.delete_merged_branches = proto.delete_merged_branches();
  if (proto.has_retry_flaky_tests()) cfg.retry_flaky_tests = proto.retry_flaky_tests();
  if (proto.has_max_concurrent()) cfg.max_concurrent = proto.max_concurrent();

  cfg.poll_interval       = DurationOr(proto.poll_interval(), cfg.poll_interval, "poll_interval");
  cfg.stale_claim_timeout = DurationOr(proto.stale_claim_timeout(), cfg.stale_claim_timeout, "stale_claim_timeout");
  cfg.test_timeout        = DurationOr(proto.test_timeout(), cfg.test_timeout, "test_timeout");
  cfg.git_timeout         = DurationOr(proto.git_timeout(), cfg.git_timeout, "git_timeout");

  if (cfg.on_conflict != "assign_back" && cfg.on_conflict != "auto_rebase") {
    throw util::InvalidArgument("merge_queue.on_conflict: unknown strategy " + cfg.on_conflict);
  }
  if (cfg.stale_claim_timeout <= util::Duration::zero()) {
    throw util::InvalidArgument("merge_queue.stale_claim_timeout must be positive");
  }
  if (cfg.poll_interval <= util::Duration::zero()) {
    throw util::InvalidArgument("merge_queue.poll_interval must be positive");
  }
  if (cfg.max_concurrent < 1) {
    throw util::InvalidArgument("merge_queue.max_concurrent must be at least 1");
  }
  if (cfg.retry_flaky_tests < 0) {
    throw util::InvalidArgument("merge_queue.retry_flaky_tests must not be negative");
  }

  return cfg;
}

} // namespace refinery::config
