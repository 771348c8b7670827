#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/beads/memory/memory_issue_store.hpp"
#include "internal/beads/sqlite/sqlite_issue_store.hpp"
#include "internal/convoy/store_convoy_observer.hpp"
#include "internal/db/sqlite/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/engine/merge_processor.hpp"
#include "internal/engine/outcome_handler.hpp"
#include "internal/git/cli_git.hpp"
#include "internal/notify/issue_store_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/queue_lister.hpp"
#include "internal/service/service_context.hpp"
#include "internal/slot/memory_slot_store.hpp"
#include "internal/slot/sqlite_slot_store.hpp"
#include "internal/util/command_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if REFINERY_WITH_GRPC
#include "internal/grpc/queue_server.hpp"
#endif

namespace refinery::factory {

using observability::StringField;

namespace {

struct Stores {
  std::shared_ptr<beads::IssueStore>   issues;
  std::shared_ptr<slot::MergeSlotStore> slots;
};

Stores BuildStores(const refinery::runtime::config::StoreConfig& store) {
  const std::string prefix  = store.issue_prefix().empty() ? "rf" : store.issue_prefix();
  const std::string slot_id = slot::MergeSlotId(prefix);

  if (store.has_sqlite()) {
    if (store.sqlite().path().empty()) throw util::InvalidArgument("store.sqlite.path is required");

    auto db = std::make_shared<db::sqlite::SqliteDB>(store.sqlite().path());
    db::sqlite::EnsureSchema(*db);
    REFINERY_LOG_INFO("opened sqlite store", {StringField("path", store.sqlite().path()), StringField("prefix", prefix)});
    return {std::make_shared<beads::sqlite::SqliteIssueStore>(db, prefix), std::make_shared<slot::SqliteSlotStore>(db, slot_id)};
  }

  REFINERY_LOG_INFO("using in-memory store", {StringField("prefix", prefix)});
  return {std::make_shared<beads::memory::MemoryIssueStore>(prefix), std::make_shared<slot::MemorySlotStore>(slot_id)};
}

} // namespace

slot::MergeSlotOptions MergeSlotOptionsFromProto(const refinery::runtime::config::MergeSlotConfig& proto) {
  slot::MergeSlotOptions options;
  if (proto.has_max_retries()) {
    if (proto.max_retries() < 0) throw util::InvalidArgument("merge_slot.max_retries must not be negative");
    options.max_retries = proto.max_retries();
  }
  if (!proto.initial_backoff().empty()) options.initial_backoff = util::ParseDuration(proto.initial_backoff());
  if (!proto.max_backoff().empty()) options.max_backoff = util::ParseDuration(proto.max_backoff());
  if (options.initial_backoff <= util::Duration::zero() || options.max_backoff < options.initial_backoff) {
    throw util::InvalidArgument("merge_slot backoff must be positive with max_backoff >= initial_backoff");
  }
  return options;
}

queue::ScoreWeights ScoreWeightsFromProto(const refinery::runtime::config::ScoringConfig& proto) {
  queue::ScoreWeights weights;
  if (proto.has_base_score()) weights.base_score = proto.base_score();
  if (proto.has_priority_weight()) weights.priority_weight = proto.priority_weight();
  if (proto.has_age_weight_per_hour()) weights.age_weight_per_hour = proto.age_weight_per_hour();
  if (proto.has_convoy_age_weight_per_hour()) weights.convoy_age_weight_per_hour = proto.convoy_age_weight_per_hour();
  if (proto.has_retry_weight()) weights.retry_weight = proto.retry_weight();
  if (proto.has_max_retry_bonus()) weights.max_retry_bonus = proto.max_retry_bonus();
  weights.Validate();
  return weights;
}

/*
    Build full application dependency graph
*/
Application Build(const refinery::runtime::config::RuntimeConfig& config) {
  const auto& rig = config.rig();
  if (rig.name().empty()) throw util::InvalidArgument("rig.name is required");
  if (rig.work_dir().empty()) throw util::InvalidArgument("rig.work_dir is required");

  const std::string remote         = rig.remote().empty() ? "origin" : rig.remote();
  const std::string default_branch = rig.default_branch().empty() ? "main" : rig.default_branch();

  Application app;
  app.merge_queue = config::MergeQueueConfigFromProto(config.merge_queue());
  const auto& mq  = app.merge_queue;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto stores = BuildStores(config.store());
  app.store   = stores.issues;
  app.slots   = stores.slots;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  // cancelled by QueueWorker::Stop
  auto shutdown = std::make_shared<util::Context>();
  auto runner   = std::make_shared<util::ProcessCommandRunner>();
  auto git      = std::make_shared<git::CliGit>(runner, rig.work_dir(), mq.git_timeout, shutdown);

  auto slots = std::make_shared<slot::MergeSlotClient>(stores.slots, rig.name(), MergeSlotOptionsFromProto(config.merge_slot()));

  auto notifier = std::make_shared<notify::IssueStoreNotifier>(stores.issues);

  convoy::FeedOptions feed;
  feed.command  = config.convoy().feed_command();
  feed.work_dir = rig.work_dir();
  auto convoys  = std::make_shared<convoy::StoreConvoyObserver>(stores.issues, runner, feed);

  // ------------------------------------------------------------------
  // Queue engine
  // ------------------------------------------------------------------
  auto lister = std::make_shared<queue::QueueLister>(stores.issues, git, mq.stale_claim_timeout, remote);

  engine::ProcessorOptions processor_options;
  processor_options.default_branch    = default_branch;
  processor_options.remote            = remote;
  processor_options.run_tests         = mq.run_tests;
  processor_options.test_command      = mq.test_command;
  processor_options.retry_flaky_tests = mq.retry_flaky_tests;
  processor_options.test_timeout      = mq.test_timeout;
  auto processor = std::make_shared<engine::MergeProcessor>(git, slots, runner, processor_options);

  engine::OutcomeOptions outcome_options;
  outcome_options.rig_name               = rig.name();
  outcome_options.remote                 = remote;
  outcome_options.recipient              = config.notify().recipient();
  outcome_options.delete_merged_branches = mq.delete_merged_branches;
  auto outcomes = std::make_shared<engine::OutcomeHandler>(stores.issues, git, slots, notifier, convoys, outcome_options);

  engine::EngineerOptions engineer_options;
  engineer_options.rig_name = rig.name();
  engineer_options.weights  = ScoreWeightsFromProto(config.scoring());
  app.engineer = std::make_shared<engine::Engineer>(stores.issues, lister, processor, outcomes, notifier, engineer_options);

  engine::QueueWorkerOptions worker_options;
  worker_options.poll_interval  = mq.poll_interval;
  worker_options.max_concurrent = mq.max_concurrent;
  app.worker = std::make_shared<engine::QueueWorker>(app.engineer, worker_options, shutdown);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engineer      = app.engineer;
  app.queue_service = std::make_shared<service::QueueService>(ctx);

#if REFINERY_WITH_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::QueueServer>(app.queue_service));
#endif

  REFINERY_LOG_INFO("refinery assembled", {StringField("rig", rig.name()), StringField("work_dir", rig.work_dir()),
                                           StringField("default_branch", default_branch), StringField("on_conflict", mq.on_conflict)});
  return app;
}

} // namespace refinery::factory
