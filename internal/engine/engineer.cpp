#include "engineer.hpp"

#include "internal/beads/fields.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace refinery::engine {

using observability::StringField;

Engineer::Engineer(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<queue::QueueLister> lister,
                   std::shared_ptr<MergeProcessor> processor, std::shared_ptr<OutcomeHandler> outcomes,
                   std::shared_ptr<notify::Notifier> notifier, EngineerOptions options, NowFn now)
    : store_(std::move(store)),
      lister_(std::move(lister)),
      processor_(std::move(processor)),
      outcomes_(std::move(outcomes)),
      notifier_(std::move(notifier)),
      options_(std::move(options)),
      now_(std::move(now)) {
  if (!store_ || !lister_ || !processor_ || !outcomes_) {
    throw util::InvalidArgument("engineer needs issue store, lister, processor and outcome handler");
  }
  if (options_.rig_name.empty()) throw util::InvalidArgument("engineer needs a rig name");
  options_.weights.Validate();
  claim_identity_ = options_.rig_name + "/refinery";
}

std::vector<queue::RankedMR> Engineer::ListQueue() {
  const auto now = now_();
  return queue::RankByScore(lister_->ListReady(now), now, options_.weights);
}

std::vector<queue::MRInfo> Engineer::ListBlocked() {
  return lister_->ListBlocked();
}

std::vector<queue::MRInfo> Engineer::ListAllOpen() {
  return lister_->ListAllOpen();
}

std::vector<queue::MRAnomaly> Engineer::ListAnomalies() {
  return lister_->ListQueueAnomalies(now_());
}

void Engineer::ClaimMR(const std::string& mr_id, const std::string& worker_id) {
  beads::UpdateOptions update;
  update.assignee = worker_id;
  beads::ThrowIfStoreError(store_->Update(mr_id, update), "claim MR " + mr_id);
}

void Engineer::ReleaseMR(const std::string& mr_id) {
  beads::UpdateOptions update;
  update.assignee = std::string{};
  beads::ThrowIfStoreError(store_->Update(mr_id, update), "release MR " + mr_id);
}

ProcessOutcome Engineer::ProcessNext(const util::Context& ctx, const std::unordered_set<std::string>& skip) {
  std::lock_guard lock(process_mutex_);
  ctx.ThrowIfCancelled("process next MR");

  ProcessOutcome outcome;
  const auto     ranked = ListQueue();
  if (ranked.empty()) {
    REFINERY_LOG_DEBUG("merge queue empty", {StringField("rig", options_.rig_name)});
    return outcome;
  }

  for (const auto& candidate : ranked) {
    if (skip.count(candidate.mr.id) > 0) continue;
    try {
      ClaimMR(candidate.mr.id, claim_identity_);
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to claim MR, trying next", {StringField("mr", candidate.mr.id), StringField("error", e.what())});
      continue;
    }
    outcome.mr = candidate.mr;
    break;
  }
  if (outcome.mr.id.empty()) return outcome;

  outcome.processed = true;
  auto& mr          = outcome.mr;
  if (mr.target.empty()) mr.target = processor_->Options().default_branch;

  REFINERY_LOG_INFO("claimed MR", {StringField("mr", mr.id), StringField("branch", mr.branch), StringField("target", mr.target),
                                   observability::IntField("priority", mr.priority)});

  outcome.result = processor_->Process(ctx, mr);

  if (outcome.result.success) {
    outcomes_->HandleSuccess(mr, outcome.result);
    return outcome;
  }

  // an interrupted attempt says nothing about the MR
  if (ctx.IsCancelled()) {
    REFINERY_LOG_INFO("merge attempt interrupted", {StringField("mr", mr.id), StringField("error", outcome.result.error)});
  } else {
    outcome.disposition = outcomes_->HandleFailure(mr, outcome.result);
  }
  try {
    ReleaseMR(mr.id);
  } catch (const std::exception& e) {
    REFINERY_LOG_WARN("failed to release claim", {StringField("mr", mr.id), StringField("error", e.what())});
  }
  return outcome;
}

queue::MRInfo Engineer::FindMR(const std::string& id_or_branch) {
  if (id_or_branch.empty()) throw util::InvalidArgument("MR id or branch is required");

  const auto open = lister_->ListAllOpen();
  for (const auto& mr : open) {
    if (mr.id == id_or_branch || mr.branch == id_or_branch || mr.branch == "polecat/" + id_or_branch) return mr;
  }
  for (const auto& mr : open) {
    if (mr.id.find(id_or_branch) != std::string::npos) return mr;
  }

  // closed MRs are only reachable by exact id
  if (auto issue = store_->Show(id_or_branch); issue && issue->type == beads::model::kTypeMergeRequest) {
    return queue::IssueToMRInfo(*issue, beads::ParseMRFields(*issue).value_or(beads::MRFields{}));
  }
  throw util::NotFound("merge request " + id_or_branch);
}

queue::MRInfo Engineer::RejectMR(const std::string& id_or_branch, const std::string& reason, bool notify_worker) {
  auto mr    = FindMR(id_or_branch);
  auto issue = store_->Show(mr.id);
  if (!issue) throw util::NotFound("merge request " + mr.id);
  if (!issue->IsOpen()) {
    throw util::InvalidState("MR " + mr.id + " is already closed with reason: " + issue->close_reason);
  }

  beads::ThrowIfStoreError(store_->CloseWithReason(mr.id, "rejected"), "reject MR " + mr.id);
  REFINERY_LOG_INFO("rejected MR", {StringField("mr", mr.id), StringField("branch", mr.branch), StringField("reason", reason)});

  if (notify_worker && notifier_ && !mr.worker.empty()) {
    try {
      notifier_->Send(notify::NewRejectedMessage(options_.rig_name, mr.worker, mr.branch, mr.source_issue, reason));
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to notify worker of rejection", {StringField("worker", mr.worker), StringField("error", e.what())});
    }
  }
  return mr;
}

queue::MRInfo Engineer::RetryMR(const std::string& id_or_branch) {
  auto mr    = FindMR(id_or_branch);
  auto issue = store_->Show(mr.id);
  if (!issue || !issue->IsOpen()) throw util::InvalidState("MR " + mr.id + " is not open");

  if (!mr.assignee.empty()) {
    ReleaseMR(mr.id);
    REFINERY_LOG_INFO("cleared claim for retry", {StringField("mr", mr.id), StringField("previous", mr.assignee)});
    mr.assignee.clear();
  }
  return mr;
}

} // namespace refinery::engine
