#include "queue_lister.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace refinery::queue {

using observability::StringField;

ClaimCheck IsClaimStale(const std::string& updated_at, util::Duration timeout, util::TimePoint now) {
  ClaimCheck check;
  if (updated_at.empty()) return check;

  const auto t = util::ParseRfc3339(updated_at);
  if (!t) {
    check.unparsable = true;
    return check;
  }
  check.stale = now - *t >= timeout;
  return check;
}

QueueLister::QueueLister(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<git::Git> git, util::Duration stale_claim_timeout,
                         std::string remote)
    : store_(std::move(store)), git_(std::move(git)), stale_claim_timeout_(stale_claim_timeout), remote_(std::move(remote)) {
  if (!store_ || !git_) {
    throw util::InvalidArgument("queue lister needs an issue store and git");
  }
}

std::vector<beads::model::Issue> QueueLister::OpenMergeRequests() {
  beads::ListOptions options;
  options.type   = beads::model::kTypeMergeRequest;
  options.status = beads::model::kStatusOpen;
  return store_->List(options);
}

std::string QueueLister::FirstOpenBlocker(const beads::model::Issue& issue) {
  for (const auto& blocker_id : issue.blocked_by) {
    try {
      auto blocker = store_->Show(blocker_id);
      if (blocker && blocker->IsOpen()) return blocker_id;
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("blocker lookup failed, treating as closed",
                        {StringField("mr", issue.id), StringField("blocker", blocker_id), StringField("error", e.what())});
    }
  }
  return "";
}

std::vector<MRInfo> QueueLister::ListReady(util::TimePoint now) {
  std::vector<MRInfo> mrs;

  for (const auto& issue : OpenMergeRequests()) {
    if (issue.status != beads::model::kStatusOpen) continue;

    if (issue.HasLabel(beads::model::kLabelOwnedDirect)) {
      REFINERY_LOG_INFO("skipping owned-direct MR", {StringField("mr", issue.id)});
      continue;
    }

    const auto fields = beads::ParseMRFields(issue);
    if (!fields) continue;

    if (!FirstOpenBlocker(issue).empty()) continue;

    if (!issue.assignee.empty()) {
      const auto claim = IsClaimStale(issue.updated_at, stale_claim_timeout_, now);
      if (claim.unparsable) {
        REFINERY_LOG_WARN("could not parse updated_at, treating claim as valid", {StringField("mr", issue.id), StringField("updated_at", issue.updated_at)});
      }
      if (!claim.stale) continue;
      REFINERY_LOG_INFO("stale claim detected, eligible for re-claim",
                        {StringField("mr", issue.id), StringField("assignee", issue.assignee), StringField("updated_at", issue.updated_at)});
    }

    mrs.push_back(IssueToMRInfo(issue, *fields));
  }
  return mrs;
}

std::vector<MRInfo> QueueLister::ListBlocked() {
  std::vector<MRInfo> mrs;

  for (const auto& issue : OpenMergeRequests()) {
    if (issue.blocked_by.empty()) continue;

    const auto blocked_by = FirstOpenBlocker(issue);
    if (blocked_by.empty()) continue;

    const auto fields = beads::ParseMRFields(issue);
    if (!fields) continue;

    auto mr       = IssueToMRInfo(issue, *fields);
    mr.blocked_by = blocked_by;
    mrs.push_back(std::move(mr));
  }
  return mrs;
}

std::vector<MRInfo> QueueLister::ListAllOpen() {
  std::vector<MRInfo> mrs;

  for (const auto& issue : OpenMergeRequests()) {
    if (issue.status != beads::model::kStatusOpen) continue;

    const auto fields = beads::ParseMRFields(issue);
    if (!fields) continue;

    auto mr = IssueToMRInfo(issue, *fields);
    if (!fields->branch.empty()) {
      try {
        mr.branch_exists_local = git_->BranchExists(fields->branch);
      } catch (const std::exception& e) {
        REFINERY_LOG_DEBUG("local branch check failed", {StringField("mr", issue.id), StringField("error", e.what())});
      }
      try {
        mr.branch_exists_remote = git_->RemoteTrackingBranchExists(remote_, fields->branch);
      } catch (const std::exception& e) {
        REFINERY_LOG_DEBUG("remote branch check failed", {StringField("mr", issue.id), StringField("error", e.what())});
      }
    }
    mr.blocked_by = FirstOpenBlocker(issue);
    mrs.push_back(std::move(mr));
  }
  return mrs;
}

std::vector<MRAnomaly> QueueLister::ListQueueAnomalies(util::TimePoint now) {
  return DetectQueueAnomalies(OpenMergeRequests(), now, [this](const std::string& branch) {
    BranchPresence presence;
    presence.local  = git_->BranchExists(branch);
    presence.remote = git_->RemoteTrackingBranchExists(remote_, branch);
    return presence;
  });
}

} // namespace refinery::queue
