#include "internal/beads/fields.hpp"
#include "internal/queue/anomaly_detector.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using refinery::beads::model::Issue;
using refinery::queue::BranchPresence;
using refinery::queue::DetectQueueAnomalies;
using refinery::queue::MRAnomaly;
namespace model = refinery::beads::model;
namespace util  = refinery::util;

const auto kNow = util::TimePoint(seconds(1'800'000'000));

Issue Claimed(const std::string& id, const std::string& branch, util::Duration idle) {
  refinery::beads::MRFields fields;
  fields.branch = branch;
  fields.target = "main";

  Issue issue;
  issue.id          = id;
  issue.type        = model::kTypeMergeRequest;
  issue.description = refinery::beads::FormatMRDescription(fields);
  issue.assignee    = "gastown/refinery";
  issue.updated_at  = util::FormatRfc3339(kNow - idle);
  return issue;
}

BranchPresence Present(const std::string&) {
  BranchPresence p;
  p.local = true;
  return p;
}

const MRAnomaly* Find(const std::vector<MRAnomaly>& anomalies, const std::string& id, const std::string& type) {
  for (const auto& a : anomalies) {
    if (a.id == id && a.type == type) return &a;
  }
  return nullptr;
}

void TestStaleClaimThresholds() {
  std::vector<Issue> issues{
      Claimed("gt-young", "b/young", hours(2) - seconds(1)),
      Claimed("gt-warn", "b/warn", hours(2)),
      Claimed("gt-almost", "b/almost", hours(6) - seconds(1)),
      Claimed("gt-crit", "b/crit", hours(6)),
  };

  const auto anomalies = DetectQueueAnomalies(issues, kNow, Present);
  assert(anomalies.size() == 3);
  assert(Find(anomalies, "gt-young", "stale-claim") == nullptr);

  const auto* warn = Find(anomalies, "gt-warn", "stale-claim");
  assert(warn && warn->severity == "warning");
  assert(warn->assignee == "gastown/refinery");
  assert(warn->age == hours(2));

  const auto* almost = Find(anomalies, "gt-almost", "stale-claim");
  assert(almost && almost->severity == "warning");

  const auto* crit = Find(anomalies, "gt-crit", "stale-claim");
  assert(crit && crit->severity == "critical");
  assert(crit->branch == "b/crit");
}

void TestUnclaimedAndUnparsableNeverStale() {
  auto unclaimed     = Claimed("gt-free", "b/free", hours(12));
  unclaimed.assignee = "";
  auto garbled       = Claimed("gt-garbled", "b/garbled", hours(0));
  garbled.updated_at = "last tuesday";

  const auto anomalies = DetectQueueAnomalies({unclaimed, garbled}, kNow, Present);
  assert(anomalies.empty());
}

void TestOrphanedBranchRegardlessOfClaim() {
  auto orphan_unclaimed     = Claimed("gt-orphan", "b/orphan", hours(0));
  orphan_unclaimed.assignee = "";
  auto orphan_stale         = Claimed("gt-orphan-stale", "b/orphan-stale", hours(7));
  auto remote_only          = Claimed("gt-remote", "b/remote", hours(0));

  const std::set<std::string> remote{"b/remote"};
  auto presence = [&](const std::string& branch) {
    BranchPresence p;
    p.remote = remote.count(branch) > 0;
    return p;
  };

  const auto anomalies = DetectQueueAnomalies({orphan_unclaimed, orphan_stale, remote_only}, kNow, presence);

  const auto* orphan = Find(anomalies, "gt-orphan", "orphaned-branch");
  assert(orphan && orphan->severity == "critical");
  assert(Find(anomalies, "gt-orphan-stale", "orphaned-branch") != nullptr);
  assert(Find(anomalies, "gt-orphan-stale", "stale-claim") != nullptr);
  assert(Find(anomalies, "gt-remote", "orphaned-branch") == nullptr);
  assert(anomalies.size() == 3);
}

void TestBranchCheckErrorSuppressesOrphanSignal() {
  auto issue = Claimed("gt-x", "b/x", hours(3));
  auto fails = [](const std::string&) -> BranchPresence { throw util::GitError("git show-ref: fatal"); };

  const auto anomalies = DetectQueueAnomalies({issue}, kNow, fails);
  assert(anomalies.size() == 1);
  assert(anomalies[0].type == "stale-claim");
}

void TestSkipsClosedAndBranchlessIssues() {
  auto closed   = Claimed("gt-closed", "b/closed", hours(10));
  closed.status = model::kStatusClosed;

  Issue no_fields;
  no_fields.id          = "gt-nofields";
  no_fields.type        = model::kTypeMergeRequest;
  no_fields.description = "just prose";
  no_fields.assignee    = "someone";
  no_fields.updated_at  = util::FormatRfc3339(kNow - hours(10));

  auto missing = [](const std::string&) { return BranchPresence{}; };
  assert(DetectQueueAnomalies({closed, no_fields}, kNow, missing).empty());
}

} // namespace

int main() {
  TestStaleClaimThresholds();
  TestUnclaimedAndUnparsableNeverStale();
  TestOrphanedBranchRegardlessOfClaim();
  TestBranchCheckErrorSuppressesOrphanSignal();
  TestSkipsClosedAndBranchlessIssues();

  std::cout << "refinery_unit_anomaly_detector: pass\n";
  return 0;
}
