#include "anomaly_detector.hpp"

#include "internal/beads/fields.hpp"
#include "internal/observability/logging.hpp"

namespace refinery::queue {

std::vector<MRAnomaly> DetectQueueAnomalies(const std::vector<beads::model::Issue>& issues, util::TimePoint now,
                                            const BranchPresenceFn& branch_presence) {
  std::vector<MRAnomaly> anomalies;

  for (const auto& issue : issues) {
    if (issue.status != beads::model::kStatusOpen) continue;

    const auto fields = beads::ParseMRFields(issue);
    if (!fields || fields->branch.empty()) continue;

    if (!issue.assignee.empty()) {
      if (const auto updated = util::ParseRfc3339(issue.updated_at)) {
        const auto age = now - *updated;
        if (age >= kStaleClaimWarningAfter) {
          MRAnomaly a;
          a.id       = issue.id;
          a.branch   = fields->branch;
          a.type     = "stale-claim";
          a.severity = age >= kStaleClaimCriticalAfter ? "critical" : "warning";
          a.assignee = issue.assignee;
          a.age      = std::chrono::duration_cast<util::Duration>(age);
          a.detail   = "MR is claimed but not progressing";
          anomalies.push_back(std::move(a));
        }
      }
    }

    BranchPresence presence;
    try {
      presence = branch_presence(fields->branch);
    } catch (const std::exception& e) {
      REFINERY_LOG_DEBUG("branch check failed", {observability::StringField("mr", issue.id), observability::StringField("error", e.what())});
      continue;
    }
    if (!presence.local && !presence.remote) {
      MRAnomaly a;
      a.id       = issue.id;
      a.branch   = fields->branch;
      a.type     = "orphaned-branch";
      a.severity = "critical";
      a.detail   = "MR branch is missing locally and in origin/* tracking refs";
      anomalies.push_back(std::move(a));
    }
  }

  return anomalies;
}

} // namespace refinery::queue
