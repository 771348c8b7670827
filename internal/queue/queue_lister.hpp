#pragma once

#include <memory>
#include <vector>

#include "internal/beads/issue_store.hpp"
#include "internal/git/git.hpp"
#include "internal/queue/anomaly_detector.hpp"
#include "internal/queue/mr_info.hpp"
#include "internal/util/time.hpp"

namespace refinery::queue {

struct ClaimCheck {
  bool stale      = false;
  bool unparsable = false;
};

// Missing timestamp: not stale. Unparsable: not stale, flagged.
// Stale once `now - updated_at >= timeout`.
ClaimCheck IsClaimStale(const std::string& updated_at, util::Duration timeout, util::TimePoint now);

/*
  Read views over the open merge requests of one rig.
*/
class QueueLister {
 public:
  QueueLister(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<git::Git> git, util::Duration stale_claim_timeout,
              std::string remote = "origin");

  // Unclaimed (or stale-claimed), unblocked, not exempt.
  std::vector<MRInfo> ListReady(util::TimePoint now);

  std::vector<MRInfo> ListBlocked();

  // Unfiltered, with branch presence and first open blocker filled in.
  std::vector<MRInfo> ListAllOpen();

  std::vector<MRAnomaly> ListQueueAnomalies(util::TimePoint now);

  // "" when none is open. Unknown blockers count as closed.
  std::string FirstOpenBlocker(const beads::model::Issue& issue);

 private:
  std::vector<beads::model::Issue> OpenMergeRequests();

  std::shared_ptr<beads::IssueStore> store_;
  std::shared_ptr<git::Git>          git_;
  util::Duration                     stale_claim_timeout_;
  std::string                        remote_;
};

} // namespace refinery::queue
