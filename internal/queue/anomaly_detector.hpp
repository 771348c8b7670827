#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "internal/beads/model/issue.hpp"
#include "internal/util/time.hpp"

namespace refinery::queue {

inline constexpr auto kStaleClaimWarningAfter  = std::chrono::hours(2);
inline constexpr auto kStaleClaimCriticalAfter = std::chrono::hours(6);

struct MRAnomaly {
  std::string    id;
  std::string    branch;
  std::string    type;     // stale-claim | orphaned-branch
  std::string    severity; // warning | critical
  std::string    assignee;
  util::Duration age{0};
  std::string    detail;
};

struct BranchPresence {
  bool local  = false;
  bool remote = false; // remote tracking ref
};

// Throws when the check itself fails; that MR then gets no orphan signal.
using BranchPresenceFn = std::function<BranchPresence(const std::string& branch)>;

/*
  Advisory scan of open MRs for things that stall the queue: claims that
  stopped moving and branches that vanished. Reads only.
*/
std::vector<MRAnomaly> DetectQueueAnomalies(const std::vector<beads::model::Issue>& issues, util::TimePoint now, const BranchPresenceFn& branch_presence);

} // namespace refinery::queue
