#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/beads/issue_store.hpp"
#include "internal/engine/merge_processor.hpp"
#include "internal/engine/outcome_handler.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/queue/priority_scorer.hpp"
#include "internal/queue/queue_lister.hpp"
#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

namespace refinery::engine {

struct EngineerOptions {
  std::string         rig_name;
  queue::ScoreWeights weights;
};

// What one ProcessNext call did. processed is false for an empty queue.
struct ProcessOutcome {
  bool               processed = false;
  queue::MRInfo      mr;
  ProcessResult      result;
  FailureDisposition disposition;
};

/*
  The serial queue actor of one rig.

  Ranks the ready queue, claims the best MR under "<rig>/refinery", runs one
  merge attempt and hands the result to the outcome handler. A failed MR is
  unclaimed again so it re-enters the queue (or waits on its conflict task).
  ProcessNext calls are serialized, so the worker thread and an operator
  request never run two merges at once. MRs listed in `skip` are passed over;
  the queue worker uses it so one cycle never retries an MR it already tried.
*/
class Engineer {
 public:
  using NowFn = std::function<util::TimePoint()>;

  Engineer(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<queue::QueueLister> lister, std::shared_ptr<MergeProcessor> processor,
           std::shared_ptr<OutcomeHandler> outcomes, std::shared_ptr<notify::Notifier> notifier, EngineerOptions options, NowFn now = util::Now);

  ProcessOutcome ProcessNext(const util::Context& ctx, const std::unordered_set<std::string>& skip = {});

  std::vector<queue::RankedMR> ListQueue();
  std::vector<queue::MRInfo>   ListBlocked();
  std::vector<queue::MRInfo>   ListAllOpen();
  std::vector<queue::MRAnomaly> ListAnomalies();

  void ClaimMR(const std::string& mr_id, const std::string& worker_id);
  void ReleaseMR(const std::string& mr_id);

  // Matches an open MR by id, branch, "polecat/<name>" branch, or id
  // substring. Throws util::NotFound.
  queue::MRInfo FindMR(const std::string& id_or_branch);

  // Closes the MR as rejected. Throws util::InvalidState for a closed MR.
  queue::MRInfo RejectMR(const std::string& id_or_branch, const std::string& reason, bool notify_worker);

  // Drops any claim so the MR is picked up on the next cycle.
  queue::MRInfo RetryMR(const std::string& id_or_branch);

  const std::string& ClaimIdentity() const {
    return claim_identity_;
  }

 private:
  std::shared_ptr<beads::IssueStore>   store_;
  std::shared_ptr<queue::QueueLister>  lister_;
  std::shared_ptr<MergeProcessor>      processor_;
  std::shared_ptr<OutcomeHandler>      outcomes_;
  std::shared_ptr<notify::Notifier>    notifier_;
  EngineerOptions                      options_;
  NowFn                                now_;
  std::string                          claim_identity_;
  std::mutex                           process_mutex_;
};

} // namespace refinery::engine
