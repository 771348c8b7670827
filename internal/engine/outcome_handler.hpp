#pragma once

#include <memory>
#include <string>

#include "internal/beads/issue_store.hpp"
#include "internal/convoy/convoy_observer.hpp"
#include "internal/engine/process_result.hpp"
#include "internal/git/git.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/queue/mr_info.hpp"
#include "internal/slot/merge_slot.hpp"

namespace refinery::engine {

enum class FailureClass {
  None,
  Conflict,
  Tests,
  SlotTimeout,
  Build,
};

const char* ToString(FailureClass c);

// conflict > tests > slot-timeout > build. None for a success.
FailureClass ClassifyFailure(const ProcessResult& result);

struct FailureDisposition {
  FailureClass failure_class = FailureClass::None;
  bool         notified      = false;
  std::string  task_id;          // conflict task, when one was created
  bool         deferred = false; // conflict slot held elsewhere, no task yet
};

struct OutcomeOptions {
  std::string rig_name;
  std::string remote{"origin"};
  std::string recipient; // MERGE_FAILED goes here
  bool        delete_merged_branches = true;
};

/*
  Applies the result of a merge attempt to persisted state.

  Success closes the MR and its source issue. Failure notifies the watcher
  and, for conflicts, files a resolution task that blocks the MR. Every
  step is best-effort: a failing step is logged and the rest still run.
*/
class OutcomeHandler {
 public:
  OutcomeHandler(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<git::Git> git, std::shared_ptr<slot::MergeSlotClient> slots,
                 std::shared_ptr<notify::Notifier> notifier, std::shared_ptr<convoy::ConvoyObserver> convoys, OutcomeOptions options);

  void HandleSuccess(const queue::MRInfo& mr, const ProcessResult& result);

  FailureDisposition HandleFailure(const queue::MRInfo& mr, const ProcessResult& result);

 private:
  // Creates the task and blocks the MR on it. Returns "" with *deferred set
  // when another holder owns the merge slot.
  std::string CreateConflictResolutionTask(const queue::MRInfo& mr, bool* deferred);

  std::string ConflictTaskDescription(const queue::MRInfo& mr, const std::string& target_sha) const;

  std::shared_ptr<beads::IssueStore>       store_;
  std::shared_ptr<git::Git>                git_;
  std::shared_ptr<slot::MergeSlotClient>   slots_;
  std::shared_ptr<notify::Notifier>        notifier_;
  std::shared_ptr<convoy::ConvoyObserver>  convoys_;
  OutcomeOptions                           options_;
};

} // namespace refinery::engine
