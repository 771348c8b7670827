#include "outcome_handler.hpp"

#include <algorithm>

#include "internal/beads/fields.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace refinery::engine {

using observability::StringField;

const char* ToString(FailureClass c) {
  switch (c) {
    case FailureClass::None:
      return "none";
    case FailureClass::Conflict:
      return "conflict";
    case FailureClass::Tests:
      return "tests";
    case FailureClass::SlotTimeout:
      return "slot-timeout";
    case FailureClass::Build:
      return "build";
  }
  return "unknown";
}

FailureClass ClassifyFailure(const ProcessResult& result) {
  if (result.success) return FailureClass::None;
  if (result.conflict) return FailureClass::Conflict;
  if (result.tests_failed) return FailureClass::Tests;
  if (result.slot_timeout) return FailureClass::SlotTimeout;
  return FailureClass::Build;
}

OutcomeHandler::OutcomeHandler(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<git::Git> git, std::shared_ptr<slot::MergeSlotClient> slots,
                               std::shared_ptr<notify::Notifier> notifier, std::shared_ptr<convoy::ConvoyObserver> convoys, OutcomeOptions options)
    : store_(std::move(store)),
      git_(std::move(git)),
      slots_(std::move(slots)),
      notifier_(std::move(notifier)),
      convoys_(std::move(convoys)),
      options_(std::move(options)) {
  if (!store_ || !git_ || !slots_ || !notifier_) {
    throw util::InvalidArgument("outcome handler needs issue store, git, merge slot and notifier");
  }
  if (options_.recipient.empty()) {
    options_.recipient = notify::DefaultRecipient(options_.rig_name);
  }
}

void OutcomeHandler::HandleSuccess(const queue::MRInfo& mr, const ProcessResult& result) {
  // a conflict resolution for this rig may still hold the slot
  try {
    slots_->Release(slots_->ConflictHolder());
    REFINERY_LOG_INFO("released merge slot", {StringField("holder", slots_->ConflictHolder())});
  } catch (const std::exception& e) {
    REFINERY_LOG_INFO("merge slot release skipped", {StringField("error", e.what())});
  }

  if (!mr.id.empty()) {
    try {
      auto bead = store_->Show(mr.id);
      if (!bead) throw util::NotFound("MR " + mr.id);

      beads::MRFields fields = beads::ParseMRFields(*bead).value_or(beads::MRFields{});
      fields.merge_commit    = result.merge_commit;
      fields.close_reason    = "merged";

      beads::UpdateOptions update;
      update.description = beads::SetMRFields(bead->description, fields);
      beads::ThrowIfStoreError(store_->Update(mr.id, update), "update MR " + mr.id);
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to record merge commit on MR", {StringField("mr", mr.id), StringField("error", e.what())});
    }

    if (auto r = store_->CloseWithReason(mr.id, "merged"); r) {
      REFINERY_LOG_INFO("closed MR", {StringField("mr", mr.id)});
    } else {
      REFINERY_LOG_WARN("failed to close MR", {StringField("mr", mr.id), StringField("error", r.message)});
    }
  }

  if (!mr.source_issue.empty()) {
    if (auto r = store_->CloseWithReason(mr.source_issue, "Merged in " + mr.id); r) {
      REFINERY_LOG_INFO("closed source issue", {StringField("issue", mr.source_issue)});
      if (convoys_) convoys_->CheckConvoysForIssue(mr.source_issue);
    } else {
      REFINERY_LOG_WARN("failed to close source issue", {StringField("issue", mr.source_issue), StringField("error", r.message)});
    }
  }

  if (!mr.agent_bead.empty()) {
    try {
      auto agent = store_->Show(mr.agent_bead);
      if (!agent) throw util::NotFound("agent bead " + mr.agent_bead);

      beads::UpdateOptions update;
      update.description = beads::SetAgentActiveMR(agent->description, "");
      beads::ThrowIfStoreError(store_->Update(mr.agent_bead, update), "update agent bead " + mr.agent_bead);
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to clear agent active_mr", {StringField("agent", mr.agent_bead), StringField("error", e.what())});
    }
  }

  if (options_.delete_merged_branches && !mr.branch.empty()) {
    try {
      git_->DeleteBranch(mr.branch, true);
      REFINERY_LOG_INFO("deleted local branch", {StringField("branch", mr.branch)});
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to delete branch", {StringField("branch", mr.branch), StringField("error", e.what())});
    }
  }

  REFINERY_LOG_INFO("merged", {StringField("mr", mr.id), StringField("commit", result.merge_commit)});
}

FailureDisposition OutcomeHandler::HandleFailure(const queue::MRInfo& mr, const ProcessResult& result) {
  FailureDisposition disposition;
  disposition.failure_class = ClassifyFailure(result);

  if (disposition.failure_class == FailureClass::SlotTimeout) {
    REFINERY_LOG_WARN("slot timeout, MR stays queued", {StringField("mr", mr.id), StringField("error", result.error)});
    return disposition;
  }

  notify::MergeFailure failure;
  failure.rig          = options_.rig_name;
  failure.worker       = mr.worker;
  failure.branch       = mr.branch;
  failure.source_issue = mr.source_issue;
  failure.target       = mr.target;
  failure.failure_type = ToString(disposition.failure_class);
  failure.error        = result.error;
  try {
    notifier_->Send(notify::NewMergeFailedMessage(failure, options_.recipient));
    disposition.notified = true;
    REFINERY_LOG_INFO("notified of merge failure", {StringField("recipient", options_.recipient), StringField("worker", mr.worker)});
  } catch (const std::exception& e) {
    REFINERY_LOG_WARN("failed to send MERGE_FAILED", {StringField("recipient", options_.recipient), StringField("error", e.what())});
  }

  if (disposition.failure_class == FailureClass::Conflict) {
    try {
      disposition.task_id = CreateConflictResolutionTask(mr, &disposition.deferred);
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to create conflict resolution task", {StringField("mr", mr.id), StringField("error", e.what())});
    }
  }

  REFINERY_LOG_WARN("merge failed", {StringField("mr", mr.id), StringField("class", ToString(disposition.failure_class)),
                                     StringField("error", result.error), StringField("blocked_by", disposition.task_id)});
  return disposition;
}

std::string OutcomeHandler::ConflictTaskDescription(const queue::MRInfo& mr, const std::string& target_sha) const {
  const auto& b = mr.branch;
  const auto& t = mr.target;

  return "Resolve merge conflicts for branch " + b + "\n\n" +
         "## Metadata\n" +
         "- Original MR: " + mr.id + "\n" +
         "- Branch: " + b + "\n" +
         "- Conflict with: " + t + "@" + target_sha.substr(0, 8) + "\n" +
         "- Original issue: " + mr.source_issue + "\n" +
         "- Retry count: " + std::to_string(mr.retry_count + 1) + "\n\n" +
         "## Instructions\n" +
         "1. Check out the branch: git checkout " + b + "\n" +
         "2. Rebase onto target: git rebase " + options_.remote + "/" + t + "\n" +
         "3. Resolve conflicts in your editor\n" +
         "4. Complete the rebase: git add . && git rebase --continue\n" +
         "5. Force-push the resolved branch: git push -f\n" +
         "6. Close this task once the branch is pushed\n\n" +
         "The refinery retries the merge automatically after the force-push.";
}

std::string OutcomeHandler::CreateConflictResolutionTask(const queue::MRInfo& mr, bool* deferred) {
  const auto slot = slots_->AcquireConflictSlot();
  if (slot.outcome == slot::ConflictSlotOutcome::HeldByOther) {
    REFINERY_LOG_INFO("merge slot held, deferring conflict resolution", {StringField("mr", mr.id), StringField("holder", slot.holder)});
    *deferred = true;
    return "";
  }
  const std::string held = slot.outcome == slot::ConflictSlotOutcome::Acquired ? slot.holder : "";

  auto release_on_error = [&] {
    if (held.empty()) return;
    try {
      slots_->Release(held);
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to release merge slot after error", {StringField("holder", held), StringField("error", e.what())});
    }
  };

  try {
    std::string target_sha;
    try {
      target_sha = git_->Rev(options_.remote + "/" + mr.target);
    } catch (const std::exception&) {
      target_sha = "unknown-sha";
    }

    std::string original_title = mr.source_issue;
    if (!mr.source_issue.empty()) {
      try {
        if (auto source = store_->Show(mr.source_issue)) original_title = source->title;
      } catch (const std::exception& e) {
        REFINERY_LOG_DEBUG("source issue lookup failed", {StringField("issue", mr.source_issue), StringField("error", e.what())});
      }
    }

    beads::CreateOptions create;
    create.type        = beads::model::kTypeTask;
    create.title       = "Resolve merge conflicts: " + original_title;
    create.priority    = std::max(mr.priority - 1, 0);
    create.description = ConflictTaskDescription(mr, target_sha);
    create.actor       = options_.rig_name + "/refinery";

    beads::model::Issue task;
    beads::ThrowIfStoreError(store_->Create(create, &task), "create conflict resolution task");
    REFINERY_LOG_INFO("created conflict resolution task", {StringField("task", task.id), StringField("mr", mr.id),
                                                           observability::IntField("priority", create.priority)});

    // the MR re-enters the ready queue when the task closes
    beads::ThrowIfStoreError(store_->AddDependency(mr.id, task.id, beads::model::kDepBlocks), "block MR " + mr.id + " on " + task.id);
    REFINERY_LOG_INFO("MR blocked on conflict task", {StringField("mr", mr.id), StringField("task", task.id)});

    try {
      if (auto bead = store_->Show(mr.id)) {
        beads::MRFields fields = beads::ParseMRFields(*bead).value_or(beads::MRFields{});
        fields.retry_count     = mr.retry_count + 1;

        beads::UpdateOptions update;
        update.description = beads::SetMRFields(bead->description, fields);
        beads::ThrowIfStoreError(store_->Update(mr.id, update), "update MR retry count");
      }
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to bump MR retry count", {StringField("mr", mr.id), StringField("error", e.what())});
    }

    return task.id;
  } catch (const std::exception&) {
    release_on_error();
    throw;
  }
}

} // namespace refinery::engine
