#include "notifier.hpp"

namespace refinery::notify {

Message NewMergeFailedMessage(const MergeFailure& failure, const std::string& recipient) {
  Message m;
  m.from    = failure.rig + "/refinery";
  m.to      = recipient;
  m.subject = "MERGE_FAILED " + failure.worker;
  m.body    = "Branch: " + failure.branch + "\n" + "Issue: " + failure.source_issue + "\n" + "Polecat: " + failure.worker + "\n" +
           "Rig: " + failure.rig + "\n" + "Target: " + failure.target + "\n" + "Failure-Type: " + failure.failure_type + "\n" +
           "Error: " + failure.error + "\n";
  return m;
}

Message NewRejectedMessage(const std::string& rig, const std::string& worker, const std::string& branch, const std::string& source_issue,
                           const std::string& reason) {
  Message m;
  m.from    = rig + "/refinery";
  m.to      = rig + "/" + worker;
  m.subject = "Merge request rejected";
  m.body    = "Your merge request has been rejected.\n\nBranch: " + branch + "\nIssue: " + source_issue + "\nReason: " + reason +
           "\n\nPlease review the feedback and address the issues before resubmitting.";
  return m;
}

std::string DefaultRecipient(const std::string& rig) {
  return rig + "/witness";
}

} // namespace refinery::notify
