#include "mr_info.hpp"

namespace refinery::queue {

MRInfo IssueToMRInfo(const beads::model::Issue& issue, const beads::MRFields& fields) {
  MRInfo mr;
  mr.id           = issue.id;
  mr.branch       = fields.branch;
  mr.target       = fields.target;
  mr.source_issue = fields.source_issue;
  mr.worker       = fields.worker;
  mr.rig          = fields.rig;
  mr.title        = issue.title;
  mr.priority     = issue.priority;
  mr.agent_bead   = fields.agent_bead;
  mr.retry_count  = fields.retry_count;
  mr.convoy_id    = fields.convoy_id;
  mr.assignee     = issue.assignee;

  if (!fields.convoy_created_at.empty()) mr.convoy_created_at = util::ParseRfc3339(fields.convoy_created_at);
  if (!issue.created_at.empty()) mr.created_at = util::ParseRfc3339(issue.created_at);
  if (!issue.updated_at.empty()) mr.updated_at = util::ParseRfc3339(issue.updated_at);
  return mr;
}

} // namespace refinery::queue
