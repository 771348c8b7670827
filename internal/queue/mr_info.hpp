#pragma once

#include <optional>
#include <string>

#include "internal/beads/fields.hpp"
#include "internal/beads/model/issue.hpp"
#include "internal/util/time.hpp"

namespace refinery::queue {

/*
  Merge request as the queue sees it: the issue plus its parsed fields.
*/
struct MRInfo {
  std::string id;
  std::string branch;
  std::string target;
  std::string source_issue;
  std::string worker;
  std::string rig;
  std::string title;
  int         priority = 2;
  std::string agent_bead;
  int         retry_count = 0;
  std::string convoy_id;

  std::optional<util::TimePoint> convoy_created_at;
  std::optional<util::TimePoint> created_at;
  std::optional<util::TimePoint> updated_at;

  std::string assignee;   // empty = unclaimed
  std::string blocked_by; // first still-open blocker

  bool branch_exists_local  = false;
  bool branch_exists_remote = false;
};

// Unparsable timestamps are left empty.
MRInfo IssueToMRInfo(const beads::model::Issue& issue, const beads::MRFields& fields);

} // namespace refinery::queue
