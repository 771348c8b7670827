#pragma once

#include <string>
#include <vector>

namespace refinery::beads::model {

inline constexpr const char* kStatusOpen   = "open";
inline constexpr const char* kStatusClosed = "closed";

inline constexpr const char* kTypeMergeRequest = "merge-request";
inline constexpr const char* kTypeTask         = "task";
inline constexpr const char* kTypeMessage      = "message";
inline constexpr const char* kTypeConvoy       = "convoy";

inline constexpr const char* kLabelMergeRequest = "gt:merge-request";
inline constexpr const char* kLabelOwnedDirect  = "gt:owned-direct";
inline constexpr const char* kLabelMessage      = "gt:message";

inline constexpr const char* kDepBlocks = "blocks";
inline constexpr const char* kDepTracks = "tracks";

/*
  One record of the issue tracker ("bead").

  Timestamps are RFC 3339 strings as stored; callers parse them.
  blocked_by holds the targets of this issue's `blocks` dependencies.
*/
struct Issue {
  std::string id;
  std::string type;
  std::string status{kStatusOpen};
  std::string title;
  std::string description;
  int         priority = 2;
  std::string assignee;
  std::string created_by;

  std::vector<std::string> labels;
  std::vector<std::string> blocked_by;

  std::string created_at;
  std::string updated_at;
  std::string closed_at;
  std::string close_reason;

  bool HasLabel(const std::string& label) const {
    for (const auto& l : labels) {
      if (l == label) return true;
    }
    return false;
  }

  bool IsOpen() const {
    return status != kStatusClosed;
  }
};

// issue_id depends on depends_on_id. For `blocks`, depends_on_id blocks issue_id.
struct Dependency {
  std::string issue_id;
  std::string depends_on_id;
  std::string type;
};

} // namespace refinery::beads::model
