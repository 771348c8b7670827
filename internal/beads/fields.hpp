#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/beads/model/issue.hpp"

namespace refinery::beads {

/*
  `key: value` lines embedded in an issue description.

  Editing is lossless: free text and unknown lines are kept verbatim, an
  existing key is rewritten in place, and a new key goes right after the
  last field line (or at the end when there is none).

  Keys are lower-case identifiers, so prose such as "Note: ..." is never
  mistaken for a field. A value of "null" reads as empty.
*/
class FieldBlock {
 public:
  explicit FieldBlock(std::string_view text);

  std::optional<std::string> Get(std::string_view key) const;
  bool                       Has(std::string_view key) const;

  void Set(std::string_view key, std::string_view value);

  std::string Render() const;

 private:
  std::optional<std::size_t> FindLine(std::string_view key) const;
  std::optional<std::size_t> LastFieldLine() const;

  std::vector<std::string> lines_;
};

// Structured fields of a merge-request issue.
struct MRFields {
  std::string branch;
  std::string target;
  std::string source_issue;
  std::string worker;
  std::string rig;
  std::string merge_commit;
  std::string close_reason;
  std::string agent_bead;
  int         retry_count = 0;
  std::string convoy_id;
  std::string convoy_created_at;
};

// nullopt when the description carries none of the MR keys.
std::optional<MRFields> ParseMRFields(const model::Issue& issue);
std::optional<MRFields> ParseMRFields(std::string_view description);

// Writes every non-empty field of `fields` into `description`.
std::string SetMRFields(std::string_view description, const MRFields& fields);

std::string FormatMRDescription(const MRFields& fields);

// Agent beads carry the MR they are waiting on as `active_mr`.
std::string SetAgentActiveMR(std::string_view description, std::string_view mr_id);
std::string GetAgentActiveMR(std::string_view description);

} // namespace refinery::beads
