#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/beads/model/issue.hpp"
#include "internal/beads/result.hpp"

namespace refinery::beads {

struct ListOptions {
  std::string type;   // empty = any
  std::string status; // empty = any
  std::string label;  // empty = any
  std::string assignee;
};

struct UpdateOptions {
  std::optional<std::string> assignee;
  std::optional<std::string> description;
  std::optional<std::string> status;
  std::optional<int>         priority;

  std::vector<std::string> add_labels;
  std::vector<std::string> remove_labels;
};

struct CreateOptions {
  std::string type;
  std::string title;
  std::string description;
  int         priority = 2;
  std::string assignee;
  std::string actor;

  std::vector<std::string> labels;
};

/*
  Issue tracker the merge queue reads and writes.

  Reads return what exists (Show gives nullopt for an unknown id) and throw
  util::StoreError when the backend itself fails. Writes report a Result;
  callers decide whether a failure is fatal or best-effort.

  Every write bumps updated_at.
*/
class IssueStore {
 public:
  virtual ~IssueStore() = default;

  virtual std::vector<model::Issue>  List(const ListOptions& options)              = 0;
  virtual std::optional<model::Issue> Show(const std::string& id)                   = 0;
  virtual std::vector<model::Issue>  ShowMany(const std::vector<std::string>& ids) = 0;

  virtual Result Update(const std::string& id, const UpdateOptions& options) = 0;
  virtual Result CloseWithReason(const std::string& id, const std::string& reason) = 0;
  virtual Result Create(const CreateOptions& options, model::Issue* created)     = 0;

  virtual Result AddDependency(const std::string& issue_id, const std::string& depends_on_id, const std::string& type) = 0;

  // Edges out of `issue_id` (what it depends on).
  virtual std::vector<model::Dependency> ListDependencies(const std::string& issue_id, const std::string& type) = 0;

  // Edges into `issue_id` (what depends on it).
  virtual std::vector<model::Dependency> ListDependents(const std::string& issue_id, const std::string& type) = 0;
};

} // namespace refinery::beads
