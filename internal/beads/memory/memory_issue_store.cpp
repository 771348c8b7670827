#include "memory_issue_store.hpp"

#include <algorithm>

#include "internal/util/uuid.hpp"

namespace refinery::beads::memory {

MemoryIssueStore::MemoryIssueStore(std::string id_prefix, NowFn now) : id_prefix_(std::move(id_prefix)), now_(std::move(now)) {
}

std::string MemoryIssueStore::Timestamp() const {
  return util::FormatRfc3339(now_());
}

// caller holds mutex_
model::Issue MemoryIssueStore::Materialize(const model::Issue& issue) const {
  model::Issue out = issue;
  out.blocked_by.clear();
  for (const auto& d : state_.deps) {
    if (d.issue_id == issue.id && d.type == model::kDepBlocks) {
      out.blocked_by.push_back(d.depends_on_id);
    }
  }
  return out;
}

std::vector<model::Issue> MemoryIssueStore::List(const ListOptions& options) {
  std::lock_guard lock(mutex_);

  std::vector<model::Issue> out;
  for (const auto& id : state_.order) {
    const auto& issue = state_.issues.at(id);
    if (!options.type.empty() && issue.type != options.type) continue;
    if (!options.status.empty() && issue.status != options.status) continue;
    if (!options.label.empty() && !issue.HasLabel(options.label)) continue;
    if (!options.assignee.empty() && issue.assignee != options.assignee) continue;
    out.push_back(Materialize(issue));
  }
  return out;
}

std::optional<model::Issue> MemoryIssueStore::Show(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto it = state_.issues.find(id);
  if (it == state_.issues.end()) return std::nullopt;
  return Materialize(it->second);
}

std::vector<model::Issue> MemoryIssueStore::ShowMany(const std::vector<std::string>& ids) {
  std::lock_guard lock(mutex_);

  std::vector<model::Issue> out;
  for (const auto& id : ids) {
    auto it = state_.issues.find(id);
    if (it != state_.issues.end()) out.push_back(Materialize(it->second));
  }
  return out;
}

Result MemoryIssueStore::Update(const std::string& id, const UpdateOptions& options) {
  std::lock_guard lock(mutex_);

  auto it = state_.issues.find(id);
  if (it == state_.issues.end()) return Result::Err(ErrorCode::NotFound, "issue " + id);

  auto& issue = it->second;
  if (options.assignee) issue.assignee = *options.assignee;
  if (options.description) issue.description = *options.description;
  if (options.status) issue.status = *options.status;
  if (options.priority) issue.priority = *options.priority;

  for (const auto& label : options.add_labels) {
    if (!issue.HasLabel(label)) issue.labels.push_back(label);
  }
  for (const auto& label : options.remove_labels) {
    issue.labels.erase(std::remove(issue.labels.begin(), issue.labels.end(), label), issue.labels.end());
  }

  issue.updated_at = Timestamp();
  return Result::Ok();
}

Result MemoryIssueStore::CloseWithReason(const std::string& id, const std::string& reason) {
  std::lock_guard lock(mutex_);

  auto it = state_.issues.find(id);
  if (it == state_.issues.end()) return Result::Err(ErrorCode::NotFound, "issue " + id);

  auto& issue        = it->second;
  issue.status       = model::kStatusClosed;
  issue.close_reason = reason;
  issue.updated_at   = Timestamp();
  issue.closed_at    = issue.updated_at;
  return Result::Ok();
}

Result MemoryIssueStore::Create(const CreateOptions& options, model::Issue* created) {
  if (options.title.empty()) return Result::Err(ErrorCode::InvalidArgument, "title is required");
  if (options.type.empty()) return Result::Err(ErrorCode::InvalidArgument, "type is required");

  std::lock_guard lock(mutex_);

  model::Issue issue;
  do {
    issue.id = util::GenerateIssueId(id_prefix_);
  } while (state_.issues.count(issue.id) > 0);

  issue.type        = options.type;
  issue.title       = options.title;
  issue.description = options.description;
  issue.priority    = options.priority;
  issue.assignee    = options.assignee;
  issue.created_by  = options.actor;
  issue.labels      = options.labels;
  issue.created_at  = Timestamp();
  issue.updated_at  = issue.created_at;

  state_.order.push_back(issue.id);
  state_.issues.emplace(issue.id, issue);

  if (created) *created = issue;
  return Result::Ok();
}

Result MemoryIssueStore::AddDependency(const std::string& issue_id, const std::string& depends_on_id, const std::string& type) {
  std::lock_guard lock(mutex_);

  if (state_.issues.count(issue_id) == 0) return Result::Err(ErrorCode::NotFound, "issue " + issue_id);
  if (state_.issues.count(depends_on_id) == 0) return Result::Err(ErrorCode::NotFound, "issue " + depends_on_id);
  if (issue_id == depends_on_id) return Result::Err(ErrorCode::InvalidArgument, "issue cannot depend on itself");

  for (const auto& d : state_.deps) {
    if (d.issue_id == issue_id && d.depends_on_id == depends_on_id && d.type == type) {
      return Result::Ok();
    }
  }
  state_.deps.push_back({issue_id, depends_on_id, type});
  state_.issues.at(issue_id).updated_at = Timestamp();
  return Result::Ok();
}

std::vector<model::Dependency> MemoryIssueStore::ListDependencies(const std::string& issue_id, const std::string& type) {
  std::lock_guard lock(mutex_);

  std::vector<model::Dependency> out;
  for (const auto& d : state_.deps) {
    if (d.issue_id == issue_id && (type.empty() || d.type == type)) out.push_back(d);
  }
  return out;
}

std::vector<model::Dependency> MemoryIssueStore::ListDependents(const std::string& issue_id, const std::string& type) {
  std::lock_guard lock(mutex_);

  std::vector<model::Dependency> out;
  for (const auto& d : state_.deps) {
    if (d.depends_on_id == issue_id && (type.empty() || d.type == type)) out.push_back(d);
  }
  return out;
}

void MemoryIssueStore::Put(const model::Issue& issue) {
  std::lock_guard lock(mutex_);

  if (state_.issues.count(issue.id) == 0) state_.order.push_back(issue.id);

  model::Issue stored = issue;
  stored.blocked_by.clear();
  state_.issues[issue.id] = stored;

  for (const auto& blocker : issue.blocked_by) {
    bool exists = false;
    for (const auto& d : state_.deps) {
      if (d.issue_id == issue.id && d.depends_on_id == blocker && d.type == model::kDepBlocks) exists = true;
    }
    if (!exists) state_.deps.push_back({issue.id, blocker, model::kDepBlocks});
  }
}

} // namespace refinery::beads::memory
