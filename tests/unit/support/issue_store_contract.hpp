#pragma once

#include <algorithm>
#include <cassert>
#include <string>

#include "internal/beads/issue_store.hpp"
#include "internal/beads/model/issue.hpp"

namespace refinery::testing {

// Behavior every IssueStore backend must share.
inline void RunIssueStoreContract(beads::IssueStore& store) {
  using namespace refinery::beads;

  // create
  CreateOptions mr_opts;
  mr_opts.type        = model::kTypeMergeRequest;
  mr_opts.title       = "Merge feature/x";
  mr_opts.description = "branch: feature/x\ntarget: main";
  mr_opts.priority    = 1;
  mr_opts.labels      = {model::kLabelMergeRequest};
  mr_opts.actor       = "gastown/nux";

  model::Issue mr;
  assert(store.Create(mr_opts, &mr));
  assert(!mr.id.empty());
  assert(mr.status == model::kStatusOpen);
  assert(!mr.created_at.empty());

  CreateOptions task_opts;
  task_opts.type  = model::kTypeTask;
  task_opts.title = "Resolve merge conflicts";
  model::Issue task;
  assert(store.Create(task_opts, &task));
  assert(task.id != mr.id);

  CreateOptions untitled;
  untitled.type = model::kTypeTask;
  assert(store.Create(untitled, nullptr).code == ErrorCode::InvalidArgument);

  // show / list
  auto shown = store.Show(mr.id);
  assert(shown && shown->title == "Merge feature/x");
  assert(shown->priority == 1);
  assert(shown->HasLabel(model::kLabelMergeRequest));
  assert(shown->created_by == "gastown/nux");
  assert(!store.Show("rf-missing"));

  ListOptions by_type;
  by_type.type   = model::kTypeMergeRequest;
  by_type.status = model::kStatusOpen;
  auto mrs       = store.List(by_type);
  assert(mrs.size() == 1 && mrs[0].id == mr.id);

  ListOptions by_label;
  by_label.label = model::kLabelMergeRequest;
  assert(store.List(by_label).size() == 1);

  auto many = store.ShowMany({task.id, "rf-missing", mr.id});
  assert(many.size() == 2);

  // update
  UpdateOptions claim;
  claim.assignee = std::string("gastown/refinery");
  assert(store.Update(mr.id, claim));
  assert(store.Show(mr.id)->assignee == "gastown/refinery");
  assert(store.Show(mr.id)->description == "branch: feature/x\ntarget: main");

  ListOptions by_assignee;
  by_assignee.assignee = "gastown/refinery";
  assert(store.List(by_assignee).size() == 1);

  UpdateOptions release;
  release.assignee = std::string();
  assert(store.Update(mr.id, release));
  assert(store.Show(mr.id)->assignee.empty());

  UpdateOptions labels;
  labels.add_labels    = {"gt:urgent"};
  labels.remove_labels = {model::kLabelMergeRequest};
  assert(store.Update(mr.id, labels));
  shown = store.Show(mr.id);
  assert(shown->HasLabel("gt:urgent"));
  assert(!shown->HasLabel(model::kLabelMergeRequest));

  assert(store.Update("rf-missing", claim).code == ErrorCode::NotFound);

  // dependencies
  assert(store.AddDependency(mr.id, task.id, model::kDepBlocks));
  assert(store.AddDependency(mr.id, task.id, model::kDepBlocks)); // idempotent
  assert(store.AddDependency(mr.id, mr.id, model::kDepBlocks).code == ErrorCode::InvalidArgument);
  assert(store.AddDependency(mr.id, "rf-missing", model::kDepBlocks).code == ErrorCode::NotFound);

  shown = store.Show(mr.id);
  assert(shown->blocked_by.size() == 1 && shown->blocked_by[0] == task.id);

  auto deps = store.ListDependencies(mr.id, model::kDepBlocks);
  assert(deps.size() == 1 && deps[0].depends_on_id == task.id);
  auto dependents = store.ListDependents(task.id, "");
  assert(dependents.size() == 1 && dependents[0].issue_id == mr.id);
  assert(store.ListDependents(task.id, model::kDepTracks).empty());

  // close
  assert(store.CloseWithReason(task.id, "done"));
  auto closed = store.Show(task.id);
  assert(closed->status == model::kStatusClosed);
  assert(closed->close_reason == "done");
  assert(!closed->IsOpen());
  assert(store.CloseWithReason("rf-missing", "x").code == ErrorCode::NotFound);

  ListOptions open_tasks;
  open_tasks.type   = model::kTypeTask;
  open_tasks.status = model::kStatusOpen;
  assert(store.List(open_tasks).empty());
}

} // namespace refinery::testing
