#include "store_convoy_observer.hpp"

#include "internal/observability/logging.hpp"

namespace refinery::convoy {

using observability::IntField;
using observability::StringField;

StoreConvoyObserver::StoreConvoyObserver(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<util::CommandRunner> runner, FeedOptions feed)
    : store_(std::move(store)), runner_(std::move(runner)), feed_(std::move(feed)) {
}

std::vector<std::string> StoreConvoyObserver::CheckConvoysForIssue(const std::string& issue_id) {
  std::vector<std::string> convoy_ids;
  try {
    for (const auto& dep : store_->ListDependents(issue_id, beads::model::kDepTracks)) {
      convoy_ids.push_back(dep.issue_id);
    }
  } catch (const std::exception& e) {
    REFINERY_LOG_WARN("convoy lookup failed", {StringField("issue", issue_id), StringField("error", e.what())});
    return {};
  }
  if (convoy_ids.empty()) return convoy_ids;

  REFINERY_LOG_INFO("issue tracked by convoys", {StringField("issue", issue_id), IntField("convoys", static_cast<int64_t>(convoy_ids.size()))});

  for (const auto& convoy_id : convoy_ids) {
    try {
      auto convoy = store_->Show(convoy_id);
      if (!convoy || !convoy->IsOpen()) {
        REFINERY_LOG_INFO("convoy already closed, skipping", {StringField("convoy", convoy_id)});
        continue;
      }
      if (!CheckConvoy(convoy_id)) {
        FeedNextReadyIssue(convoy_id);
      }
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("convoy check failed", {StringField("convoy", convoy_id), StringField("error", e.what())});
    }
  }
  return convoy_ids;
}

bool StoreConvoyObserver::CheckConvoy(const std::string& convoy_id) {
  std::vector<std::string> tracked;
  for (const auto& dep : store_->ListDependencies(convoy_id, beads::model::kDepTracks)) {
    tracked.push_back(dep.depends_on_id);
  }

  // a tracked issue that no longer exists counts as done
  for (const auto& issue : store_->ShowMany(tracked)) {
    if (issue.IsOpen()) return false;
  }

  beads::ThrowIfStoreError(store_->CloseWithReason(convoy_id, "all tracked issues closed"), "close convoy " + convoy_id);
  REFINERY_LOG_INFO("convoy complete, closed", {StringField("convoy", convoy_id), IntField("tracked", static_cast<int64_t>(tracked.size()))});
  return true;
}

void StoreConvoyObserver::FeedNextReadyIssue(const std::string& convoy_id) {
  if (feed_.command.empty() || !runner_) return;

  std::string command = feed_.command;
  for (auto pos = command.find("{convoy}"); pos != std::string::npos; pos = command.find("{convoy}", pos + convoy_id.size())) {
    command.replace(pos, 8, convoy_id);
  }

  util::CommandSpec spec;
  spec.argv     = util::ShellArgv(command);
  spec.work_dir = feed_.work_dir;
  spec.timeout  = feed_.timeout;

  auto r = runner_->Run(spec, ctx_);
  if (!r.Ok()) {
    REFINERY_LOG_WARN("convoy feed failed", {StringField("convoy", convoy_id), IntField("exit_code", r.exit_code),
                                             observability::BoolField("timed_out", r.timed_out), StringField("stderr", r.stderr_text)});
    return;
  }
  REFINERY_LOG_INFO("convoy fed", {StringField("convoy", convoy_id)});
}

} // namespace refinery::convoy
