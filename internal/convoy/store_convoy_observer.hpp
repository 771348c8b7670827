#pragma once

#include <memory>

#include "internal/beads/issue_store.hpp"
#include "internal/convoy/convoy_observer.hpp"
#include "internal/util/command_runner.hpp"
#include "internal/util/time.hpp"

namespace refinery::convoy {

struct FeedOptions {
  // shell command, "{convoy}" is replaced by the convoy id; empty disables feeding
  std::string    command;
  std::string    work_dir;
  util::Duration timeout = std::chrono::minutes(5);
};

/*
  Convoys are issues holding `tracks` edges onto their member issues.

  For every open convoy tracking the closed issue: close it when all its
  tracked issues are closed, otherwise run the feed command so the next
  ready member gets dispatched.
*/
class StoreConvoyObserver final : public ConvoyObserver {
 public:
  StoreConvoyObserver(std::shared_ptr<beads::IssueStore> store, std::shared_ptr<util::CommandRunner> runner, FeedOptions feed);

  std::vector<std::string> CheckConvoysForIssue(const std::string& issue_id) override;

 private:
  // true when the convoy was closed
  bool CheckConvoy(const std::string& convoy_id);
  void FeedNextReadyIssue(const std::string& convoy_id);

  std::shared_ptr<beads::IssueStore>   store_;
  std::shared_ptr<util::CommandRunner> runner_;
  FeedOptions                          feed_;
  util::Context                        ctx_;
};

} // namespace refinery::convoy
