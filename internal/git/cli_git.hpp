#pragma once

#include <memory>

#include "internal/git/git.hpp"
#include "internal/util/command_runner.hpp"
#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

namespace refinery::git {

/*
  Git implementation that shells out to the `git` binary.

  Needs git 2.38+ for `merge-tree --write-tree`. Every git call runs under
  `ctx`, so cancelling it (the queue worker's Stop) kills a running git.
*/
class CliGit final : public Git {
 public:
  CliGit(std::shared_ptr<util::CommandRunner> runner, std::string work_dir, util::Duration timeout,
         std::shared_ptr<const util::Context> ctx = nullptr);

  const std::string& WorkDir() const override {
    return work_dir_;
  }

  bool BranchExists(const std::string& branch) override;
  bool RemoteTrackingBranchExists(const std::string& remote, const std::string& branch) override;

  void Checkout(const std::string& ref) override;
  void Pull(const std::string& remote, const std::string& branch) override;

  std::vector<std::string> CheckConflicts(const std::string& source, const std::string& target) override;

  std::vector<SubmoduleChange> SubmoduleChanges(const std::string& base, const std::string& branch) override;
  void                         InitSubmodules() override;
  void PushSubmoduleCommit(const std::string& path, const std::string& sha, const std::string& remote) override;

  void                     MergeSquash(const std::string& branch, const std::string& message) override;
  void                     AbortMerge() override;
  std::vector<std::string> ConflictingFiles() override;

  void Push(const std::string& remote, const std::string& branch) override;
  void ResetHard(const std::string& ref) override;

  std::string Rev(const std::string& ref) override;
  std::string BranchCommitMessage(const std::string& branch) override;
  void        DeleteBranch(const std::string& branch, bool force) override;

 private:
  util::CommandResult Exec(const std::vector<std::string>& args, const std::string& dir) const;

  // Runs git and throws GitError on a non-zero exit. Returns stdout.
  std::string Run(const std::vector<std::string>& args) const;
  std::string RunIn(const std::string& dir, const std::vector<std::string>& args) const;

  bool RefExists(const std::string& ref) const;

  std::shared_ptr<util::CommandRunner> runner_;
  std::string                          work_dir_;
  util::Duration                       timeout_;
  std::shared_ptr<const util::Context> ctx_;
};

} // namespace refinery::git
