#pragma once

#include <string>
#include <vector>

namespace refinery::git {

struct SubmoduleChange {
  std::string path;
  std::string old_sha; // empty when the submodule is added
  std::string new_sha; // empty when the submodule is removed
};

/*
  Git operations the merge pipeline needs, against one working tree.

  Every call throws util::GitError when git fails. Calls that answer a
  question (BranchExists, CheckConflicts) only throw when git could not
  answer it.
*/
class Git {
 public:
  virtual ~Git() = default;

  virtual const std::string& WorkDir() const = 0;

  virtual bool BranchExists(const std::string& branch)                                     = 0;
  virtual bool RemoteTrackingBranchExists(const std::string& remote, const std::string& branch) = 0;

  virtual void Checkout(const std::string& ref)                             = 0;
  virtual void Pull(const std::string& remote, const std::string& branch) = 0;

  // Files that would conflict when merging `source` into `target`. Does not
  // touch the working tree.
  virtual std::vector<std::string> CheckConflicts(const std::string& source, const std::string& target) = 0;

  // Submodule pointers that differ between `base` and `branch`.
  virtual std::vector<SubmoduleChange> SubmoduleChanges(const std::string& base, const std::string& branch) = 0;
  virtual void                         InitSubmodules()                                                      = 0;
  virtual void PushSubmoduleCommit(const std::string& path, const std::string& sha, const std::string& remote) = 0;

  virtual void                     MergeSquash(const std::string& branch, const std::string& message) = 0;
  virtual void                     AbortMerge()                                                       = 0;
  virtual std::vector<std::string> ConflictingFiles()                                                 = 0;

  virtual void Push(const std::string& remote, const std::string& branch) = 0;
  virtual void ResetHard(const std::string& ref)                         = 0;

  virtual std::string Rev(const std::string& ref)                         = 0;
  virtual std::string BranchCommitMessage(const std::string& branch)      = 0;
  virtual void        DeleteBranch(const std::string& branch, bool force) = 0;
};

} // namespace refinery::git
