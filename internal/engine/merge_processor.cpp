#include "merge_processor.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace refinery::engine {

using observability::IntField;
using observability::StringField;

namespace {

std::string JoinFiles(const std::vector<std::string>& files) {
  std::string out = "[";
  for (std::size_t i = 0; i < files.size(); ++i) {
    if (i > 0) out += " ";
    out += files[i];
  }
  return out + "]";
}

std::string ShortSha(const std::string& sha) {
  return sha.substr(0, 8);
}

std::string FirstLine(const std::string& text) {
  return text.substr(0, text.find('\n'));
}

} // namespace

void ValidateTestCommand(const std::string& command) {
  const bool blank = std::all_of(command.begin(), command.end(), [](unsigned char c) { return std::isspace(c); });
  if (blank) {
    throw util::InvalidArgument("test command must not be empty");
  }
}

MergeProcessor::MergeProcessor(std::shared_ptr<git::Git> git, std::shared_ptr<slot::MergeSlotClient> slots, std::shared_ptr<util::CommandRunner> runner,
                               ProcessorOptions options)
    : git_(std::move(git)), slots_(std::move(slots)), runner_(std::move(runner)), options_(std::move(options)) {
  if (!git_ || !slots_ || !runner_) {
    throw util::InvalidArgument("merge processor needs git, merge slot and command runner");
  }
}

ProcessResult MergeProcessor::Process(const util::Context& ctx, const queue::MRInfo& mr) {
  REFINERY_LOG_INFO("processing MR", {StringField("mr", mr.id), StringField("branch", mr.branch), StringField("target", mr.target),
                                      StringField("worker", mr.worker), StringField("source_issue", mr.source_issue)});
  return DoMerge(ctx, mr.branch, mr.target, mr.source_issue);
}

void MergeProcessor::ResetToRemote(const std::string& target, const char* after) {
  try {
    git_->ResetHard(options_.remote + "/" + target);
  } catch (const std::exception& e) {
    REFINERY_LOG_WARN("failed to reset target", {StringField("target", target), StringField("after", after), StringField("error", e.what())});
  }
}

void MergeProcessor::SyncSubmodules(const std::string& branch, const std::string& target) {
  std::vector<git::SubmoduleChange> changes;
  try {
    changes = git_->SubmoduleChanges(target, branch);
  } catch (const std::exception& e) {
    REFINERY_LOG_WARN("could not check submodule changes", {StringField("branch", branch), StringField("error", e.what())});
    return;
  }
  if (changes.empty()) return;

  try {
    git_->InitSubmodules();
  } catch (const std::exception& e) {
    throw util::GitError(std::string("failed to init submodules in refinery worktree: ") + e.what());
  }

  int pushed = 0;
  for (const auto& change : changes) {
    if (change.new_sha.empty()) continue; // removed

    REFINERY_LOG_INFO("pushing submodule", {StringField("path", change.path), StringField("commit", ShortSha(change.new_sha))});
    try {
      git_->PushSubmoduleCommit(change.path, change.new_sha, options_.remote);
    } catch (const std::exception& e) {
      throw util::GitError("failed to push submodule " + change.path + ": " + e.what());
    }
    ++pushed;
  }
  REFINERY_LOG_INFO("pushed submodules", {IntField("count", pushed)});
}

ProcessResult MergeProcessor::RunTests(const util::Context& ctx) {
  try {
    ValidateTestCommand(options_.test_command);
  } catch (const util::InvalidArgument& e) {
    return ProcessResult::Failure(std::string("invalid test command: ") + e.what());
  }

  const int max_attempts = std::max(1, options_.retry_flaky_tests);

  std::string last_error;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (attempt > 1) {
      REFINERY_LOG_INFO("retrying tests", {IntField("attempt", attempt), IntField("max_attempts", max_attempts)});
    }
    REFINERY_LOG_INFO("executing test command", {StringField("command", options_.test_command)});

    util::CommandSpec spec;
    spec.argv     = util::ShellArgv(options_.test_command);
    spec.work_dir = git_->WorkDir();
    spec.timeout  = options_.test_timeout;

    util::CommandResult r;
    try {
      r = runner_->Run(spec, ctx);
    } catch (const std::exception& e) {
      return ProcessResult::Failure(std::string("failed to start tests: ") + e.what());
    }

    if (r.Ok()) {
      ProcessResult ok;
      ok.success = true;
      return ok;
    }
    if (r.cancelled || ctx.IsCancelled()) {
      return ProcessResult::Failure("test run canceled");
    }

    last_error = r.timed_out ? "timed out after " + util::FormatDuration(options_.test_timeout) : "exit status " + std::to_string(r.exit_code);
    REFINERY_LOG_WARN("test attempt failed", {IntField("attempt", attempt), StringField("error", last_error),
                                              StringField("stderr", r.stderr_text.substr(0, 2000))});
  }

  ProcessResult failed = ProcessResult::Failure("tests failed after " + std::to_string(max_attempts) + " attempts: " + last_error);
  failed.tests_failed  = true;
  return failed;
}

ProcessResult MergeProcessor::DoMerge(const util::Context& ctx, const std::string& branch, const std::string& target,
                                      const std::string& source_issue) {
  // 1. source branch
  REFINERY_LOG_INFO("checking local branch", {StringField("branch", branch)});
  try {
    if (!git_->BranchExists(branch)) {
      return ProcessResult::Failure("branch " + branch + " not found locally");
    }
  } catch (const std::exception& e) {
    return ProcessResult::Failure("failed to check branch " + branch + ": " + e.what());
  }

  // 2. target
  REFINERY_LOG_INFO("checking out target branch", {StringField("target", target)});
  try {
    git_->Checkout(target);
  } catch (const std::exception& e) {
    return ProcessResult::Failure("failed to checkout target " + target + ": " + e.what());
  }
  try {
    git_->Pull(options_.remote, target);
  } catch (const std::exception& e) {
    REFINERY_LOG_WARN("pull failed, continuing", {StringField("remote", options_.remote), StringField("target", target), StringField("error", e.what())});
  }

  // 3. conflict probe
  REFINERY_LOG_INFO("checking for conflicts", {StringField("branch", branch), StringField("target", target)});
  try {
    const auto conflicts = git_->CheckConflicts(branch, target);
    if (!conflicts.empty()) {
      ProcessResult r = ProcessResult::Failure("merge conflicts in: " + JoinFiles(conflicts));
      r.conflict      = true;
      return r;
    }
  } catch (const std::exception& e) {
    ProcessResult r = ProcessResult::Failure(std::string("conflict check failed: ") + e.what());
    r.conflict      = true;
    return r;
  }

  // 4. submodule pointers must land before the parent merge
  try {
    SyncSubmodules(branch, target);
  } catch (const util::GitError& e) {
    return ProcessResult::Failure(e.what());
  }

  // 5. tests
  if (options_.run_tests && !options_.test_command.empty()) {
    REFINERY_LOG_INFO("running tests", {StringField("command", options_.test_command)});
    auto tests = RunTests(ctx);
    if (!tests.success) return tests;
    REFINERY_LOG_INFO("tests passed");
  }

  // 6. squash merge
  std::string message;
  try {
    message = git_->BranchCommitMessage(branch);
  } catch (const std::exception& e) {
    message = "Squash merge " + branch + " into " + target;
    if (!source_issue.empty()) message += " (" + source_issue + ")";
    REFINERY_LOG_WARN("could not get original commit message", {StringField("branch", branch), StringField("error", e.what())});
  }
  REFINERY_LOG_INFO("squash merging", {StringField("branch", branch), StringField("message", FirstLine(message))});
  try {
    git_->MergeSquash(branch, message);
  } catch (const std::exception& merge_error) {
    std::vector<std::string> unmerged;
    try {
      unmerged = git_->ConflictingFiles();
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("could not list conflicting files", {StringField("error", e.what())});
    }
    if (!unmerged.empty()) {
      try {
        git_->AbortMerge();
      } catch (const std::exception& e) {
        REFINERY_LOG_WARN("failed to abort merge", {StringField("error", e.what())});
      }
      ProcessResult r = ProcessResult::Failure("merge conflict during actual merge");
      r.conflict      = true;
      return r;
    }
    return ProcessResult::Failure(std::string("merge failed: ") + merge_error.what());
  }

  // 7. merge commit
  std::string merge_commit;
  try {
    merge_commit = git_->Rev("HEAD");
  } catch (const std::exception& e) {
    return ProcessResult::Failure(std::string("failed to get merge commit SHA: ") + e.what());
  }

  // 8. only pushes to the default branch are serialized
  std::string push_holder;
  if (target == options_.default_branch) {
    try {
      push_holder = slots_->AcquirePushSlot(ctx);
    } catch (const std::exception& e) {
      ResetToRemote(target, "slot failure");
      ProcessResult r = ProcessResult::Failure(std::string("failed to acquire merge slot before push: ") + e.what());
      r.slot_timeout  = dynamic_cast<const util::SlotContentionTimeout*>(&e) != nullptr;
      return r;
    }
  }

  auto release = [&] {
    if (push_holder.empty()) return;
    try {
      slots_->Release(push_holder);
    } catch (const std::exception& e) {
      REFINERY_LOG_WARN("failed to release merge slot for push", {StringField("holder", push_holder), StringField("error", e.what())});
    }
  };

  // 9. push
  REFINERY_LOG_INFO("pushing", {StringField("remote", options_.remote), StringField("target", target)});
  try {
    git_->Push(options_.remote, target);
  } catch (const std::exception& e) {
    ResetToRemote(target, "push failure");
    release();
    return ProcessResult::Failure("failed to push to " + options_.remote + ": " + e.what());
  }
  release();

  REFINERY_LOG_INFO("successfully merged", {StringField("branch", branch), StringField("commit", ShortSha(merge_commit))});
  ProcessResult ok;
  ok.success      = true;
  ok.merge_commit = merge_commit;
  return ok;
}

} // namespace refinery::engine
