#pragma once

#include <memory>
#include <string>

#include "internal/engine/process_result.hpp"
#include "internal/git/git.hpp"
#include "internal/queue/mr_info.hpp"
#include "internal/slot/merge_slot.hpp"
#include "internal/util/command_runner.hpp"
#include "internal/util/context.hpp"

namespace refinery::engine {

struct ProcessorOptions {
  std::string default_branch{"main"};
  std::string remote{"origin"};

  bool           run_tests = true;
  std::string    test_command;
  int            retry_flaky_tests = 1;
  util::Duration test_timeout      = std::chrono::minutes(30);
};

// Throws util::InvalidArgument for an empty or blank command.
void ValidateTestCommand(const std::string& command);

/*
  One merge attempt: verify, checkout, conflict probe, submodules, tests,
  squash merge, slot-guarded push.

  Every step can be re-run from the top after any failure. A failed push
  or slot acquisition resets the target to the remote so the next attempt
  starts from a clean tree.
*/
class MergeProcessor {
 public:
  MergeProcessor(std::shared_ptr<git::Git> git, std::shared_ptr<slot::MergeSlotClient> slots, std::shared_ptr<util::CommandRunner> runner,
                 ProcessorOptions options);

  ProcessResult Process(const util::Context& ctx, const queue::MRInfo& mr);

  ProcessResult DoMerge(const util::Context& ctx, const std::string& branch, const std::string& target, const std::string& source_issue);

  // success, or failure with tests_failed set when every attempt failed
  ProcessResult RunTests(const util::Context& ctx);

  const ProcessorOptions& Options() const {
    return options_;
  }

 private:
  void SyncSubmodules(const std::string& branch, const std::string& target);
  void ResetToRemote(const std::string& target, const char* after);

  std::shared_ptr<git::Git>               git_;
  std::shared_ptr<slot::MergeSlotClient>  slots_;
  std::shared_ptr<util::CommandRunner>    runner_;
  ProcessorOptions                        options_;
};

} // namespace refinery::engine
