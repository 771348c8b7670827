#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "internal/util/context.hpp"

namespace refinery::util {

struct CommandSpec {
  std::vector<std::string> argv;
  std::string              work_dir;

  // Applied to the child only, on top of the inherited environment.
  std::map<std::string, std::string> env;

  // zero = no limit
  std::chrono::nanoseconds timeout{0};
};

struct CommandResult {
  int         exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool        timed_out = false;
  bool        cancelled = false;

  bool Ok() const {
    return exit_code == 0 && !timed_out && !cancelled;
  }
};

/*
  Runs external commands (git, test suites, convoy feeds).

  A non-zero exit is reported in the result, not thrown. Failure to start
  the process at all throws util::InfrastructureError.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const CommandSpec& spec, const Context& ctx) = 0;
};

/*
  fork/exec implementation.

  The child gets its own process group so a timeout or cancellation kills
  the whole tree (a test runner and everything it spawned).
*/
class ProcessCommandRunner : public CommandRunner {
 public:
  CommandResult Run(const CommandSpec& spec, const Context& ctx) override;
};

// {"sh", "-c", command}
std::vector<std::string> ShellArgv(const std::string& command);

} // namespace refinery::util
