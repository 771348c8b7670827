#include "cli_git.hpp"

#include <algorithm>
#include <sstream>

#include "internal/util/errors.hpp"

namespace refinery::git {

namespace {

std::string TrimRight(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
  return s;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::string Describe(const std::vector<std::string>& args) {
  std::string out = "git";
  for (const auto& a : args) out += " " + a;
  return out;
}

std::string FailureText(const util::CommandResult& r) {
  if (r.timed_out) return "timed out";
  if (r.cancelled) return "canceled";
  auto text = TrimRight(r.stderr_text);
  if (text.empty()) text = TrimRight(r.stdout_text);
  if (text.empty()) text = "exit status " + std::to_string(r.exit_code);
  return text;
}

bool IsZeroSha(const std::string& sha) {
  return std::all_of(sha.begin(), sha.end(), [](char c) { return c == '0'; });
}

} // namespace

CliGit::CliGit(std::shared_ptr<util::CommandRunner> runner, std::string work_dir, util::Duration timeout,
               std::shared_ptr<const util::Context> ctx)
    : runner_(std::move(runner)), work_dir_(std::move(work_dir)), timeout_(timeout), ctx_(std::move(ctx)) {
  if (!runner_) {
    throw util::InvalidArgument("command runner is required");
  }
  if (!ctx_) ctx_ = std::make_shared<util::Context>();
}

util::CommandResult CliGit::Exec(const std::vector<std::string>& args, const std::string& dir) const {
  util::CommandSpec spec;
  spec.argv.push_back("git");
  spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  spec.work_dir = dir;
  spec.timeout  = timeout_;
  // never block on a credential prompt
  spec.env["GIT_TERMINAL_PROMPT"] = "0";
  return runner_->Run(spec, *ctx_);
}

std::string CliGit::Run(const std::vector<std::string>& args) const {
  return RunIn(work_dir_, args);
}

std::string CliGit::RunIn(const std::string& dir, const std::vector<std::string>& args) const {
  auto r = Exec(args, dir);
  if (!r.Ok()) {
    throw util::GitError(Describe(args) + ": " + FailureText(r));
  }
  return r.stdout_text;
}

bool CliGit::RefExists(const std::string& ref) const {
  const std::vector<std::string> args = {"show-ref", "--verify", "--quiet", ref};

  auto r = Exec(args, work_dir_);
  if (r.Ok()) return true;
  if (r.exit_code == 1 && !r.timed_out && !r.cancelled) return false;
  throw util::GitError(Describe(args) + ": " + FailureText(r));
}

bool CliGit::BranchExists(const std::string& branch) {
  return RefExists("refs/heads/" + branch);
}

bool CliGit::RemoteTrackingBranchExists(const std::string& remote, const std::string& branch) {
  return RefExists("refs/remotes/" + remote + "/" + branch);
}

void CliGit::Checkout(const std::string& ref) {
  Run({"checkout", ref});
}

void CliGit::Pull(const std::string& remote, const std::string& branch) {
  Run({"pull", "--ff-only", remote, branch});
}

std::vector<std::string> CliGit::CheckConflicts(const std::string& source, const std::string& target) {
  const std::vector<std::string> args = {"merge-tree", "--write-tree", "--name-only", "--no-messages", target, source};

  auto r = Exec(args, work_dir_);
  if (r.Ok()) return {};
  if (r.exit_code != 1 || r.timed_out || r.cancelled) {
    throw util::GitError(Describe(args) + ": " + FailureText(r));
  }

  // first line is the tree id, conflicted paths follow until a blank line
  std::vector<std::string> files;
  const auto               lines = SplitLines(r.stdout_text);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    if (lines[i].empty()) break;
    if (std::find(files.begin(), files.end(), lines[i]) == files.end()) files.push_back(lines[i]);
  }
  if (files.empty()) {
    throw util::GitError(Describe(args) + ": conflict reported without paths");
  }
  return files;
}

std::vector<SubmoduleChange> CliGit::SubmoduleChanges(const std::string& base, const std::string& branch) {
  // :<old mode> <new mode> <old sha> <new sha> <status>\t<path>
  const auto out = Run({"diff", "--raw", "--no-abbrev", base + "..." + branch});

  std::vector<SubmoduleChange> changes;
  for (const auto& line : SplitLines(out)) {
    if (line.empty() || line[0] != ':') continue;

    const auto tab = line.find('\t');
    if (tab == std::string::npos) continue;

    std::istringstream meta(line.substr(1, tab - 1));
    std::string        old_mode, new_mode, old_sha, new_sha, status;
    meta >> old_mode >> new_mode >> old_sha >> new_sha >> status;
    if (old_mode != "160000" && new_mode != "160000") continue;

    SubmoduleChange change;
    change.path    = line.substr(tab + 1);
    change.old_sha = old_mode == "160000" && !IsZeroSha(old_sha) ? old_sha : "";
    change.new_sha = new_mode == "160000" && !IsZeroSha(new_sha) ? new_sha : "";
    changes.push_back(std::move(change));
  }
  return changes;
}

void CliGit::InitSubmodules() {
  Run({"submodule", "update", "--init", "--recursive"});
}

void CliGit::PushSubmoduleCommit(const std::string& path, const std::string& sha, const std::string& remote) {
  const std::string dir = work_dir_ + "/" + path;

  std::string branch = "main";
  auto        head   = Exec({"symbolic-ref", "--short", "refs/remotes/" + remote + "/HEAD"}, dir);
  if (head.Ok()) {
    const auto ref    = TrimRight(head.stdout_text);
    const auto prefix = remote + "/";
    if (ref.rfind(prefix, 0) == 0 && ref.size() > prefix.size()) branch = ref.substr(prefix.size());
  }

  RunIn(dir, {"push", remote, sha + ":refs/heads/" + branch});
}

void CliGit::MergeSquash(const std::string& branch, const std::string& message) {
  Run({"merge", "--squash", branch});
  Run({"commit", "-m", message});
}

void CliGit::AbortMerge() {
  // a squash merge leaves no MERGE_HEAD, so `merge --abort` does not apply
  Run({"reset", "--merge"});
}

std::vector<std::string> CliGit::ConflictingFiles() {
  std::vector<std::string> files;
  for (auto& line : SplitLines(Run({"diff", "--name-only", "--diff-filter=U"}))) {
    if (!line.empty()) files.push_back(std::move(line));
  }
  return files;
}

void CliGit::Push(const std::string& remote, const std::string& branch) {
  Run({"push", remote, branch});
}

void CliGit::ResetHard(const std::string& ref) {
  Run({"reset", "--hard", ref});
}

std::string CliGit::Rev(const std::string& ref) {
  return TrimRight(Run({"rev-parse", "--verify", ref}));
}

std::string CliGit::BranchCommitMessage(const std::string& branch) {
  auto message = TrimRight(Run({"log", "-1", "--format=%B", branch}));
  if (message.empty()) {
    throw util::GitError("branch " + branch + " has an empty head commit message");
  }
  return message;
}

void CliGit::DeleteBranch(const std::string& branch, bool force) {
  Run({"branch", force ? "-D" : "-d", branch});
}

} // namespace refinery::git
