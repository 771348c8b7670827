#include <cassert>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

#include "internal/beads/fields.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/command_runner.hpp"

/*
  Runs the whole pipeline against real repositories: a bare "remote", a
  seed clone that plays the upstream author, and the refinery's own clone.
*/

namespace {

namespace fs    = std::filesystem;
namespace model = refinery::beads::model;
using refinery::util::CommandSpec;
using refinery::util::Context;
using refinery::util::ProcessCommandRunner;
using refinery::util::ShellArgv;

refinery::util::CommandResult Sh(const fs::path& dir, const std::string& script) {
  ProcessCommandRunner runner;
  Context              ctx;
  CommandSpec          spec;
  spec.argv     = ShellArgv(script);
  spec.work_dir = dir.string();
  return runner.Run(spec, ctx);
}

std::string MustSh(const fs::path& dir, const std::string& script) {
  auto r = Sh(dir, script);
  if (!r.Ok()) {
    std::cerr << "command failed in " << dir << ": " << script << "\n" << r.stderr_text << "\n";
  }
  assert(r.Ok());
  while (!r.stdout_text.empty() && r.stdout_text.back() == '\n') r.stdout_text.pop_back();
  return r.stdout_text;
}

// merge-tree --write-tree needs git 2.38
bool GitUsable() {
  auto r = Sh(fs::temp_directory_path(), "git --version");
  if (!r.Ok()) return false;

  int major = 0;
  int minor = 0;
  if (std::sscanf(r.stdout_text.c_str(), "git version %d.%d", &major, &minor) != 2) return false;
  return major > 2 || (major == 2 && minor >= 38);
}

const char* kIdentity = "git config user.name 'Refinery Test' && git config user.email refinery@example.invalid";

struct Town {
  fs::path root;
  fs::path remote;
  fs::path seed;
  fs::path rig;

  Town() {
    root = fs::temp_directory_path() / ("refinery_git_pipeline_" + std::to_string(::getpid()));
    fs::remove_all(root);
    fs::create_directories(root);
    remote = root / "remote.git";
    seed   = root / "seed";
    rig    = root / "rig";

    MustSh(root, "git init -q --bare -b main remote.git");
    MustSh(root, "git init -q -b main seed");
    MustSh(seed, kIdentity);
    MustSh(seed, "echo base > README.md && git add README.md && git commit -q -m init");
    MustSh(seed, "git remote add origin ../remote.git && git push -q origin main");

    MustSh(root, "git clone -q remote.git rig");
    MustSh(rig, kIdentity);
  }

  ~Town() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void Branch(const std::string& branch, const std::string& file, const std::string& content, const std::string& message) {
    MustSh(rig, "git checkout -q -b " + branch + " && echo " + content + " > " + file + " && git add " + file + " && git commit -q -m '" + message +
                    "' && git checkout -q main");
  }

  std::string RemoteHead() {
    return MustSh(remote, "git rev-parse main");
  }
};

std::string CreateMR(refinery::beads::IssueStore& store, const std::string& branch) {
  refinery::beads::CreateOptions source;
  source.type  = model::kTypeTask;
  source.title = "Work on " + branch;
  model::Issue source_issue;
  assert(store.Create(source, &source_issue));

  refinery::beads::MRFields fields;
  fields.branch       = branch;
  fields.target       = "main";
  fields.source_issue = source_issue.id;
  fields.worker       = "nux";
  fields.rig          = "gastown";

  refinery::beads::CreateOptions mr;
  mr.type        = model::kTypeMergeRequest;
  mr.title       = "Merge " + branch;
  mr.description = refinery::beads::FormatMRDescription(fields);
  mr.labels      = {model::kLabelMergeRequest};
  model::Issue created;
  assert(store.Create(mr, &created));
  return created.id;
}

void TestMergeThenConflict() {
  Town town;

  auto config = refinery::config::ConfigLoader::LoadFromString("rig:\n  name: gastown\n  work_dir: " + town.rig.string() +
                                                               "\nstore:\n  issue_prefix: gt\n"
                                                               "merge_queue:\n  test_command: \"test -f README.md\"\n"
                                                               "merge_slot:\n  initial_backoff: 10ms\n  max_backoff: 50ms\n");
  auto app = refinery::factory::Build(config);

  // clean squash merge
  town.Branch("feature/x", "feature.txt", "hello", "Add feature x");
  const auto mr_id = CreateMR(*app.store, "feature/x");

  Context ctx;
  auto    merged = app.engineer->ProcessNext(ctx);
  if (!merged.result.success) std::cerr << "merge failed: " << merged.result.error << "\n";
  assert(merged.processed);
  assert(merged.mr.id == mr_id);
  assert(merged.result.success);
  assert(merged.result.merge_commit == town.RemoteHead());
  assert(MustSh(town.remote, "git log -1 --format=%s main") == "Add feature x");
  assert(MustSh(town.remote, "git show main:feature.txt") == "hello");
  assert(Sh(town.rig, "git show-ref --verify --quiet refs/heads/feature/x").exit_code == 1);

  auto closed = *app.store->Show(mr_id);
  assert(closed.status == model::kStatusClosed);
  assert(refinery::beads::ParseMRFields(closed)->merge_commit == merged.result.merge_commit);

  // upstream edits README while a worker edits it too
  MustSh(town.seed, "git pull -q --ff-only origin main");
  MustSh(town.seed, "echo upstream > README.md && git commit -q -am 'Upstream README' && git push -q origin main");
  town.Branch("feature/conflict", "README.md", "mine", "Rewrite README");
  const auto conflict_id = CreateMR(*app.store, "feature/conflict");

  auto failed = app.engineer->ProcessNext(ctx);
  assert(failed.processed);
  assert(failed.mr.id == conflict_id);
  assert(!failed.result.success);
  assert(failed.result.conflict);
  assert(failed.result.error == "merge conflicts in: [README.md]");
  assert(!failed.disposition.task_id.empty());

  auto blocked = *app.store->Show(conflict_id);
  assert(blocked.status == model::kStatusOpen);
  assert(blocked.blocked_by.size() == 1 && blocked.blocked_by[0] == failed.disposition.task_id);

  auto task = *app.store->Show(failed.disposition.task_id);
  assert(task.priority == 1);
  assert(task.description.find("- Conflict with: main@" + town.RemoteHead().substr(0, 8)) != std::string::npos);

  refinery::beads::ListOptions inbox;
  inbox.type = model::kTypeMessage;
  auto mail  = app.store->List(inbox);
  assert(mail.size() == 1);
  assert(mail[0].assignee == "gastown/witness");
  assert(mail[0].title == "MERGE_FAILED nux");

  // the remote never saw the conflicting branch
  assert(MustSh(town.remote, "git show main:README.md") == "upstream");
  assert(app.engineer->ListQueue().empty());
}

struct SquashCommit {
  std::string tree;
  std::string parent;
  std::string message;
};

SquashCommit ReadCommit(const fs::path& repo, const std::string& rev) {
  return {MustSh(repo, "git rev-parse " + rev + "^{tree}"), MustSh(repo, "git rev-parse " + rev + "^"),
          MustSh(repo, "git log -1 --format=%B " + rev)};
}

void TestRetryAfterSlotContentionReproducesSquash() {
  Town town;

  auto config = refinery::config::ConfigLoader::LoadFromString("rig:\n  name: gastown\n  work_dir: " + town.rig.string() +
                                                               "\nstore:\n  issue_prefix: gt\n"
                                                               "merge_queue:\n  test_command: \"test -f README.md\"\n"
                                                               "merge_slot:\n  max_retries: 0\n  initial_backoff: 10ms\n  max_backoff: 50ms\n");
  auto app = refinery::factory::Build(config);

  town.Branch("feature/y", "feature.txt", "slotted", "Add feature y");
  const auto mr_id   = CreateMR(*app.store, "feature/y");
  const auto base    = town.RemoteHead();
  const auto foreign = "gastown/polecats/nux";

  app.slots->EnsureExists();
  auto held = app.slots->Acquire(foreign, false);
  assert(held && held->holder == foreign);

  Context ctx;
  auto    blocked = app.engineer->ProcessNext(ctx);
  assert(blocked.processed);
  assert(!blocked.result.success);
  assert(blocked.result.slot_timeout);
  assert(town.RemoteHead() == base);

  // the squash was committed locally, then main went back to origin/main
  assert(MustSh(town.rig, "git rev-parse main") == MustSh(town.rig, "git rev-parse origin/main"));
  const auto first = ReadCommit(town.rig, "HEAD@{1}");
  assert(first.parent == base);
  assert(first.message == "Add feature y");

  auto waiting = *app.store->Show(mr_id);
  assert(waiting.status == model::kStatusOpen);
  assert(waiting.assignee.empty());

  app.slots->Release(foreign);

  auto merged = app.engineer->ProcessNext(ctx);
  if (!merged.result.success) std::cerr << "retry failed: " << merged.result.error << "\n";
  assert(merged.processed);
  assert(merged.mr.id == mr_id);
  assert(merged.result.success);
  assert(merged.result.merge_commit == town.RemoteHead());

  const auto pushed = ReadCommit(town.remote, "main");
  assert(pushed.tree == first.tree);
  assert(pushed.parent == first.parent);
  assert(pushed.message == first.message);
}

} // namespace

int main() {
  if (!GitUsable()) {
    std::cout << "refinery_integration_git_merge_pipeline: skipped (git 2.38+ not available)\n";
    return 0;
  }

  TestMergeThenConflict();
  TestRetryAfterSlotContentionReproducesSquash();

  std::cout << "refinery_integration_git_merge_pipeline: pass\n";
  return 0;
}
