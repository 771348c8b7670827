#include "internal/beads/fields.hpp"
#include "internal/beads/memory/memory_issue_store.hpp"
#include "internal/engine/outcome_handler.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "unit/support/fakes.hpp"
#include "unit/support/seed.hpp"

namespace {

using refinery::beads::memory::MemoryIssueStore;
using refinery::engine::ClassifyFailure;
using refinery::engine::FailureClass;
using refinery::engine::OutcomeHandler;
using refinery::engine::OutcomeOptions;
using refinery::engine::ProcessResult;
using refinery::queue::IssueToMRInfo;
using refinery::queue::MRInfo;
using refinery::slot::MergeSlotClient;
using refinery::testing::FakeGit;
using refinery::testing::RecordingNotifier;
using refinery::testing::ScriptedSlotStore;
using refinery::testing::Seed;
using refinery::testing::SeededMR;
namespace model = refinery::beads::model;

class RecordingConvoys : public refinery::convoy::ConvoyObserver {
 public:
  std::vector<std::string> checked;

  std::vector<std::string> CheckConvoysForIssue(const std::string& issue_id) override {
    checked.push_back(issue_id);
    return {};
  }
};

bool Has(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

struct Harness {
  std::shared_ptr<MemoryIssueStore>  store    = std::make_shared<MemoryIssueStore>("gt");
  std::shared_ptr<FakeGit>           git      = std::make_shared<FakeGit>();
  std::shared_ptr<ScriptedSlotStore> slots    = std::make_shared<ScriptedSlotStore>();
  std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
  std::shared_ptr<RecordingConvoys>  convoys  = std::make_shared<RecordingConvoys>();
  std::unique_ptr<OutcomeHandler>    handler;

  Harness() {
    OutcomeOptions options;
    options.rig_name = "gastown";
    handler          = std::make_unique<OutcomeHandler>(store, git, std::make_shared<MergeSlotClient>(slots, "gastown"), notifier, convoys,
                                                        options);
    git->revs["origin/main"] = "fedcba9876543210fedcba9876543210fedcba98";
  }

  MRInfo Mr(const SeededMR& seed) {
    auto issue = Seed(*store, seed);
    return IssueToMRInfo(*store->Show(issue.id), *refinery::beads::ParseMRFields(issue));
  }
};

SeededMR Default() {
  SeededMR s;
  s.id           = "gt-mr1";
  s.branch       = "polecat/nux/gt-src";
  s.source_issue = "gt-src";
  s.source_title = "Fix login redirect";
  s.agent_bead   = "gt-agent-nux";
  s.priority     = 2;
  return s;
}

ProcessResult Conflict() {
  ProcessResult r = ProcessResult::Failure("merge conflicts in: [a.go]");
  r.conflict      = true;
  return r;
}

void TestClassification() {
  ProcessResult ok;
  ok.success = true;
  assert(ClassifyFailure(ok) == FailureClass::None);

  auto both         = Conflict();
  both.tests_failed = true;
  both.slot_timeout = true;
  assert(ClassifyFailure(both) == FailureClass::Conflict);

  auto tests         = ProcessResult::Failure("tests failed");
  tests.tests_failed = true;
  tests.slot_timeout = true;
  assert(ClassifyFailure(tests) == FailureClass::Tests);

  auto slot         = ProcessResult::Failure("slot");
  slot.slot_timeout = true;
  assert(ClassifyFailure(slot) == FailureClass::SlotTimeout);

  assert(ClassifyFailure(ProcessResult::Failure("branch missing")) == FailureClass::Build);
  assert(std::string(refinery::engine::ToString(FailureClass::SlotTimeout)) == "slot-timeout");
}

void TestSuccessClosesEverything() {
  Harness h;
  auto    mr = h.Mr(Default());

  ProcessResult result;
  result.success      = true;
  result.merge_commit = "abc123";
  h.handler->HandleSuccess(mr, result);

  auto closed_mr = *h.store->Show("gt-mr1");
  assert(closed_mr.status == model::kStatusClosed);
  assert(closed_mr.close_reason == "merged");
  auto fields = *refinery::beads::ParseMRFields(closed_mr);
  assert(fields.merge_commit == "abc123");
  assert(fields.close_reason == "merged");
  assert(fields.branch == "polecat/nux/gt-src");

  auto source = *h.store->Show("gt-src");
  assert(source.status == model::kStatusClosed);
  assert(source.close_reason == "Merged in gt-mr1");

  assert(h.convoys->checked == std::vector<std::string>{"gt-src"});
  assert(refinery::beads::GetAgentActiveMR(h.store->Show("gt-agent-nux")->description).empty());
  assert(h.git->deleted == std::vector<std::string>{"polecat/nux/gt-src"});

  // conflict identity released in case a resolution still held it
  assert(h.slots->released == std::vector<std::string>{"gastown/refinery"});
  assert(h.notifier->sent.empty());
}

void TestSuccessToleratesMissingSourceIssue() {
  Harness h;
  auto    seed    = Default();
  seed.agent_bead = "";
  auto mr         = h.Mr(seed);
  mr.source_issue = "gt-gone";

  ProcessResult result;
  result.success = true;
  h.handler->HandleSuccess(mr, result);

  assert(h.store->Show("gt-mr1")->status == model::kStatusClosed);
  assert(h.convoys->checked.empty());
}

void TestConflictFilesBlockingTask() {
  Harness h;
  auto    mr = h.Mr(Default());

  const auto d = h.handler->HandleFailure(mr, Conflict());
  assert(d.failure_class == FailureClass::Conflict);
  assert(d.notified);
  assert(!d.deferred);
  assert(!d.task_id.empty());

  auto task = *h.store->Show(d.task_id);
  assert(task.type == model::kTypeTask);
  assert(task.title == "Resolve merge conflicts: Fix login redirect");
  assert(task.priority == 1);
  assert(task.created_by == "gastown/refinery");
  assert(Has(task.description, "- Original MR: gt-mr1"));
  assert(Has(task.description, "- Conflict with: main@fedcba98"));
  assert(Has(task.description, "- Retry count: 1"));
  assert(Has(task.description, "git rebase origin/main"));

  auto blocked = *h.store->Show("gt-mr1");
  assert(blocked.blocked_by == std::vector<std::string>{d.task_id});
  assert(refinery::beads::ParseMRFields(blocked)->retry_count == 1);

  assert(h.notifier->sent.size() == 1);
  const auto& msg = h.notifier->sent[0];
  assert(msg.to == "gastown/witness");
  assert(msg.from == "gastown/refinery");
  assert(msg.subject == "MERGE_FAILED nux");
  assert(Has(msg.body, "Failure-Type: conflict\n"));
  assert(Has(msg.body, "Branch: polecat/nux/gt-src\n"));

  // the conflict slot stays held until the next successful merge
  assert(h.slots->released.empty());
}

void TestConflictTaskPriorityFloorsAtZero() {
  Harness h;
  auto    seed = Default();
  seed.priority = 0;
  auto mr       = h.Mr(seed);

  const auto d = h.handler->HandleFailure(mr, Conflict());
  assert(h.store->Show(d.task_id)->priority == 0);
}

void TestConflictUnknownTargetSha() {
  Harness h;
  h.git->revs.erase("origin/main");
  auto mr = h.Mr(Default());

  const auto d = h.handler->HandleFailure(mr, Conflict());
  assert(Has(h.store->Show(d.task_id)->description, "main@unknown-"));
}

void TestConflictDeferredWhenSlotHeld() {
  Harness h;
  h.slots->script.push_back(ScriptedSlotStore::HeldBy("gastown/refinery/push/1-1"));
  auto mr = h.Mr(Default());

  const auto d = h.handler->HandleFailure(mr, Conflict());
  assert(d.deferred);
  assert(d.task_id.empty());
  assert(d.notified);
  assert(h.store->Show("gt-mr1")->blocked_by.empty());

  refinery::beads::ListOptions tasks;
  tasks.type = model::kTypeTask;
  // only the seeded source issue
  assert(h.store->List(tasks).size() == 1);
}

void TestTaskFailureReleasesConflictSlot() {
  Harness h;
  auto    mr = h.Mr(Default());
  mr.id      = "gt-missing"; // blocking edge cannot be added

  const auto d = h.handler->HandleFailure(mr, Conflict());
  assert(d.task_id.empty());
  assert(!d.deferred);
  assert(h.slots->released == std::vector<std::string>{"gastown/refinery"});
}

void TestTestFailureNotifiesWithoutTask() {
  Harness h;
  auto    mr = h.Mr(Default());

  auto result         = ProcessResult::Failure("tests failed after 1 attempts: exit status 1");
  result.tests_failed = true;

  const auto d = h.handler->HandleFailure(mr, result);
  assert(d.failure_class == FailureClass::Tests);
  assert(d.notified);
  assert(d.task_id.empty());
  assert(Has(h.notifier->sent[0].body, "Failure-Type: tests\n"));
  assert(Has(h.notifier->sent[0].body, "Error: tests failed after 1 attempts: exit status 1\n"));
  assert(h.slots->AcquireCalls() == 0);
}

void TestSlotTimeoutStaysQuiet() {
  Harness h;
  auto    mr = h.Mr(Default());

  auto result         = ProcessResult::Failure("merge slot contention timeout after 10 retries");
  result.slot_timeout = true;

  const auto d = h.handler->HandleFailure(mr, result);
  assert(d.failure_class == FailureClass::SlotTimeout);
  assert(!d.notified);
  assert(h.notifier->sent.empty());
  assert(h.store->Show("gt-mr1")->status == model::kStatusOpen);
}

void TestNotifierFailureStillEscalates() {
  Harness h;
  h.notifier->fails = true;
  auto mr           = h.Mr(Default());

  const auto d = h.handler->HandleFailure(mr, Conflict());
  assert(!d.notified);
  assert(!d.task_id.empty());
}

void TestRequiresCollaborators() {
  bool threw = false;
  try {
    OutcomeHandler handler(nullptr, std::make_shared<FakeGit>(), nullptr, nullptr, nullptr, OutcomeOptions{});
  } catch (const refinery::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestClassification();
  TestSuccessClosesEverything();
  TestSuccessToleratesMissingSourceIssue();
  TestConflictFilesBlockingTask();
  TestConflictTaskPriorityFloorsAtZero();
  TestConflictUnknownTargetSha();
  TestConflictDeferredWhenSlotHeld();
  TestTaskFailureReleasesConflictSlot();
  TestTestFailureNotifiesWithoutTask();
  TestSlotTimeoutStaysQuiet();
  TestNotifierFailureStillEscalates();
  TestRequiresCollaborators();

  std::cout << "refinery_unit_outcome_handler: pass\n";
  return 0;
}
