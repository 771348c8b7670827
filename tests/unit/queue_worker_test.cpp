#include "internal/engine/queue_worker.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "unit/support/engineer_rig.hpp"

namespace {

using namespace std::chrono;
using refinery::engine::QueueWorker;
using refinery::engine::QueueWorkerOptions;
using refinery::testing::EngineerRig;
using refinery::util::Context;
namespace model = refinery::beads::model;

int OpenMRs(EngineerRig& rig) {
  refinery::beads::ListOptions options;
  options.type   = model::kTypeMergeRequest;
  options.status = model::kStatusOpen;
  return static_cast<int>(rig.store->List(options).size());
}

void TestRunOnceHonoursMaxConcurrent() {
  EngineerRig rig;
  rig.Add("gt-1", "polecat/one", 2);
  rig.Add("gt-2", "polecat/two", 2);
  rig.Add("gt-3", "polecat/three", 2);

  QueueWorkerOptions options;
  options.max_concurrent = 2;
  QueueWorker worker(rig.engineer, options);

  Context ctx;
  assert(worker.RunOnce(ctx) == 2);
  assert(OpenMRs(rig) == 1);
  assert(worker.RunOnce(ctx) == 1);
  assert(worker.RunOnce(ctx) == 0);
}

void TestFailedMRWaitsForNextCycle() {
  EngineerRig rig;
  refinery::testing::SeededMR broken;
  broken.id           = "gt-1";
  broken.branch       = "polecat/gone";
  broken.source_issue = "gt-1-src";
  broken.priority     = 0;
  refinery::testing::Seed(*rig.store, broken);
  rig.Add("gt-2", "polecat/two", 2);

  QueueWorkerOptions options;
  options.max_concurrent = 3;
  QueueWorker worker(rig.engineer, options);

  Context ctx;
  assert(worker.RunOnce(ctx) == 2);
  assert(rig.notifier->sent.size() == 1);
  assert(rig.git->pushes == 1);
  assert(OpenMRs(rig) == 1);

  // retried once per cycle
  assert(worker.RunOnce(ctx) == 1);
  assert(rig.notifier->sent.size() == 2);
}

void TestBackgroundLoopDrainsQueue() {
  EngineerRig rig;
  rig.Add("gt-1", "polecat/one", 2);
  rig.Add("gt-2", "polecat/two", 1);

  QueueWorkerOptions options;
  options.poll_interval = milliseconds(10);
  QueueWorker worker(rig.engineer, options);
  worker.Start();
  assert(worker.Running());

  const auto deadline = steady_clock::now() + seconds(10);
  while (OpenMRs(rig) > 0 && steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  worker.Stop();
  assert(!worker.Running());
  assert(OpenMRs(rig) == 0);
  assert(rig.git->pushes == 2);
}

void TestStopInterruptsLongPoll() {
  EngineerRig rig;
  QueueWorkerOptions options;
  options.poll_interval = hours(1);
  QueueWorker worker(rig.engineer, options);
  worker.Start();
  std::this_thread::sleep_for(milliseconds(20));

  const auto started = steady_clock::now();
  worker.Stop();
  assert(steady_clock::now() - started < seconds(5));
}

void TestStopCancelsSharedContext() {
  EngineerRig rig;
  auto        shutdown = std::make_shared<Context>();
  QueueWorker worker(rig.engineer, QueueWorkerOptions{}, shutdown);
  worker.Start();
  worker.Stop();
  assert(shutdown->IsCancelled());
}

void TestRejectsBadOptions() {
  EngineerRig        rig;
  QueueWorkerOptions options;
  options.poll_interval = milliseconds(0);
  bool threw            = false;
  try {
    QueueWorker worker(rig.engineer, options);
  } catch (const refinery::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRunOnceHonoursMaxConcurrent();
  TestFailedMRWaitsForNextCycle();
  TestBackgroundLoopDrainsQueue();
  TestStopInterruptsLongPoll();
  TestStopCancelsSharedContext();
  TestRejectsBadOptions();

  std::cout << "refinery_unit_queue_worker: pass\n";
  return 0;
}
