#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "internal/engine/engineer.hpp"
#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

namespace refinery::engine {

struct QueueWorkerOptions {
  util::Duration poll_interval  = std::chrono::seconds(30);
  int            max_concurrent = 1; // MRs per cycle
};

/*
  Background thread that drains the merge queue.

  Each cycle processes up to max_concurrent MRs one after another, then
  sleeps poll_interval. Stop() cancels the context, which also interrupts a
  running test command or slot backoff. Pass the same context to CliGit so a
  running git command is killed too.
*/
class QueueWorker {
 public:
  QueueWorker(std::shared_ptr<Engineer> engineer, QueueWorkerOptions options, std::shared_ptr<util::Context> ctx = nullptr);
  ~QueueWorker();

  void Start();
  void Stop();

  // One cycle on the caller's thread. Returns the number of MRs processed.
  int RunOnce(const util::Context& ctx);

  bool Running() const {
    return running_;
  }

 private:
  void Run();

  std::shared_ptr<Engineer> engineer_;
  QueueWorkerOptions        options_;

  std::shared_ptr<util::Context> ctx_;
  std::thread                    thread_;
  std::atomic<bool>              running_{false};
};

} // namespace refinery::engine
