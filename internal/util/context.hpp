#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace refinery::util {

/*
  Cancellation token shared between the queue worker and the pipeline.

  Waits are interruptible: Cancel() wakes every WaitFor() immediately.
*/
class Context {
 public:
  Context() = default;

  Context(const Context&)            = delete;
  Context& operator=(const Context&) = delete;

  void Cancel();

  bool IsCancelled() const;

  // Sleeps up to `duration`. Returns true when cancelled before or during the wait.
  bool WaitFor(std::chrono::nanoseconds duration) const;

  // Throws util::Cancelled("<what>: context canceled") if cancelled.
  void ThrowIfCancelled(const std::string& what) const;

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            cancelled_ = false;
};

} // namespace refinery::util
