#include "context.hpp"

#include "internal/util/errors.hpp"

namespace refinery::util {

void Context::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool Context::IsCancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

bool Context::WaitFor(std::chrono::nanoseconds duration) const {
  std::unique_lock lock(mutex_);
  if (duration <= std::chrono::nanoseconds::zero()) {
    return cancelled_;
  }
  return cv_.wait_for(lock, duration, [&] { return cancelled_; });
}

void Context::ThrowIfCancelled(const std::string& what) const {
  if (IsCancelled()) {
    throw Cancelled(what + ": context canceled");
  }
}

} // namespace refinery::util
