#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/slot/slot_store.hpp"
#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

namespace refinery::slot {

/*
  Issues unique push-holder tokens: "<rig>/refinery/push/<unix-nanos>-<seq>".

  The sequence keeps tokens distinct when two calls read the same clock
  value.
*/
class HolderSequence {
 public:
  using NowFn = std::function<util::TimePoint()>;

  explicit HolderSequence(NowFn now = util::Now);

  std::string Next(const std::string& rig_name);

 private:
  NowFn                 now_;
  std::atomic<uint64_t> seq_{0};
};

struct MergeSlotOptions {
  int            max_retries     = 10;
  util::Duration initial_backoff = std::chrono::milliseconds(500);
  util::Duration max_backoff     = std::chrono::seconds(10);
};

enum class ConflictSlotOutcome {
  Acquired,
  HeldByOther,
  Unavailable,
};

struct ConflictSlotResult {
  ConflictSlotOutcome outcome = ConflictSlotOutcome::Unavailable;
  std::string         holder; // ours when acquired, the other holder otherwise
  std::string         error;  // set for Unavailable
};

/*
  Merge slot protocol for one rig.

  Push path: a fresh token per attempt, retried with capped exponential
  backoff. Conflict path: one attempt under the fixed "<rig>/refinery"
  identity. A push that finds the slot held by that identity proceeds
  without acquiring, because both paths run on the same serial engineer.
*/
class MergeSlotClient {
 public:
  MergeSlotClient(std::shared_ptr<MergeSlotStore> store, std::string rig_name, MergeSlotOptions options = {},
                  std::shared_ptr<HolderSequence> sequence = nullptr);

  // Returns the holder to release later, or "" when the conflict holder
  // already owns the slot.
  // Throws util::SlotContentionTimeout when retries run out,
  // util::InfrastructureError when the store fails and util::Cancelled.
  std::string AcquirePushSlot(const util::Context& ctx);

  ConflictSlotResult AcquireConflictSlot();

  // No-op for "". Store errors propagate.
  void Release(const std::string& holder);

  const std::string& ConflictHolder() const {
    return conflict_holder_;
  }

  const MergeSlotOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<MergeSlotStore> store_;
  std::string                     rig_name_;
  std::string                     conflict_holder_;
  MergeSlotOptions                options_;
  std::shared_ptr<HolderSequence> sequence_;
};

} // namespace refinery::slot
