#pragma once

#include <optional>
#include <string>
#include <vector>

namespace refinery::slot {

struct MergeSlotStatus {
  std::string              id;
  bool                     available = false;
  std::string              holder;
  std::vector<std::string> waiters;
};

/*
  Persistence for the per-rig merge slot.

  Acquire(holder) succeeds when the slot is free or already held by
  `holder`; the returned status then has available=true and holder set to
  the caller. Otherwise it reports the current holder with available=false.

  Backend failures throw util::StoreError. A nullopt status means the
  backend answered with nothing, which callers treat as an infrastructure
  error as well.
*/
class MergeSlotStore {
 public:
  virtual ~MergeSlotStore() = default;

  // Idempotent. Returns the slot id.
  virtual std::string EnsureExists() = 0;

  virtual std::optional<MergeSlotStatus> Acquire(const std::string& holder, bool add_waiter) = 0;

  // Throws util::InvalidState when `holder` does not hold the slot.
  virtual void Release(const std::string& holder) = 0;

  virtual std::optional<MergeSlotStatus> Status() = 0;
};

// "<issue prefix>-merge-slot"
std::string MergeSlotId(const std::string& issue_prefix);

} // namespace refinery::slot
