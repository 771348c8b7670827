#include "memory_slot_store.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace refinery::slot {

MemorySlotStore::MemorySlotStore(std::string slot_id) : slot_id_(std::move(slot_id)) {
}

std::string MemorySlotStore::EnsureExists() {
  std::lock_guard lock(mutex_);
  state_.exists = true;
  return slot_id_;
}

std::optional<MergeSlotStatus> MemorySlotStore::Acquire(const std::string& holder, bool add_waiter) {
  if (holder.empty()) {
    throw util::InvalidArgument("merge slot holder is empty");
  }

  std::lock_guard lock(mutex_);
  if (!state_.exists) {
    throw util::NotFound("merge slot " + slot_id_ + " does not exist");
  }

  MergeSlotStatus status;
  status.id = slot_id_;

  if (state_.holder.empty() || state_.holder == holder) {
    state_.holder = holder;
    state_.waiters.erase(std::remove(state_.waiters.begin(), state_.waiters.end(), holder), state_.waiters.end());
    status.available = true;
    status.holder    = holder;
    status.waiters   = state_.waiters;
    return status;
  }

  if (add_waiter && std::find(state_.waiters.begin(), state_.waiters.end(), holder) == state_.waiters.end()) {
    state_.waiters.push_back(holder);
  }
  status.available = false;
  status.holder    = state_.holder;
  status.waiters   = state_.waiters;
  return status;
}

void MemorySlotStore::Release(const std::string& holder) {
  std::lock_guard lock(mutex_);
  if (state_.holder != holder) {
    throw util::InvalidState("merge slot " + slot_id_ + " is not held by " + holder);
  }
  state_.holder.clear();
}

std::optional<MergeSlotStatus> MemorySlotStore::Status() {
  std::lock_guard lock(mutex_);
  if (!state_.exists) return std::nullopt;

  MergeSlotStatus status;
  status.id        = slot_id_;
  status.available = state_.holder.empty();
  status.holder    = state_.holder;
  status.waiters   = state_.waiters;
  return status;
}

} // namespace refinery::slot
