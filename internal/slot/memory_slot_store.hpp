#pragma once

#include <mutex>

#include "internal/slot/slot_store.hpp"

namespace refinery::slot {

class MemorySlotStore final : public MergeSlotStore {
 public:
  explicit MemorySlotStore(std::string slot_id);

  std::string                    EnsureExists() override;
  std::optional<MergeSlotStatus> Acquire(const std::string& holder, bool add_waiter) override;
  void                           Release(const std::string& holder) override;
  std::optional<MergeSlotStatus> Status() override;

 private:
  struct State {
    bool                     exists = false;
    std::string              holder;
    std::vector<std::string> waiters;
  };

  const std::string slot_id_;

  std::mutex mutex_;
  State      state_;
};

} // namespace refinery::slot
