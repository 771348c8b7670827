#include "merge_slot.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace refinery::slot {

using observability::IntField;
using observability::StringField;

std::string MergeSlotId(const std::string& issue_prefix) {
  return issue_prefix + "-merge-slot";
}

HolderSequence::HolderSequence(NowFn now) : now_(std::move(now)) {
}

std::string HolderSequence::Next(const std::string& rig_name) {
  const uint64_t seq = seq_.fetch_add(1) + 1;
  return rig_name + "/refinery/push/" + std::to_string(util::ToUnixNanos(now_())) + "-" + std::to_string(seq);
}

MergeSlotClient::MergeSlotClient(std::shared_ptr<MergeSlotStore> store, std::string rig_name, MergeSlotOptions options,
                                 std::shared_ptr<HolderSequence> sequence)
    : store_(std::move(store)),
      rig_name_(std::move(rig_name)),
      conflict_holder_(rig_name_ + "/refinery"),
      options_(options),
      sequence_(sequence ? std::move(sequence) : std::make_shared<HolderSequence>()) {
  if (!store_) {
    throw util::InvalidArgument("merge slot store is required");
  }
  if (options_.max_retries < 0) {
    throw util::InvalidArgument("merge slot max_retries must not be negative");
  }
  if (options_.initial_backoff <= util::Duration::zero()) {
    options_.initial_backoff = std::chrono::milliseconds(500);
  }
  if (options_.max_backoff < options_.initial_backoff) {
    options_.max_backoff = options_.initial_backoff;
  }
}

std::string MergeSlotClient::AcquirePushSlot(const util::Context& ctx) {
  std::string slot_id;
  try {
    slot_id = store_->EnsureExists();
  } catch (const std::exception& e) {
    throw util::InfrastructureError(std::string("ensure merge slot exists: ") + e.what());
  }

  const std::string holder  = sequence_->Next(rig_name_);
  util::Duration    backoff = options_.initial_backoff;

  for (int attempt = 0; attempt <= options_.max_retries; ++attempt) {
    if (attempt > 0) {
      REFINERY_LOG_INFO("merge slot held, retrying", {StringField("slot", slot_id), StringField("backoff", util::FormatDuration(backoff)),
                                                      IntField("attempt", attempt), IntField("max_retries", options_.max_retries)});
      if (ctx.WaitFor(backoff)) {
        throw util::Cancelled("acquire merge slot " + slot_id + ": context canceled");
      }
      backoff = std::min(backoff * 2, options_.max_backoff);
    }

    std::optional<MergeSlotStatus> status;
    try {
      status = store_->Acquire(holder, false);
    } catch (const std::exception& e) {
      throw util::InfrastructureError("acquire merge slot " + slot_id + " (" + holder + "): " + e.what());
    }
    if (!status) {
      throw util::InfrastructureError("acquire merge slot " + slot_id + " (" + holder + "): empty status");
    }
    if (status->available || status->holder == holder) {
      return holder;
    }
    if (status->holder == conflict_holder_) {
      REFINERY_LOG_INFO("merge slot held by conflict resolution, proceeding", {StringField("slot", slot_id)});
      return "";
    }
  }

  throw util::SlotContentionTimeout("merge slot " + slot_id + ": merge slot contention timeout after " + std::to_string(options_.max_retries) +
                                    " retries");
}

ConflictSlotResult MergeSlotClient::AcquireConflictSlot() {
  ConflictSlotResult result;

  std::string slot_id;
  try {
    slot_id = store_->EnsureExists();
  } catch (const std::exception& e) {
    result.error = std::string("ensure merge slot exists: ") + e.what();
    REFINERY_LOG_WARN("could not ensure merge slot", {StringField("error", result.error)});
    return result;
  }

  std::optional<MergeSlotStatus> status;
  try {
    status = store_->Acquire(conflict_holder_, false);
  } catch (const std::exception& e) {
    result.error = std::string("acquire merge slot: ") + e.what();
    REFINERY_LOG_WARN("could not acquire merge slot", {StringField("slot", slot_id), StringField("error", result.error)});
    return result;
  }
  if (!status) {
    result.error = "merge slot returned empty status";
    REFINERY_LOG_WARN("merge slot returned empty status", {StringField("slot", slot_id)});
    return result;
  }

  if (!status->available && !status->holder.empty() && status->holder != conflict_holder_) {
    result.outcome = ConflictSlotOutcome::HeldByOther;
    result.holder  = status->holder;
    return result;
  }

  result.outcome = ConflictSlotOutcome::Acquired;
  result.holder  = conflict_holder_;
  REFINERY_LOG_INFO("acquired merge slot", {StringField("slot", slot_id), StringField("holder", conflict_holder_)});
  return result;
}

void MergeSlotClient::Release(const std::string& holder) {
  if (holder.empty()) return;
  store_->Release(holder);
}

} // namespace refinery::slot
