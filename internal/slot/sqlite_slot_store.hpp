#pragma once

#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/slot/slot_store.hpp"

namespace refinery::slot {

/*
  Merge slot row in the shared sqlite database.

  Acquire runs inside BEGIN IMMEDIATE, so refinery processes on different
  hosts sharing one database file still see a single holder.
*/
class SqliteSlotStore final : public MergeSlotStore {
 public:
  SqliteSlotStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::string slot_id);

  std::string                    EnsureExists() override;
  std::optional<MergeSlotStatus> Acquire(const std::string& holder, bool add_waiter) override;
  void                           Release(const std::string& holder) override;
  std::optional<MergeSlotStatus> Status() override;

 private:
  // caller holds the transaction
  std::optional<MergeSlotStatus> ReadStatus();

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  const std::string                     slot_id_;
};

} // namespace refinery::slot
