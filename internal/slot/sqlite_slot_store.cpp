#include "sqlite_slot_store.hpp"

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace refinery::slot {

using db::sqlite::SqliteTransaction;
using db::sqlite::Statement;

namespace {

void StepOrThrow(sqlite3* db, Statement& st, const char* what) {
  const int rc = st.Step();
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw util::StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteSlotStore::SqliteSlotStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::string slot_id) : db_(std::move(db)), slot_id_(std::move(slot_id)) {
}

std::string SqliteSlotStore::EnsureExists() {
  SqliteTransaction tx(db_);

  Statement st(tx.Handle(), "INSERT OR IGNORE INTO merge_slots(id) VALUES(?);");
  st.BindText(1, slot_id_);
  StepOrThrow(tx.Handle(), st, "ensure merge slot");

  tx.Commit();
  return slot_id_;
}

std::optional<MergeSlotStatus> SqliteSlotStore::ReadStatus() {
  auto* db = db_->Handle();

  Statement st(db, "SELECT holder FROM merge_slots WHERE id=?;");
  st.BindText(1, slot_id_);
  const int rc = st.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw util::StoreError(std::string("read merge slot: ") + sqlite3_errmsg(db));

  MergeSlotStatus status;
  status.id        = slot_id_;
  status.holder    = st.ColText(0);
  status.available = status.holder.empty();

  Statement waiters(db, "SELECT waiter FROM merge_slot_waiters WHERE slot_id=? ORDER BY rowid;");
  waiters.BindText(1, slot_id_);
  int wrc;
  while ((wrc = waiters.Step()) == SQLITE_ROW) status.waiters.push_back(waiters.ColText(0));
  if (wrc != SQLITE_DONE) throw util::StoreError(std::string("read merge slot waiters: ") + sqlite3_errmsg(db));

  return status;
}

std::optional<MergeSlotStatus> SqliteSlotStore::Acquire(const std::string& holder, bool add_waiter) {
  if (holder.empty()) {
    throw util::InvalidArgument("merge slot holder is empty");
  }

  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  auto current = ReadStatus();
  if (!current) {
    throw util::NotFound("merge slot " + slot_id_ + " does not exist");
  }

  if (current->available || current->holder == holder) {
    Statement take(db, "UPDATE merge_slots SET holder=?, acquired_at=? WHERE id=?;");
    take.BindText(1, holder);
    take.BindText(2, util::FormatRfc3339(util::Now()));
    take.BindText(3, slot_id_);
    StepOrThrow(db, take, "acquire merge slot");

    Statement unwait(db, "DELETE FROM merge_slot_waiters WHERE slot_id=? AND waiter=?;");
    unwait.BindText(1, slot_id_);
    unwait.BindText(2, holder);
    StepOrThrow(db, unwait, "acquire merge slot");
  } else if (add_waiter) {
    Statement wait(db, "INSERT OR IGNORE INTO merge_slot_waiters(slot_id,waiter) VALUES(?,?);");
    wait.BindText(1, slot_id_);
    wait.BindText(2, holder);
    StepOrThrow(db, wait, "add merge slot waiter");
  }

  auto after = ReadStatus();
  tx.Commit();

  if (after && after->holder == holder) {
    after->available = true;
  }
  return after;
}

void SqliteSlotStore::Release(const std::string& holder) {
  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  auto current = ReadStatus();
  if (!current) {
    throw util::NotFound("merge slot " + slot_id_ + " does not exist");
  }
  if (current->holder != holder) {
    throw util::InvalidState("merge slot " + slot_id_ + " is not held by " + holder);
  }

  Statement st(db, "UPDATE merge_slots SET holder='', acquired_at='' WHERE id=?;");
  st.BindText(1, slot_id_);
  StepOrThrow(db, st, "release merge slot");

  tx.Commit();
}

std::optional<MergeSlotStatus> SqliteSlotStore::Status() {
  std::lock_guard lock(db_->Mutex());
  return ReadStatus();
}

} // namespace refinery::slot
