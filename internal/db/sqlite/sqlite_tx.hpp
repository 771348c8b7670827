#pragma once

#include <memory>
#include <mutex>

#include "sqlite_db.hpp"

namespace refinery::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock early, so two processes racing for the merge
      slot are serialized by sqlite itself
    - rolls back on scope exit unless committed
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit();
  void Rollback();

  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>              db_;
  std::unique_lock<std::recursive_mutex> lock_;
  bool                                   committed_ = false;
};

} // namespace refinery::db::sqlite
