#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace refinery::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the issue store and the slot store. Callers
  hold Mutex() for the span of a statement or transaction so two threads
  never interleave inside one BEGIN ... COMMIT.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::recursive_mutex& Mutex() {
    return mutex_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex mutex_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  void BindText(int idx, const std::string& s);
  void BindInt(int idx, int v);

  // SQLITE_ROW, SQLITE_DONE or an error code
  int Step();

  std::string ColText(int col) const;
  int         ColInt(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace refinery::db::sqlite
