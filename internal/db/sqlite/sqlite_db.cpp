#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace refinery::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError("open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreError(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets the CLI read while the daemon writes
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // several refinery processes may share one file; wait for locks
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr), db, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& s) {
  sqlite3_bind_text(stmt_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::BindInt(int idx, int v) {
  sqlite3_bind_int(stmt_, idx, v);
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int Statement::ColInt(int col) const {
  return sqlite3_column_int(stmt_, col);
}

} // namespace refinery::db::sqlite
