#include "schema.hpp"

#include <string>
#include <vector>

namespace refinery::db::sqlite {

void EnsureSchema(SqliteDB& db) {
  static const std::vector<std::string> statements = {
      "CREATE TABLE IF NOT EXISTS issues (id TEXT PRIMARY KEY, type TEXT NOT NULL, status TEXT NOT NULL, title TEXT NOT NULL, description TEXT NOT NULL "
      "DEFAULT '', priority INTEGER NOT NULL DEFAULT 2, assignee TEXT NOT NULL DEFAULT '', created_by TEXT NOT NULL DEFAULT '', created_at TEXT NOT "
      "NULL, updated_at TEXT NOT NULL, closed_at TEXT NOT NULL DEFAULT '', close_reason TEXT NOT NULL DEFAULT '', seq INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS issues_type_status ON issues(type, status);",
      "CREATE TABLE IF NOT EXISTS issue_labels (issue_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE, label TEXT NOT NULL, PRIMARY KEY "
      "(issue_id, label));",
      "CREATE TABLE IF NOT EXISTS dependencies (issue_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE, depends_on_id TEXT NOT NULL, type TEXT "
      "NOT NULL, created_at TEXT NOT NULL, PRIMARY KEY (issue_id, depends_on_id, type));",
      "CREATE INDEX IF NOT EXISTS dependencies_target ON dependencies(depends_on_id, type);",
      "CREATE TABLE IF NOT EXISTS merge_slots (id TEXT PRIMARY KEY, holder TEXT NOT NULL DEFAULT '', acquired_at TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS merge_slot_waiters (slot_id TEXT NOT NULL REFERENCES merge_slots(id) ON DELETE CASCADE, waiter TEXT NOT NULL, "
      "PRIMARY KEY (slot_id, waiter));"};

  std::lock_guard lock(db.Mutex());
  for (const auto& sql : statements) {
    db.Exec(sql);
  }
}

} // namespace refinery::db::sqlite
