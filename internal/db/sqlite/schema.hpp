#pragma once

#include "sqlite_db.hpp"

namespace refinery::db::sqlite {

// Creates the issue, label, dependency and merge slot tables if missing.
void EnsureSchema(SqliteDB& db);

} // namespace refinery::db::sqlite
