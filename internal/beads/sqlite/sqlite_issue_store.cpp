#include "sqlite_issue_store.hpp"

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace refinery::beads::sqlite {

using db::sqlite::SqliteTransaction;
using db::sqlite::Statement;

namespace {

constexpr const char* kIssueColumns =
    "SELECT id,type,status,title,description,priority,assignee,created_by,created_at,updated_at,closed_at,close_reason FROM issues ";

model::Issue ReadIssue(const Statement& st) {
  model::Issue i;
  i.id           = st.ColText(0);
  i.type         = st.ColText(1);
  i.status       = st.ColText(2);
  i.title        = st.ColText(3);
  i.description  = st.ColText(4);
  i.priority     = st.ColInt(5);
  i.assignee     = st.ColText(6);
  i.created_by   = st.ColText(7);
  i.created_at   = st.ColText(8);
  i.updated_at   = st.ColText(9);
  i.closed_at    = st.ColText(10);
  i.close_reason = st.ColText(11);
  return i;
}

void ThrowOnStepError(sqlite3* db, int rc, const char* what) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw util::StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

std::string Now() {
  return util::FormatRfc3339(util::Now());
}

} // namespace

SqliteIssueStore::SqliteIssueStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::string id_prefix)
    : db_(std::move(db)), id_prefix_(std::move(id_prefix)) {
}

Result SqliteIssueStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void SqliteIssueStore::FillRelations(model::Issue* issue) {
  auto* db = db_->Handle();

  Statement labels(db, "SELECT label FROM issue_labels WHERE issue_id=? ORDER BY rowid;");
  labels.BindText(1, issue->id);
  int rc;
  while ((rc = labels.Step()) == SQLITE_ROW) issue->labels.push_back(labels.ColText(0));
  ThrowOnStepError(db, rc, "list labels");

  Statement deps(db, "SELECT depends_on_id FROM dependencies WHERE issue_id=? AND type=? ORDER BY rowid;");
  deps.BindText(1, issue->id);
  deps.BindText(2, model::kDepBlocks);
  while ((rc = deps.Step()) == SQLITE_ROW) issue->blocked_by.push_back(deps.ColText(0));
  ThrowOnStepError(db, rc, "list blockers");
}

bool SqliteIssueStore::Exists(const std::string& id) {
  Statement st(db_->Handle(), "SELECT 1 FROM issues WHERE id=?;");
  st.BindText(1, id);
  const int rc = st.Step();
  ThrowOnStepError(db_->Handle(), rc, "lookup issue");
  return rc == SQLITE_ROW;
}

std::vector<model::Issue> SqliteIssueStore::List(const ListOptions& options) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();

  std::string sql = std::string(kIssueColumns) + "WHERE (?1='' OR type=?1) AND (?2='' OR status=?2) AND (?3='' OR assignee=?3) ";
  if (!options.label.empty()) {
    sql += "AND id IN (SELECT issue_id FROM issue_labels WHERE label=?4) ";
  }
  sql += "ORDER BY seq;";

  Statement st(db, sql.c_str());
  st.BindText(1, options.type);
  st.BindText(2, options.status);
  st.BindText(3, options.assignee);
  if (!options.label.empty()) st.BindText(4, options.label);

  std::vector<model::Issue> out;
  int                       rc;
  while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadIssue(st));
  ThrowOnStepError(db, rc, "list issues");

  for (auto& issue : out) FillRelations(&issue);
  return out;
}

std::optional<model::Issue> SqliteIssueStore::Show(const std::string& id) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();

  Statement st(db, (std::string(kIssueColumns) + "WHERE id=?;").c_str());
  st.BindText(1, id);

  const int rc = st.Step();
  ThrowOnStepError(db, rc, "show issue");
  if (rc != SQLITE_ROW) return std::nullopt;

  auto issue = ReadIssue(st);
  FillRelations(&issue);
  return issue;
}

std::vector<model::Issue> SqliteIssueStore::ShowMany(const std::vector<std::string>& ids) {
  std::vector<model::Issue> out;
  for (const auto& id : ids) {
    if (auto issue = Show(id)) out.push_back(std::move(*issue));
  }
  return out;
}

Result SqliteIssueStore::Update(const std::string& id, const UpdateOptions& options) {
  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  if (!Exists(id)) return Result::Err(ErrorCode::NotFound, "issue " + id);

  Statement st(db,
               "UPDATE issues SET assignee=COALESCE(?1,assignee), description=COALESCE(?2,description), status=COALESCE(?3,status), "
               "priority=COALESCE(?4,priority), updated_at=?5 WHERE id=?6;");
  if (options.assignee) st.BindText(1, *options.assignee);
  if (options.description) st.BindText(2, *options.description);
  if (options.status) st.BindText(3, *options.status);
  if (options.priority) st.BindInt(4, *options.priority);
  st.BindText(5, Now());
  st.BindText(6, id);
  if (auto r = Translate(db, st.Step()); !r) return r;

  for (const auto& label : options.add_labels) {
    Statement add(db, "INSERT OR IGNORE INTO issue_labels(issue_id,label) VALUES(?,?);");
    add.BindText(1, id);
    add.BindText(2, label);
    if (auto r = Translate(db, add.Step()); !r) return r;
  }
  for (const auto& label : options.remove_labels) {
    Statement del(db, "DELETE FROM issue_labels WHERE issue_id=? AND label=?;");
    del.BindText(1, id);
    del.BindText(2, label);
    if (auto r = Translate(db, del.Step()); !r) return r;
  }

  tx.Commit();
  return Result::Ok();
}

Result SqliteIssueStore::CloseWithReason(const std::string& id, const std::string& reason) {
  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  if (!Exists(id)) return Result::Err(ErrorCode::NotFound, "issue " + id);

  const auto now = Now();
  Statement  st(db, "UPDATE issues SET status=?, close_reason=?, updated_at=?, closed_at=? WHERE id=?;");
  st.BindText(1, model::kStatusClosed);
  st.BindText(2, reason);
  st.BindText(3, now);
  st.BindText(4, now);
  st.BindText(5, id);
  if (auto r = Translate(db, st.Step()); !r) return r;

  tx.Commit();
  return Result::Ok();
}

Result SqliteIssueStore::Create(const CreateOptions& options, model::Issue* created) {
  if (options.title.empty()) return Result::Err(ErrorCode::InvalidArgument, "title is required");
  if (options.type.empty()) return Result::Err(ErrorCode::InvalidArgument, "type is required");

  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  model::Issue issue;
  do {
    issue.id = util::GenerateIssueId(id_prefix_);
  } while (Exists(issue.id));

  issue.type        = options.type;
  issue.title       = options.title;
  issue.description = options.description;
  issue.priority    = options.priority;
  issue.assignee    = options.assignee;
  issue.created_by  = options.actor;
  issue.labels      = options.labels;
  issue.created_at  = Now();
  issue.updated_at  = issue.created_at;

  Statement st(db,
               "INSERT INTO issues(id,type,status,title,description,priority,assignee,created_by,created_at,updated_at,seq) "
               "VALUES(?,?,?,?,?,?,?,?,?,?,(SELECT COALESCE(MAX(seq),0)+1 FROM issues));");
  st.BindText(1, issue.id);
  st.BindText(2, issue.type);
  st.BindText(3, issue.status);
  st.BindText(4, issue.title);
  st.BindText(5, issue.description);
  st.BindInt(6, issue.priority);
  st.BindText(7, issue.assignee);
  st.BindText(8, issue.created_by);
  st.BindText(9, issue.created_at);
  st.BindText(10, issue.updated_at);
  if (auto r = Translate(db, st.Step()); !r) return r;

  for (const auto& label : issue.labels) {
    Statement add(db, "INSERT OR IGNORE INTO issue_labels(issue_id,label) VALUES(?,?);");
    add.BindText(1, issue.id);
    add.BindText(2, label);
    if (auto r = Translate(db, add.Step()); !r) return r;
  }

  tx.Commit();
  if (created) *created = issue;
  return Result::Ok();
}

Result SqliteIssueStore::AddDependency(const std::string& issue_id, const std::string& depends_on_id, const std::string& type) {
  if (issue_id == depends_on_id) return Result::Err(ErrorCode::InvalidArgument, "issue cannot depend on itself");

  SqliteTransaction tx(db_);
  auto*             db = tx.Handle();

  if (!Exists(issue_id)) return Result::Err(ErrorCode::NotFound, "issue " + issue_id);
  if (!Exists(depends_on_id)) return Result::Err(ErrorCode::NotFound, "issue " + depends_on_id);

  const auto now = Now();
  Statement  st(db, "INSERT OR IGNORE INTO dependencies(issue_id,depends_on_id,type,created_at) VALUES(?,?,?,?);");
  st.BindText(1, issue_id);
  st.BindText(2, depends_on_id);
  st.BindText(3, type);
  st.BindText(4, now);
  if (auto r = Translate(db, st.Step()); !r) return r;

  Statement touch(db, "UPDATE issues SET updated_at=? WHERE id=?;");
  touch.BindText(1, now);
  touch.BindText(2, issue_id);
  if (auto r = Translate(db, touch.Step()); !r) return r;

  tx.Commit();
  return Result::Ok();
}

std::vector<model::Dependency> SqliteIssueStore::ListDependencies(const std::string& issue_id, const std::string& type) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();

  Statement st(db, "SELECT issue_id,depends_on_id,type FROM dependencies WHERE issue_id=?1 AND (?2='' OR type=?2) ORDER BY rowid;");
  st.BindText(1, issue_id);
  st.BindText(2, type);

  std::vector<model::Dependency> out;
  int                            rc;
  while ((rc = st.Step()) == SQLITE_ROW) out.push_back({st.ColText(0), st.ColText(1), st.ColText(2)});
  ThrowOnStepError(db, rc, "list dependencies");
  return out;
}

std::vector<model::Dependency> SqliteIssueStore::ListDependents(const std::string& issue_id, const std::string& type) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();

  Statement st(db, "SELECT issue_id,depends_on_id,type FROM dependencies WHERE depends_on_id=?1 AND (?2='' OR type=?2) ORDER BY rowid;");
  st.BindText(1, issue_id);
  st.BindText(2, type);

  std::vector<model::Dependency> out;
  int                            rc;
  while ((rc = st.Step()) == SQLITE_ROW) out.push_back({st.ColText(0), st.ColText(1), st.ColText(2)});
  ThrowOnStepError(db, rc, "list dependents");
  return out;
}

} // namespace refinery::beads::sqlite
