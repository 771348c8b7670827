#pragma once

#include <memory>

#include "internal/beads/issue_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace refinery::beads::sqlite {

/*
  Issue store persisted in sqlite. Shares its connection with the
  sqlite merge slot store.
*/
class SqliteIssueStore final : public IssueStore {
 public:
  SqliteIssueStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::string id_prefix);

  std::vector<model::Issue>   List(const ListOptions& options) override;
  std::optional<model::Issue> Show(const std::string& id) override;
  std::vector<model::Issue>   ShowMany(const std::vector<std::string>& ids) override;

  Result Update(const std::string& id, const UpdateOptions& options) override;
  Result CloseWithReason(const std::string& id, const std::string& reason) override;
  Result Create(const CreateOptions& options, model::Issue* created) override;

  Result AddDependency(const std::string& issue_id, const std::string& depends_on_id, const std::string& type) override;

  std::vector<model::Dependency> ListDependencies(const std::string& issue_id, const std::string& type) override;
  std::vector<model::Dependency> ListDependents(const std::string& issue_id, const std::string& type) override;

  static Result Translate(sqlite3* db, int rc);

 private:
  // caller holds the db mutex
  void FillRelations(model::Issue* issue);
  bool Exists(const std::string& id);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::string                           id_prefix_;
};

} // namespace refinery::beads::sqlite
