#pragma once

#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/beads/issue_store.hpp"
#include "internal/util/time.hpp"

namespace refinery::beads::memory {

/*
  In-process issue store for tests and ephemeral runs.
*/
class MemoryIssueStore final : public IssueStore {
 public:
  using NowFn = std::function<util::TimePoint()>;

  explicit MemoryIssueStore(std::string id_prefix = "rf", NowFn now = util::Now);

  std::vector<model::Issue>   List(const ListOptions& options) override;
  std::optional<model::Issue> Show(const std::string& id) override;
  std::vector<model::Issue>   ShowMany(const std::vector<std::string>& ids) override;

  Result Update(const std::string& id, const UpdateOptions& options) override;
  Result CloseWithReason(const std::string& id, const std::string& reason) override;
  Result Create(const CreateOptions& options, model::Issue* created) override;

  Result AddDependency(const std::string& issue_id, const std::string& depends_on_id, const std::string& type) override;

  std::vector<model::Dependency> ListDependencies(const std::string& issue_id, const std::string& type) override;
  std::vector<model::Dependency> ListDependents(const std::string& issue_id, const std::string& type) override;

  // Inserts or replaces a record verbatim (timestamps included).
  // blocked_by entries become `blocks` edges.
  void Put(const model::Issue& issue);

 private:
  struct State {
    std::unordered_map<std::string, model::Issue> issues;
    std::vector<std::string>                      order;
    std::vector<model::Dependency>                deps;
  };

  model::Issue Materialize(const model::Issue& issue) const;
  std::string  Timestamp() const;

  const std::string id_prefix_;
  const NowFn       now_;

  mutable std::mutex mutex_;
  State              state_;
};

} // namespace refinery::beads::memory
