#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>

namespace {

using refinery::factory::Build;
using refinery::factory::MergeSlotOptionsFromProto;
using refinery::factory::ScoreWeightsFromProto;
using refinery::runtime::config::RuntimeConfig;
namespace util = refinery::util;

RuntimeConfig Minimal() {
  RuntimeConfig config;
  config.mutable_rig()->set_name("gastown");
  config.mutable_rig()->set_work_dir(std::filesystem::temp_directory_path().string());
  return config;
}

bool ThrowsInvalidArgument(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestBuildsInMemoryApplication() {
  auto app = Build(Minimal());
  assert(app.store);
  assert(app.engineer);
  assert(app.worker);
  assert(app.queue_service);
  assert(!app.worker->Running());
  assert(app.merge_queue.enabled);

  assert(app.engineer->ClaimIdentity() == "gastown/refinery");
  assert(app.engineer->ListQueue().empty());

  // the notifier and the engineer share one store
  refinery::beads::CreateOptions create;
  create.type  = refinery::beads::model::kTypeTask;
  create.title = "store check";
  refinery::beads::model::Issue created;
  assert(app.store->Create(create, &created));
  assert(created.id.rfind("rf-", 0) == 0);
}

void TestBuildsSqliteApplicationFromYaml() {
  const auto dir = std::filesystem::temp_directory_path() / "refinery_factory_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto db_path = (dir / "beads.db").string();

  auto config = refinery::config::ConfigLoader::LoadFromString("rig:\n  name: gastown\n  work_dir: " + dir.string() +
                                                               "\nstore:\n  sqlite:\n    path: \"" + db_path +
                                                               "\"\n  issue_prefix: gt\nmerge_queue:\n  poll_interval: 5s\n");
  auto app = Build(config);
  assert(std::filesystem::exists(db_path));
  assert(app.merge_queue.poll_interval == std::chrono::seconds(5));

  refinery::beads::CreateOptions create;
  create.type  = refinery::beads::model::kTypeTask;
  create.title = "store check";
  refinery::beads::model::Issue created;
  assert(app.store->Create(create, &created));
  assert(created.id.rfind("gt-", 0) == 0);

  std::filesystem::remove_all(dir);
}

void TestRejectsIncompleteConfig() {
  assert(ThrowsInvalidArgument([] {
    auto config = Minimal();
    config.mutable_rig()->clear_name();
    (void)Build(config);
  }));
  assert(ThrowsInvalidArgument([] {
    auto config = Minimal();
    config.mutable_rig()->clear_work_dir();
    (void)Build(config);
  }));
  assert(ThrowsInvalidArgument([] {
    auto config = Minimal();
    config.mutable_store()->mutable_sqlite();
    (void)Build(config);
  }));
  assert(ThrowsInvalidArgument([] {
    auto config = Minimal();
    config.mutable_merge_queue()->set_on_conflict("merge_anyway");
    (void)Build(config);
  }));
}

void TestMergeSlotOptions() {
  refinery::runtime::config::MergeSlotConfig proto;
  auto defaults = MergeSlotOptionsFromProto(proto);
  assert(defaults.max_retries == 10);
  assert(defaults.initial_backoff == std::chrono::milliseconds(500));
  assert(defaults.max_backoff == std::chrono::seconds(10));

  proto.set_max_retries(0);
  proto.set_initial_backoff("100ms");
  proto.set_max_backoff("1s");
  auto custom = MergeSlotOptionsFromProto(proto);
  assert(custom.max_retries == 0);
  assert(custom.initial_backoff == std::chrono::milliseconds(100));
  assert(custom.max_backoff == std::chrono::seconds(1));

  assert(ThrowsInvalidArgument([] {
    refinery::runtime::config::MergeSlotConfig bad;
    bad.set_max_retries(-1);
    (void)MergeSlotOptionsFromProto(bad);
  }));
  assert(ThrowsInvalidArgument([] {
    refinery::runtime::config::MergeSlotConfig bad;
    bad.set_initial_backoff("2s");
    bad.set_max_backoff("1s");
    (void)MergeSlotOptionsFromProto(bad);
  }));
  assert(ThrowsInvalidArgument([] {
    refinery::runtime::config::MergeSlotConfig bad;
    bad.set_initial_backoff("soon");
    (void)MergeSlotOptionsFromProto(bad);
  }));
}

void TestScoreWeights() {
  refinery::runtime::config::ScoringConfig proto;
  proto.set_priority_weight(0);
  proto.set_max_retry_bonus(3);
  auto weights = ScoreWeightsFromProto(proto);
  assert(weights.priority_weight == 0);
  assert(weights.max_retry_bonus == 3);
  assert(weights.base_score == 1000.0);

  assert(ThrowsInvalidArgument([] {
    refinery::runtime::config::ScoringConfig bad;
    bad.set_retry_weight(-5);
    (void)ScoreWeightsFromProto(bad);
  }));
}

} // namespace

int main() {
  TestBuildsInMemoryApplication();
  TestBuildsSqliteApplicationFromYaml();
  TestRejectsIncompleteConfig();
  TestMergeSlotOptions();
  TestScoreWeights();

  std::cout << "refinery_unit_factory: pass\n";
  return 0;
}
