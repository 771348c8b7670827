#include "internal/queue/priority_scorer.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <vector>

namespace {

using namespace std::chrono;
using refinery::queue::MRInfo;
using refinery::queue::RankByScore;
using refinery::queue::ScoreInput;
using refinery::queue::ScoreMR;
using refinery::queue::ScoreMRWithDefaults;
using refinery::queue::ScoreWeights;

const auto kNow = refinery::util::TimePoint(seconds(1'800'000'000));

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-6;
}

ScoreInput Input(int priority, hours age, int retries = 0) {
  ScoreInput in;
  in.priority      = priority;
  in.mr_created_at = kNow - age;
  in.now           = kNow;
  in.retry_count   = retries;
  return in;
}

void TestDefaultFormula() {
  // fresh P2, no retries: base + 2 * 100
  assert(Near(ScoreMRWithDefaults(Input(2, hours(0))), 1200.0));
  // P0 aged 3h with 2 retries
  assert(Near(ScoreMRWithDefaults(Input(0, hours(3), 2)), 1000.0 + 400.0 + 3.0 + 50.0));

  auto convoy              = Input(4, hours(1));
  convoy.convoy_created_at = kNow - hours(5);
  assert(Near(ScoreMRWithDefaults(convoy), 1000.0 + 0.0 + 1.0 + 50.0));
}

void TestMonotonicity() {
  for (int p = 1; p <= 4; ++p) {
    assert(ScoreMRWithDefaults(Input(p - 1, hours(1))) > ScoreMRWithDefaults(Input(p, hours(1))));
  }
  assert(ScoreMRWithDefaults(Input(2, hours(10))) > ScoreMRWithDefaults(Input(2, hours(9))));
  assert(ScoreMRWithDefaults(Input(2, hours(1), 3)) > ScoreMRWithDefaults(Input(2, hours(1), 2)));

  auto in_convoy              = Input(2, hours(1));
  in_convoy.convoy_created_at = kNow - hours(2);
  assert(ScoreMRWithDefaults(in_convoy) > ScoreMRWithDefaults(Input(2, hours(1))));
}

void TestClamps() {
  assert(Near(ScoreMRWithDefaults(Input(-3, hours(0))), ScoreMRWithDefaults(Input(0, hours(0)))));
  assert(Near(ScoreMRWithDefaults(Input(9, hours(0))), ScoreMRWithDefaults(Input(4, hours(0)))));

  // retry bonus caps at max_retry_bonus
  assert(Near(ScoreMRWithDefaults(Input(2, hours(0), 50)), ScoreMRWithDefaults(Input(2, hours(0), 10))));

  // created in the future counts as zero age
  auto future          = Input(2, hours(0));
  future.mr_created_at = kNow + hours(4);
  assert(Near(ScoreMRWithDefaults(future), 1200.0));
}

void TestCustomWeightsAndValidation() {
  ScoreWeights w;
  w.base_score      = 0;
  w.priority_weight = 0;
  w.retry_weight    = 0;
  assert(Near(ScoreMR(Input(0, hours(6)), w), 6.0));

  bool threw = false;
  try {
    ScoreWeights bad;
    bad.age_weight_per_hour = -1;
    bad.Validate();
  } catch (const refinery::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

MRInfo MR(const std::string& id, int priority, hours age) {
  MRInfo mr;
  mr.id         = id;
  mr.priority   = priority;
  mr.created_at = kNow - age;
  return mr;
}

void TestRankingOrderAndTieBreaks() {
  std::vector<MRInfo> mrs{
      MR("gt-c", 2, hours(1)),
      MR("gt-a", 0, hours(1)),
      MR("gt-b", 2, hours(1)),
      MR("gt-d", 2, hours(1)),
  };
  // same score as gt-b but no timestamp: scored as now, sorts after older MRs
  MRInfo undated;
  undated.id       = "gt-0";
  undated.priority = 2;
  mrs.push_back(undated);

  // one second older than gt-b and gt-c
  mrs[3].created_at = kNow - hours(1) - seconds(1);

  const auto ranked = RankByScore(mrs, kNow, ScoreWeights{});
  assert(ranked.size() == 5);
  assert(ranked[0].mr.id == "gt-a");
  assert(ranked[1].mr.id == "gt-d");
  // gt-b and gt-c tie exactly; lower id first
  assert(ranked[2].mr.id == "gt-b");
  assert(ranked[3].mr.id == "gt-c");
  assert(ranked[4].mr.id == "gt-0");
  assert(ranked[0].score > ranked[1].score);
}

} // namespace

int main() {
  TestDefaultFormula();
  TestMonotonicity();
  TestClamps();
  TestCustomWeightsAndValidation();
  TestRankingOrderAndTieBreaks();

  std::cout << "refinery_unit_priority_scorer: pass\n";
  return 0;
}
