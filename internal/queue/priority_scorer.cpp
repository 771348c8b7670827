#include "priority_scorer.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace refinery::queue {

namespace {

double HoursSince(util::TimePoint then, util::TimePoint now) {
  if (now <= then) return 0.0;
  return std::chrono::duration<double, std::ratio<3600>>(now - then).count();
}

} // namespace

void ScoreWeights::Validate() const {
  if (priority_weight < 0 || age_weight_per_hour < 0 || convoy_age_weight_per_hour < 0 || retry_weight < 0 || max_retry_bonus < 0) {
    throw util::InvalidArgument("scoring weights must not be negative");
  }
}

double ScoreMR(const ScoreInput& input, const ScoreWeights& weights) {
  const int priority = std::clamp(input.priority, 0, 4);
  const int retries  = std::clamp(input.retry_count, 0, weights.max_retry_bonus);

  double score = weights.base_score;
  score += weights.priority_weight * static_cast<double>(4 - priority);
  score += weights.age_weight_per_hour * HoursSince(input.mr_created_at, input.now);
  if (input.convoy_created_at) {
    score += weights.convoy_age_weight_per_hour * HoursSince(*input.convoy_created_at, input.now);
  }
  score += weights.retry_weight * static_cast<double>(retries);
  return score;
}

double ScoreMRWithDefaults(const ScoreInput& input) {
  return ScoreMR(input, ScoreWeights{});
}

ScoreInput ScoreInputFor(const MRInfo& mr, util::TimePoint now) {
  ScoreInput in;
  in.priority          = mr.priority;
  in.mr_created_at     = mr.created_at.value_or(now);
  in.now               = now;
  in.retry_count       = mr.retry_count;
  in.convoy_created_at = mr.convoy_created_at;
  return in;
}

std::vector<RankedMR> RankByScore(std::vector<MRInfo> mrs, util::TimePoint now, const ScoreWeights& weights) {
  std::vector<RankedMR> ranked;
  ranked.reserve(mrs.size());
  for (auto& mr : mrs) {
    const double score = ScoreMR(ScoreInputFor(mr, now), weights);
    ranked.push_back({std::move(mr), score});
  }

  std::stable_sort(ranked.begin(), ranked.end(), [now](const RankedMR& a, const RankedMR& b) {
    if (a.score != b.score) return a.score > b.score;
    const auto ca = a.mr.created_at.value_or(now);
    const auto cb = b.mr.created_at.value_or(now);
    if (ca != cb) return ca < cb;
    return a.mr.id < b.mr.id;
  });
  return ranked;
}

} // namespace refinery::queue
