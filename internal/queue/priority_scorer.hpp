#pragma once

#include <optional>
#include <vector>

#include "internal/queue/mr_info.hpp"
#include "internal/util/time.hpp"

namespace refinery::queue {

struct ScoreInput {
  int             priority = 2; // 0 = most urgent .. 4
  util::TimePoint mr_created_at;
  util::TimePoint now;
  int             retry_count = 0;

  std::optional<util::TimePoint> convoy_created_at;
};

/*
  score = base
        + priority_weight * (4 - clamp(priority, 0, 4))
        + age_weight_per_hour * mr_age_hours
        + convoy_age_weight_per_hour * convoy_age_hours   (convoy MRs only)
        + retry_weight * min(retry_count, max_retry_bonus)

  Ages below zero count as zero. With non-negative weights a more urgent
  priority, an older MR, more retries, or a (older) convoy never lowers
  the score.
*/
struct ScoreWeights {
  double base_score                 = 1000.0;
  double priority_weight            = 100.0;
  double age_weight_per_hour        = 1.0;
  double convoy_age_weight_per_hour = 10.0;
  double retry_weight               = 25.0;
  int    max_retry_bonus            = 10;

  // Throws util::InvalidArgument for negative weights.
  void Validate() const;
};

double ScoreMR(const ScoreInput& input, const ScoreWeights& weights);
double ScoreMRWithDefaults(const ScoreInput& input);

// MRs without a parsable created_at are scored as if created `now`.
ScoreInput ScoreInputFor(const MRInfo& mr, util::TimePoint now);

struct RankedMR {
  MRInfo mr;
  double score = 0;
};

// Highest score first; ties go to the older MR, then the lower id.
std::vector<RankedMR> RankByScore(std::vector<MRInfo> mrs, util::TimePoint now, const ScoreWeights& weights);

} // namespace refinery::queue
