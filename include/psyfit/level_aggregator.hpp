#pragma once

#include "psyfit/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace psyfit {

// Minimum number of distinct qualifying stimulus levels required by each stage.
constexpr size_t kMinLevelsForInterpolation = 3;
constexpr size_t kMinLevelsForFit = 4;

struct AggregateOptions {
  // Levels with fewer trials than this are discarded.
  size_t min_trials_per_level{2};

  // aggregate_levels() reports insufficient data when fewer distinct levels
  // than this survive. Use kMinLevelsForFit / kMinLevelsForInterpolation.
  size_t min_levels{kMinLevelsForInterpolation};
};

// Group trials by exactly equal stimulus intensity.
//
// Returns one PerformanceLevel per intensity with at least min_trials_per_level
// trials, sorted by ascending intensity. Trials with a non-finite intensity are
// ignored. No minimum on the number of levels is applied here.
//
// Throws std::runtime_error if min_trials_per_level == 0.
std::vector<PerformanceLevel> collapse_levels(const std::vector<Trial>& trials,
                                              size_t min_trials_per_level = 2);

// Same as collapse_levels(), but returns std::nullopt ("insufficient data")
// when fewer than opt.min_levels levels survive. The caller decides how to
// react.
std::optional<std::vector<PerformanceLevel>> aggregate_levels(const std::vector<Trial>& trials,
                                                              const AggregateOptions& opt = AggregateOptions{});

} // namespace psyfit
