#pragma once

#include "psyfit/types.hpp"

#include <limits>
#include <string>
#include <vector>

namespace psyfit {

// Target performance for a 2-down-1-up staircase (converges on 70.7% correct).
constexpr double kStaircaseTarget = 0.707;

// How an interpolated threshold was obtained.
enum class ThresholdMethod {
  Interpolated,         // linear interpolation between two bracketing levels
  FirstLevel,           // the lowest level already reaches the target
  FlatSegmentMidpoint,  // bracketing levels have equal proportions; midpoint used
  ExtrapolatedBelow,    // every level reaches the target; min - 10% of min
  ExtrapolatedAbove,    // no level reaches the target; max + 10% of max
  Undetermined          // fewer than kMinLevelsForInterpolation levels
};

std::string threshold_method_name(ThresholdMethod m);

struct InterpolatedThreshold {
  double value{std::numeric_limits<double>::quiet_NaN()};
  ThresholdMethod method{ThresholdMethod::Undetermined};

  bool determined() const { return method != ThresholdMethod::Undetermined; }
};

// Model-free threshold estimate.
//
// Levels must be sorted by ascending intensity (as produced by
// aggregate_levels()). Levels are split into those below the target and those
// at/above it. The first level at/above the target (in intensity order) is
// interpolated against its immediate predecessor:
//
//   thr = x1 + (target - y1) * (x2 - x1) / (y2 - y1)
//
// When all levels are on one side of the target the threshold is extrapolated
// by 10% of the extreme intensity. The estimator does not assume a monotonic
// psychometric function, so it tolerates the noisy, sparse levels typical of
// staircase data.
//
// Fewer than kMinLevelsForInterpolation levels yields an Undetermined (NaN)
// estimate.
InterpolatedThreshold interpolate_threshold(const std::vector<PerformanceLevel>& levels,
                                            double target = kStaircaseTarget);

// Convenience: the threshold value only (NaN when undetermined).
double estimate_threshold_interpolated(const std::vector<PerformanceLevel>& levels,
                                       double target = kStaircaseTarget);

} // namespace psyfit
