#include "psyfit/threshold_interpolator.hpp"

#include "psyfit/level_aggregator.hpp"

#include <algorithm>

namespace psyfit {

std::string threshold_method_name(ThresholdMethod m) {
  switch (m) {
    case ThresholdMethod::Interpolated: return "interpolated";
    case ThresholdMethod::FirstLevel: return "first_level";
    case ThresholdMethod::FlatSegmentMidpoint: return "flat_segment_midpoint";
    case ThresholdMethod::ExtrapolatedBelow: return "extrapolated_below";
    case ThresholdMethod::ExtrapolatedAbove: return "extrapolated_above";
    case ThresholdMethod::Undetermined: return "undetermined";
  }
  return "undetermined";
}

InterpolatedThreshold interpolate_threshold(const std::vector<PerformanceLevel>& levels,
                                            double target) {
  InterpolatedThreshold out;
  if (levels.size() < kMinLevelsForInterpolation) return out;

  const auto reaches = [target](const PerformanceLevel& lv) {
    return lv.proportion_correct >= target;
  };

  const auto first_at_or_above = std::find_if(levels.begin(), levels.end(), reaches);
  const bool any_below = std::any_of(levels.begin(), levels.end(),
                                     [&](const PerformanceLevel& lv) { return !reaches(lv); });

  if (!any_below) {
    const double x_min = levels.front().intensity;
    out.value = x_min - 0.1 * x_min;
    out.method = ThresholdMethod::ExtrapolatedBelow;
    return out;
  }
  if (first_at_or_above == levels.end()) {
    const double x_max = levels.back().intensity;
    out.value = x_max + 0.1 * x_max;
    out.method = ThresholdMethod::ExtrapolatedAbove;
    return out;
  }

  if (first_at_or_above == levels.begin()) {
    out.value = first_at_or_above->intensity;
    out.method = ThresholdMethod::FirstLevel;
    return out;
  }

  const PerformanceLevel& hi = *first_at_or_above;
  const PerformanceLevel& lo = *(first_at_or_above - 1);
  const double x1 = lo.intensity;
  const double y1 = lo.proportion_correct;
  const double x2 = hi.intensity;
  const double y2 = hi.proportion_correct;

  if (y2 != y1) {
    out.value = x1 + (target - y1) * (x2 - x1) / (y2 - y1);
    out.method = ThresholdMethod::Interpolated;
  } else {
    out.value = 0.5 * (x1 + x2);
    out.method = ThresholdMethod::FlatSegmentMidpoint;
  }
  return out;
}

double estimate_threshold_interpolated(const std::vector<PerformanceLevel>& levels,
                                       double target) {
  return interpolate_threshold(levels, target).value;
}

} // namespace psyfit
