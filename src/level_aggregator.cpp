#include "psyfit/level_aggregator.hpp"

#include <cmath>
#include <map>
#include <stdexcept>

namespace psyfit {

std::vector<PerformanceLevel> collapse_levels(const std::vector<Trial>& trials,
                                              size_t min_trials_per_level) {
  if (min_trials_per_level == 0) {
    throw std::runtime_error("collapse_levels: min_trials_per_level must be >= 1");
  }

  // intensity -> (n_trials, n_correct); std::map keeps keys ordered.
  std::map<double, std::pair<size_t, size_t>> counts;
  for (const auto& t : trials) {
    if (!std::isfinite(t.stimulus_intensity)) continue;
    auto& c = counts[t.stimulus_intensity];
    ++c.first;
    if (t.correct) ++c.second;
  }

  std::vector<PerformanceLevel> levels;
  levels.reserve(counts.size());
  for (const auto& kv : counts) {
    const size_t n = kv.second.first;
    if (n < min_trials_per_level) continue;
    PerformanceLevel lv;
    lv.intensity = kv.first;
    lv.trial_count = n;
    lv.proportion_correct = static_cast<double>(kv.second.second) / static_cast<double>(n);
    levels.push_back(lv);
  }
  return levels;
}

std::optional<std::vector<PerformanceLevel>> aggregate_levels(const std::vector<Trial>& trials,
                                                              const AggregateOptions& opt) {
  std::vector<PerformanceLevel> levels = collapse_levels(trials, opt.min_trials_per_level);
  if (levels.size() < opt.min_levels) return std::nullopt;
  return levels;
}

} // namespace psyfit
