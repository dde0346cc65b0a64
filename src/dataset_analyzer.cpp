#include "psyfit/dataset_analyzer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace psyfit {

SessionInfo summarize_session(const std::string& filename,
                              const std::string& timestamp,
                              const std::vector<Trial>& trials) {
  SessionInfo info;
  info.filename = filename;
  info.timestamp = timestamp;
  info.trial_count = trials.size();
  size_t n_correct = 0;
  for (const auto& t : trials) {
    if (t.correct) ++n_correct;
  }
  info.accuracy = trials.empty() ? std::numeric_limits<double>::quiet_NaN()
                                 : static_cast<double>(n_correct) / static_cast<double>(trials.size());
  return info;
}

AnalysisResult analyze_dataset(const std::string& dataset,
                               const std::vector<Trial>& trials,
                               const AnalysisOptions& opt,
                               const std::vector<SessionInfo>& sessions) {
  if (!(opt.target > 0.0 && opt.target < 1.0)) {
    throw std::runtime_error("analyze_dataset: target must be in (0,1)");
  }

  AnalysisResult res;
  res.dataset = dataset;
  res.model = opt.model;
  res.target = opt.target;
  res.sessions = sessions;
  res.n_trials = trials.size();

  if (!trials.empty()) {
    size_t n_correct = 0;
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    for (const auto& t : trials) {
      if (t.correct) ++n_correct;
      if (std::isfinite(t.stimulus_intensity)) {
        lo = std::min(lo, t.stimulus_intensity);
        hi = std::max(hi, t.stimulus_intensity);
      }
    }
    res.overall_accuracy = static_cast<double>(n_correct) / static_cast<double>(trials.size());
    if (lo <= hi) {
      res.stimulus_min = lo;
      res.stimulus_max = hi;
    }
  }

  // Both estimators consume the same aggregated levels.
  res.levels = collapse_levels(trials, opt.min_trials_per_level);
  res.simple_threshold = interpolate_threshold(res.levels, opt.target);

  FitOptions fopt;
  fopt.model = opt.model;
  fopt.target = opt.target;
  fopt.max_evaluations = opt.max_evaluations;
  FitOutcome fo = fit_psychometric_curve(res.levels, fopt);

  res.fit_status = fo.status;
  res.fit_message = fo.message;
  if (fo.ok()) res.fit = std::move(fo.fit);
  return res;
}

AnalysisResult analyze_dataset(const Dataset& ds, const AnalysisOptions& opt) {
  std::vector<Trial> merged;
  merged.reserve(ds.n_trials());
  std::vector<SessionInfo> infos;
  infos.reserve(ds.sessions.size());
  for (const auto& s : ds.sessions) {
    merged.insert(merged.end(), s.trials.begin(), s.trials.end());
    infos.push_back(s.info);
  }
  return analyze_dataset(ds.name, merged, opt, infos);
}

} // namespace psyfit
