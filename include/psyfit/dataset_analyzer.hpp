#pragma once

#include "psyfit/level_aggregator.hpp"
#include "psyfit/psychometric_fit.hpp"
#include "psyfit/threshold_interpolator.hpp"
#include "psyfit/types.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace psyfit {

struct AnalysisOptions {
  ModelKind model{ModelKind::Logistic};
  double target{kStaircaseTarget};
  size_t min_trials_per_level{2};
  size_t max_evaluations{5000};
};

// Result of analyzing one dataset. Consumed by the reporting and plotting code.
struct AnalysisResult {
  std::string dataset;
  ModelKind model{ModelKind::Logistic};
  double target{kStaircaseTarget};

  // Descriptive statistics over the full merged trial set (not per level).
  size_t n_trials{0};
  double overall_accuracy{std::numeric_limits<double>::quiet_NaN()};
  double stimulus_min{std::numeric_limits<double>::quiet_NaN()};
  double stimulus_max{std::numeric_limits<double>::quiet_NaN()};

  InterpolatedThreshold simple_threshold;

  // Present only when the parametric fit succeeded.
  std::optional<FitResult> fit;
  FitStatus fit_status{FitStatus::InsufficientData};
  std::string fit_message;

  // Aggregated levels (those used by the fit when it succeeded).
  std::vector<PerformanceLevel> levels;

  std::vector<SessionInfo> sessions;

  // Fitted threshold or NaN (fit absent or threshold undetermined).
  double fitted_threshold() const {
    return fit ? fit->threshold : std::numeric_limits<double>::quiet_NaN();
  }
};

// Analyze the merged trials of one dataset.
//
// Always computes the interpolated threshold (Undetermined with fewer than
// kMinLevelsForInterpolation levels) and attempts the parametric fit; a failed
// fit leaves AnalysisResult::fit empty and records the reason in fit_status /
// fit_message. Data problems never throw; invalid options do
// (std::runtime_error).
AnalysisResult analyze_dataset(const std::string& dataset,
                               const std::vector<Trial>& trials,
                               const AnalysisOptions& opt = AnalysisOptions{},
                               const std::vector<SessionInfo>& sessions = {});

// Merge all sessions of a dataset (in session order) and analyze them.
AnalysisResult analyze_dataset(const Dataset& ds, const AnalysisOptions& opt = AnalysisOptions{});

// Session summary (trial count, accuracy) for a session's trials.
SessionInfo summarize_session(const std::string& filename,
                              const std::string& timestamp,
                              const std::vector<Trial>& trials);

} // namespace psyfit
