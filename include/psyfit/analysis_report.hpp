#pragma once

#include "psyfit/dataset_analyzer.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace psyfit {

// JSON sidecar for one analyzed dataset (<dataset>_analysis.json).
//
// Keys written (top-level):
//   - Dataset, Model, Target
//   - NTrials, OverallAccuracy, StimulusMin, StimulusMax
//   - SimpleThreshold, SimpleThresholdMethod
//   - FitStatus, FitMessage, RSquared, FittedThreshold
//   - Parameters: {"<name>": value, ...} or null when the fit failed
//   - Levels: [{"Intensity", "ProportionCorrect", "TrialCount"}, ...]
//   - Sessions: [{"File", "Timestamp", "NTrials", "Accuracy"}, ...]
//
// Numbers are written with 17 significant digits; non-finite values as null.
std::string analysis_result_to_json(const AnalysisResult& r);

// Throws std::runtime_error on write failure.
void write_analysis_json(const std::string& path, const AnalysisResult& r);

// Scalar fields read back from an analysis JSON.
struct AnalysisSummary {
  std::string dataset;
  std::string model;
  double target{std::numeric_limits<double>::quiet_NaN()};
  size_t n_trials{0};
  double overall_accuracy{std::numeric_limits<double>::quiet_NaN()};
  double stimulus_min{std::numeric_limits<double>::quiet_NaN()};
  double stimulus_max{std::numeric_limits<double>::quiet_NaN()};
  double simple_threshold{std::numeric_limits<double>::quiet_NaN()};
  std::string simple_threshold_method;
  std::string fit_status;
  std::string fit_message;
  double r_squared{std::numeric_limits<double>::quiet_NaN()};
  double fitted_threshold{std::numeric_limits<double>::quiet_NaN()};
};

// Best-effort: missing keys keep their defaults. Only top-level scalar keys are
// read; the Parameters/Levels/Sessions arrays are skipped.
AnalysisSummary parse_analysis_summary_json(const std::string& json);

// Throws std::runtime_error if the file cannot be read.
AnalysisSummary read_analysis_summary(const std::string& path);

// Aggregated levels as CSV: intensity,proportion_correct,trial_count
// Throws std::runtime_error on write failure.
void write_levels_csv(const std::string& path, const std::vector<PerformanceLevel>& levels);

// Human-readable report for one dataset (multi-line, ends with '\n').
std::string format_dataset_report(const AnalysisResult& r);

// Summary table over all datasets, followed by a comparison block (threshold
// ranges, mean +- population std, ratios relative to the first dataset).
std::string format_threshold_summary(const std::vector<AnalysisResult>& results);

} // namespace psyfit
