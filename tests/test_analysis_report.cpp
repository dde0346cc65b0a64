#include "psyfit/analysis_report.hpp"

#include "psyfit/utils.hpp"

#include "test_support.hpp"
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace psyfit;

static void add_trials(std::vector<Trial>* v, double x, int n_correct, int n_total) {
  for (int i = 0; i < n_total; ++i) v->push_back(Trial{x, i < n_correct});
}

static std::vector<Trial> staircase_trials(double shift) {
  const int correct[] = {10, 10, 11, 12, 15, 17, 19, 19, 20};
  std::vector<Trial> trials;
  for (int i = 0; i < 9; ++i) add_trials(&trials, 400.0 + shift + 25.0 * i, correct[i], 20);
  return trials;
}

static bool contains(const std::string& s, const std::string& sub) {
  return s.find(sub) != std::string::npos;
}

int main() {
  std::vector<SessionInfo> sessions(1);
  sessions[0].filename = "2AFC_P_20250101_100000.csv";
  sessions[0].timestamp = "2025-01-01T10:00:00";
  sessions[0].trial_count = 180;
  sessions[0].accuracy = 133.0 / 180.0;

  // Name with characters that need escaping; accuracy that is not a short
  // decimal.
  const AnalysisResult r = analyze_dataset("bricks \"004\"", staircase_trials(0.0), AnalysisOptions{}, sessions);
  assert(r.fit.has_value());

  // JSON round trip of the scalar fields.
  {
    const std::string json = analysis_result_to_json(r);
    const AnalysisSummary s = parse_analysis_summary_json(json);
    assert(s.dataset == r.dataset);
    assert(s.n_trials == r.n_trials);
    assert(s.overall_accuracy == r.overall_accuracy);
    assert(s.model == "logistic");
    assert(s.target == 0.707);
    assert(s.stimulus_min == 400.0 && s.stimulus_max == 600.0);
    assert(s.simple_threshold == r.simple_threshold.value);
    assert(s.simple_threshold_method == "interpolated");
    assert(s.fit_status == "ok");
    assert(s.r_squared == r.fit->r_squared);
    assert(s.fitted_threshold == r.fitted_threshold());

    assert(contains(json, "\"Parameters\": {\"a\": "));
    assert(contains(json, "\"TrialCount\": 20"));
    assert(contains(json, "\"File\": \"2AFC_P_20250101_100000.csv\""));

    // Nested keys are not mistaken for top-level ones.
    assert(json_find_int_value(json, "TrialCount", -1) == -1);
  }

  // Failed fit: nulls instead of numbers.
  {
    std::vector<Trial> trials;
    add_trials(&trials, 450.0, 6, 10);
    add_trials(&trials, 500.0, 8, 10);
    const AnalysisResult small = analyze_dataset("tiny", trials);
    const std::string json = analysis_result_to_json(small);
    assert(contains(json, "\"Parameters\": null"));
    assert(contains(json, "\"RSquared\": null"));
    assert(contains(json, "\"FittedThreshold\": null"));
    assert(contains(json, "\"SimpleThreshold\": null"));
    assert(contains(json, "\"Sessions\": []"));

    const AnalysisSummary s = parse_analysis_summary_json(json);
    assert(s.dataset == "tiny");
    assert(s.n_trials == 20);
    assert(std::isnan(s.fitted_threshold));
    assert(std::isnan(s.simple_threshold));
    assert(s.fit_status == "insufficient_data");
    assert(s.simple_threshold_method == "undetermined");

    const std::string report = format_dataset_report(small);
    assert(contains(report, "Fit failed"));
    assert(contains(report, "could not determine"));
  }

  // Files on disk.
  {
    const std::string dir = "test_analysis_report_tmp";
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::u8path(dir), ec);

    const std::string json_path = dir + "/bricks_analysis.json";
    write_analysis_json(json_path, r);
    const AnalysisSummary s = read_analysis_summary(json_path);
    assert(s.dataset == r.dataset);
    assert(s.overall_accuracy == r.overall_accuracy);

    const std::string csv_path = dir + "/bricks_levels.csv";
    write_levels_csv(csv_path, r.levels);
    const std::string csv = read_text_file(csv_path);
    const auto lines = split(csv, '\n');
    assert(lines[0] == "intensity,proportion_correct,trial_count");
    assert(lines[1] == "400,0.5,20");
    assert(lines[4] == "475,0.59999999999999998,20");
    assert(lines.size() == 11);  // header + 9 levels + trailing empty field

    std::filesystem::remove_all(std::filesystem::u8path(dir), ec);
  }

  // Text output.
  {
    const std::string report = format_dataset_report(r);
    assert(contains(report, "Total trials: 180"));
    assert(contains(report, "Overall accuracy: 0.739"));
    assert(contains(report, "Stimulus range: 400.0 to 600.0"));
    assert(contains(report, "Simple threshold estimate (70.7%): 492.8"));
    assert(contains(report, "R-squared: "));
    assert(contains(report, "a="));

    const AnalysisResult shifted = analyze_dataset("rock062", staircase_trials(50.0));
    const std::string summary = format_threshold_summary({r, shifted});
    assert(contains(summary, "THRESHOLD SUMMARY (70.7% correct level)"));
    assert(contains(summary, "Simple estimates - Range: 492.8 - 542.8"));
    assert(contains(summary, "Mean: 517.8 +/- 25.0"));
    assert(contains(summary, "rock062 vs bricks \"004\": 1.10x"));
    assert(contains(summary, "Fitted estimates - Range: "));

    const std::string empty = format_threshold_summary({});
    assert(contains(empty, "No valid thresholds found!"));
  }

  std::cout << "test_analysis_report OK\n";
  return 0;
}
