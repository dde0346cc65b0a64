#include "psyfit/dataset_analyzer.hpp"

#include "test_support.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace psyfit;

static bool approx(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps;
}

static void add_trials(std::vector<Trial>* v, double x, int n_correct, int n_total) {
  for (int i = 0; i < n_total; ++i) v->push_back(Trial{x, i < n_correct});
}

// Nine levels 400..600 (step 25), 20 trials each, shaped like a 2AFC curve.
static std::vector<Trial> staircase_trials() {
  const int correct[] = {10, 10, 11, 12, 15, 17, 19, 19, 20};
  std::vector<Trial> trials;
  for (int i = 0; i < 9; ++i) add_trials(&trials, 400.0 + 25.0 * i, correct[i], 20);
  return trials;
}

int main() {
  // Full analysis with a successful fit.
  {
    const std::vector<Trial> trials = staircase_trials();
    const AnalysisResult r = analyze_dataset("bricks004", trials);

    assert(r.dataset == "bricks004");
    assert(r.model == ModelKind::Logistic);
    assert(r.n_trials == 180);
    assert(approx(r.overall_accuracy, 133.0 / 180.0));
    assert(r.stimulus_min == 400.0);
    assert(r.stimulus_max == 600.0);
    assert(r.levels.size() == 9);

    assert(r.simple_threshold.method == ThresholdMethod::Interpolated);
    assert(approx(r.simple_threshold.value, 475.0 + (0.707 - 0.6) * 25.0 / 0.15, 1e-9));

    assert(r.fit_status == FitStatus::Ok);
    assert(r.fit.has_value());
    assert(std::isfinite(r.fitted_threshold()));
    assert(r.fitted_threshold() > 475.0 && r.fitted_threshold() < 525.0);
  }

  // Very wide stimulus range: the fit fails but the analysis still completes.
  {
    std::vector<Trial> trials;
    const int correct[] = {5, 6, 7, 9, 10};
    for (int i = 0; i < 5; ++i) add_trials(&trials, 50000.0 * i, correct[i], 10);

    const AnalysisResult r = analyze_dataset("wide", trials);
    assert(r.n_trials == 50);
    assert(r.levels.size() == 5);
    assert(r.fit_status == FitStatus::FitFailed);
    assert(!r.fit.has_value());
    assert(!r.fit_message.empty());
    assert(std::isnan(r.fitted_threshold()));

    assert(r.simple_threshold.method == ThresholdMethod::Interpolated);
    assert(approx(r.simple_threshold.value, 100000.0 + (0.707 - 0.7) * 50000.0 / 0.2, 1e-6));
  }

  // Descriptive statistics use every trial, including levels dropped by the
  // minimum trial count.
  {
    std::vector<Trial> trials = staircase_trials();
    trials.push_back(Trial{700.0, false});
    const AnalysisResult r = analyze_dataset("x", trials);
    assert(r.n_trials == 181);
    assert(r.stimulus_max == 700.0);
    assert(r.levels.size() == 9);
    assert(approx(r.overall_accuracy, 133.0 / 181.0));
  }

  // Three levels: interpolation works, the fit is explicitly absent.
  {
    std::vector<Trial> trials;
    add_trials(&trials, 450.0, 6, 10);
    add_trials(&trials, 500.0, 8, 10);
    add_trials(&trials, 550.0, 9, 10);
    const AnalysisResult r = analyze_dataset("short", trials);
    assert(r.simple_threshold.determined());
    assert(r.simple_threshold.value > 450.0 && r.simple_threshold.value < 500.0);
    assert(r.fit_status == FitStatus::InsufficientData);
    assert(!r.fit.has_value());
    assert(std::isnan(r.fitted_threshold()));
  }

  // A failing optimizer does not affect the rest of the result.
  {
    AnalysisOptions opt;
    opt.max_evaluations = 1;
    const AnalysisResult r = analyze_dataset("budget", staircase_trials(), opt);
    assert(r.fit_status == FitStatus::FitFailed);
    assert(!r.fit.has_value());
    assert(r.simple_threshold.determined());
    assert(r.n_trials == 180);
  }

  // No trials at all.
  {
    const AnalysisResult r = analyze_dataset("empty", std::vector<Trial>{});
    assert(r.n_trials == 0);
    assert(std::isnan(r.overall_accuracy));
    assert(std::isnan(r.stimulus_min) && std::isnan(r.stimulus_max));
    assert(!r.simple_threshold.determined());
    assert(r.fit_status == FitStatus::InsufficientData);
  }

  // Dataset overload: sessions are merged in order, session metadata kept.
  {
    const std::vector<Trial> all = staircase_trials();
    Dataset ds;
    ds.name = "rock062";
    Session s1;
    s1.trials.assign(all.begin(), all.begin() + 100);
    s1.info = summarize_session("2AFC_P_20250101_100000.csv", "2025-01-01T10:00:00", s1.trials);
    Session s2;
    s2.trials.assign(all.begin() + 100, all.end());
    s2.info = summarize_session("2AFC_P_20250102_100000.csv", "2025-01-02T10:00:00", s2.trials);
    ds.sessions = {s1, s2};

    AnalysisOptions opt;
    opt.model = ModelKind::CumulativeNormal;
    const AnalysisResult r = analyze_dataset(ds, opt);
    assert(r.dataset == "rock062");
    assert(r.model == ModelKind::CumulativeNormal);
    assert(r.n_trials == 180);
    assert(r.sessions.size() == 2);
    assert(r.sessions[0].trial_count == 100);
    assert(r.sessions[1].trial_count == 80);
    assert(r.sessions[1].timestamp == "2025-01-02T10:00:00");

    const AnalysisResult direct = analyze_dataset("rock062", all, opt);
    assert(direct.simple_threshold.value == r.simple_threshold.value);
    assert(r.fit.has_value() == direct.fit.has_value());
  }

  // summarize_session
  {
    std::vector<Trial> trials;
    add_trials(&trials, 1.0, 3, 4);
    const SessionInfo info = summarize_session("f.csv", "", trials);
    assert(info.trial_count == 4);
    assert(approx(info.accuracy, 0.75));
  }

  // Invalid target.
  {
    AnalysisOptions opt;
    opt.target = 0.0;
    bool threw = false;
    try {
      (void)analyze_dataset("bad", staircase_trials(), opt);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_dataset_analyzer OK\n";
  return 0;
}
