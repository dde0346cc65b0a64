#include "psyfit/psychometric_fit.hpp"

#include "psyfit/normal_dist.hpp"

#include "test_support.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace psyfit;

static bool approx(double a, double b, double eps) {
  return std::fabs(a - b) <= eps;
}

static std::vector<PerformanceLevel> sample_levels(ModelKind m, const std::vector<double>& p, size_t n) {
  std::vector<PerformanceLevel> levels;
  for (double x = 400.0; x <= 600.0; x += 25.0) {
    PerformanceLevel lv;
    lv.intensity = x;
    lv.proportion_correct = model_predict(m, p, x);
    lv.trial_count = n;
    levels.push_back(lv);
  }
  return levels;
}

int main() {
  // Zero-noise logistic data is recovered.
  {
    const std::vector<double> truth = {0.5, 0.05, 500.0, 0.98};
    const auto levels = sample_levels(ModelKind::Logistic, truth, 20);

    const FitOutcome out = fit_psychometric_curve(levels, ModelKind::Logistic, 0.707);
    assert(out.ok());
    assert(out.status == FitStatus::Ok);
    const FitResult& f = *out.fit;
    assert(f.parameters.size() == 4);
    assert(f.parameter_names.size() == 4 && f.parameter_names[0] == "a");
    assert(approx(f.parameters[0], 0.5, 1e-3));
    assert(approx(f.parameters[1], 0.05, 1e-4));
    assert(approx(f.parameters[2], 500.0, 0.5));
    assert(approx(f.parameters[3], 0.98, 1e-3));
    assert(f.r_squared > 0.9999 && f.r_squared <= 1.0);
    assert(f.levels_used.size() == levels.size());

    const double thr_true = 500.0 - std::log(0.48 / 0.207 - 1.0) / 0.05;
    assert(f.threshold_determined());
    assert(approx(f.threshold, thr_true, 0.5));
    assert(approx(f.predict(f.threshold), 0.707, 1e-9));
  }

  // Zero-noise cumulative normal data is recovered.
  {
    const std::vector<double> truth = {500.0, 40.0};
    const auto levels = sample_levels(ModelKind::CumulativeNormal, truth, 20);

    FitOptions opt;
    opt.model = ModelKind::CumulativeNormal;
    const FitOutcome out = fit_psychometric_curve(levels, opt);
    assert(out.ok());
    const FitResult& f = *out.fit;
    assert(f.parameter_names[1] == "sigma");
    assert(approx(f.parameters[0], 500.0, 1e-3));
    assert(approx(f.parameters[1], 40.0, 1e-3));
    assert(f.r_squared > 0.9999);
    assert(approx(f.threshold, f.parameters[0] + f.parameters[1] * normal_quantile(0.707), 1e-9));
  }

  // Integer trial counts (proportions quantized to 1/20): the fit stays inside
  // its bounds and the threshold falls inside the bracketing levels.
  {
    const std::vector<double> props = {0.5, 0.5, 0.55, 0.6, 0.75, 0.85, 0.95, 0.95, 1.0};
    std::vector<PerformanceLevel> levels;
    for (size_t i = 0; i < props.size(); ++i) {
      PerformanceLevel lv;
      lv.intensity = 400.0 + 25.0 * static_cast<double>(i);
      lv.proportion_correct = props[i];
      lv.trial_count = 20;
      levels.push_back(lv);
    }
    const FitOutcome out = fit_psychometric_curve(levels);
    assert(out.ok());
    const FitResult& f = *out.fit;
    assert(model_bounds(ModelKind::Logistic, levels).contains(f.parameters));
    assert(f.r_squared > 0.9);
    assert(f.threshold > 475.0 && f.threshold < 525.0);
    assert(f.covariance.has_value());
    assert(f.covariance->size() == 16);
    for (size_t i = 0; i < 4; ++i) assert(std::isfinite(f.parameter_stderr(i)));
    assert(std::isnan(f.parameter_stderr(4)));
  }

  // Fewer than four levels: insufficient data, no fit.
  {
    auto levels = sample_levels(ModelKind::Logistic, {0.5, 0.05, 500.0, 0.98}, 20);
    levels.resize(3);
    const FitOutcome out = fit_psychometric_curve(levels);
    assert(out.status == FitStatus::InsufficientData);
    assert(!out.ok());
    assert(!out.fit.has_value());
    assert(!out.message.empty());

    const FitOutcome none = fit_psychometric_curve({}, ModelKind::CumulativeNormal);
    assert(none.status == FitStatus::InsufficientData);

    // The level count is checked before the optimizer runs: a budget that
    // cannot converge still reports insufficient data.
    FitOptions starved;
    starved.max_evaluations = 1;
    const FitOutcome early = fit_psychometric_curve(levels, starved);
    assert(early.status == FitStatus::InsufficientData);
    assert(!early.fit.has_value());
  }

  // A stimulus range wider than 100000 leaves the logistic slope with an empty
  // interval [0.001, 100/range]; the fit fails as a value.
  {
    const double props[] = {0.5, 0.6, 0.7, 0.9, 1.0};
    std::vector<PerformanceLevel> levels;
    for (int i = 0; i < 5; ++i) {
      PerformanceLevel lv;
      lv.intensity = 50000.0 * i;
      lv.proportion_correct = props[i];
      lv.trial_count = 10;
      levels.push_back(lv);
    }
    const FitOutcome out = fit_psychometric_curve(levels);
    assert(out.status == FitStatus::FitFailed);
    assert(!out.fit.has_value());
    assert(out.message.find("empty parameter bounds for b") != std::string::npos);

    const FitOutcome cn = fit_psychometric_curve(levels, ModelKind::CumulativeNormal);
    assert(cn.message.find("empty parameter bounds") == std::string::npos);
  }

  // Optimizer failure is a value, not an exception.
  {
    const auto levels = sample_levels(ModelKind::Logistic, {0.5, 0.05, 500.0, 0.98}, 20);
    FitOptions opt;
    opt.max_evaluations = 1;
    const FitOutcome out = fit_psychometric_curve(levels, opt);
    assert(out.status == FitStatus::FitFailed);
    assert(!out.fit.has_value());
    assert(out.message.find("did not converge") != std::string::npos);
  }

  // Flat data: the fit may succeed but the curve never reaches the target.
  {
    std::vector<PerformanceLevel> levels;
    for (int i = 0; i < 5; ++i) {
      PerformanceLevel lv;
      lv.intensity = 100.0 + 10.0 * i;
      lv.proportion_correct = 0.5;
      lv.trial_count = 10;
      levels.push_back(lv);
    }
    const FitOutcome out = fit_psychometric_curve(levels);
    if (out.ok()) {
      assert(!out.fit->threshold_determined());
      assert(out.fit->r_squared == 0.0);
    } else {
      assert(out.status == FitStatus::FitFailed);
    }
  }

  // Invalid options throw.
  {
    const auto levels = sample_levels(ModelKind::Logistic, {0.5, 0.05, 500.0, 0.98}, 20);
    bool threw = false;
    try {
      (void)fit_psychometric_curve(levels, ModelKind::Logistic, 1.5);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // R^2 helper.
  {
    assert(approx(r_squared({1.0, 2.0, 3.0}, {1.0, 2.0, 3.0}), 1.0, 1e-15));
    assert(approx(r_squared({1.0, 2.0, 3.0}, {2.0, 2.0, 2.0}), 0.0, 1e-15));
    assert(r_squared({0.5, 0.5}, {0.4, 0.6}) == 0.0);
  }

  assert(fit_status_name(FitStatus::InsufficientData) == "insufficient_data");

  std::cout << "test_psychometric_fit OK\n";
  return 0;
}
