#pragma once

#include "psyfit/psychometric_model.hpp"
#include "psyfit/threshold_interpolator.hpp"
#include "psyfit/types.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace psyfit {

struct FitOptions {
  ModelKind model{ModelKind::Logistic};
  double target{kStaircaseTarget};

  // Optimizer budget (residual evaluations).
  size_t max_evaluations{5000};
};

struct FitResult {
  ModelKind model{ModelKind::Logistic};
  double target{kStaircaseTarget};

  std::vector<std::string> parameter_names;
  std::vector<double> parameters;

  // Row-major parameters.size() x parameters.size() covariance matrix.
  // Absent when there are no residual degrees of freedom or the normal
  // matrix is singular.
  std::optional<std::vector<double>> covariance;

  // 1 - SS_res / SS_tot on the unweighted proportions (0 if SS_tot == 0).
  double r_squared{0.0};

  // Intensity at which the fitted curve reaches `target`. NaN when the fit is
  // valid but the threshold cannot be determined within the data support.
  double threshold{std::numeric_limits<double>::quiet_NaN()};

  std::vector<PerformanceLevel> levels_used;
  size_t n_evaluations{0};

  bool threshold_determined() const { return std::isfinite(threshold); }

  // Fitted curve evaluated at x.
  double predict(double x) const { return model_predict(model, parameters, x); }

  // Standard error of parameter i (NaN if the covariance is absent).
  double parameter_stderr(size_t i) const;
};

enum class FitStatus {
  Ok,
  InsufficientData,  // fewer than kMinLevelsForFit levels; optimizer not run
  FitFailed          // optimizer did not converge or left the feasible region
};

std::string fit_status_name(FitStatus s);

struct FitOutcome {
  FitStatus status{FitStatus::InsufficientData};
  std::optional<FitResult> fit;  // present iff status == FitStatus::Ok
  std::string message;

  bool ok() const { return status == FitStatus::Ok && fit.has_value(); }
};

// Weighted, bounded nonlinear least-squares fit of a psychometric curve.
//
// levels must be sorted by ascending intensity with unique intensities (as
// produced by aggregate_levels()). The model-specific bounds, starting point
// and weights come from psychometric_model.hpp; the threshold is derived with
// model_threshold().
//
// Insufficient data and optimizer failures are reported through FitOutcome,
// never by throwing. Throws std::runtime_error only for invalid options
// (target outside (0,1), zero evaluation budget).
FitOutcome fit_psychometric_curve(const std::vector<PerformanceLevel>& levels,
                                  const FitOptions& opt = FitOptions{});

// Convenience overload.
FitOutcome fit_psychometric_curve(const std::vector<PerformanceLevel>& levels,
                                  ModelKind model,
                                  double target = kStaircaseTarget);

// Coefficient of determination of predictions vs observations.
double r_squared(const std::vector<double>& observed, const std::vector<double>& predicted);

} // namespace psyfit
