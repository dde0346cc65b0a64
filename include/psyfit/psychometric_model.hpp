#pragma once

#include "psyfit/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace psyfit {

// Psychometric curve models.
//
// Supported models:
//   - Logistic (4 parameters a, b, c, d):
//       f(x) = a + (d - a) / (1 + exp(-b * (x - c)))
//     a = lower asymptote (chance region for 2AFC), b = slope,
//     c = inflection point, d = upper asymptote (1 - lapse rate).
//
//   - CumulativeNormal (2 parameters mu, sigma):
//       f(x) = Phi((x - mu) / sigma)
//
// Everything model-specific (parameter count, bounds, starting point,
// weighting, threshold inversion) is dispatched on ModelKind here, so a new
// model only touches this unit.
enum class ModelKind {
  Logistic,
  CumulativeNormal
};

std::string model_kind_name(ModelKind m);

// Accepts "logistic"/"logit" and "cumulative_normal"/"cumnorm"/"probit"/"normal"
// (case-insensitive, '-' treated as '_'). Throws std::runtime_error otherwise.
ModelKind parse_model_kind(std::string s);

size_t model_parameter_count(ModelKind m);
std::vector<std::string> model_parameter_names(ModelKind m);

// Evaluate the model at x.
double model_predict(ModelKind m, const std::vector<double>& params, double x);

// Partial derivatives of the model w.r.t. each parameter at x.
// grad is resized to model_parameter_count(m).
void model_gradient(ModelKind m, const std::vector<double>& params, double x, std::vector<double>* grad);

// Box constraints on the parameters. Unbounded entries are +-infinity.
struct ParameterBounds {
  std::vector<double> lower;
  std::vector<double> upper;

  bool contains(const std::vector<double>& p) const;
  bool bounded() const;
};

// Data-dependent parameter bounds.
//
// Logistic (range = max x - min x):
//   a in [0.4, 0.6], b in [0.001, 100/range], c in [min x, max x],
//   d in [min observed proportion, 1.0]
// CumulativeNormal: unbounded.
//
// levels must be non-empty and sorted by intensity.
ParameterBounds model_bounds(ModelKind m, const std::vector<PerformanceLevel>& levels);

// Heuristic starting point.
//
// Logistic: c0 = first intensity with proportion >= 0.7 (else mid-range),
//   b0 = 4/range, a0 = min proportion, d0 = max proportion; every entry is
//   clamped into model_bounds().
// CumulativeNormal: mu0 = median intensity, sigma0 = population std of the
//   intensities.
std::vector<double> model_initial_guess(ModelKind m, const std::vector<PerformanceLevel>& levels);

// Per-level regression weights (inverse uncertainty, sigma_i = 1/w_i).
//
// Logistic: sqrt(n) * (1 - 0.5 * |p - 0.5|), favoring well-sampled levels and
//   down-weighting near-floor/ceiling levels that say little about the slope.
// CumulativeNormal: sqrt(n).
std::vector<double> model_weights(ModelKind m, const std::vector<PerformanceLevel>& levels);

// Stimulus intensity at which the fitted curve reaches `target`.
//
// Logistic: c - ln((d - a) / (target - a) - 1) / b, only if a < target < d and
//   b > 0, and only if the result lies within [x_min, x_max]; NaN otherwise.
// CumulativeNormal: mu + sigma * Phi^-1(target). No range check is applied
//   (x_min/x_max are ignored), so this may extrapolate.
double model_threshold(ModelKind m,
                       const std::vector<double>& params,
                       double target,
                       double x_min,
                       double x_max);

} // namespace psyfit
