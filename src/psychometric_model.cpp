#include "psyfit/psychometric_model.hpp"

#include "psyfit/normal_dist.hpp"
#include "psyfit/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace psyfit {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

static void require_params(ModelKind m, const std::vector<double>& params) {
  if (params.size() != model_parameter_count(m)) {
    throw std::runtime_error("psychometric model '" + model_kind_name(m) + "': expected " +
                             std::to_string(model_parameter_count(m)) + " parameters, got " +
                             std::to_string(params.size()));
  }
}

static void require_levels(const std::vector<PerformanceLevel>& levels) {
  if (levels.empty()) throw std::runtime_error("psychometric model: no performance levels");
}

// 1 / (1 + exp(-t)) without overflow for large |t|.
static double sigmoid(double t) {
  if (t >= 0.0) {
    const double e = std::exp(-t);
    return 1.0 / (1.0 + e);
  }
  const double e = std::exp(t);
  return e / (1.0 + e);
}

static double median_copy(std::vector<double> v) {
  if (v.empty()) return std::numeric_limits<double>::quiet_NaN();
  const size_t n = v.size();
  const size_t mid = n / 2;
  std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
  double m = v[mid];
  if (n % 2 == 0) {
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid - 1), v.end());
    m = 0.5 * (m + v[mid - 1]);
  }
  return m;
}

} // namespace

std::string model_kind_name(ModelKind m) {
  switch (m) {
    case ModelKind::Logistic: return "logistic";
    case ModelKind::CumulativeNormal: return "cumulative_normal";
  }
  return "logistic";
}

ModelKind parse_model_kind(std::string s) {
  s = to_lower(trim(s));
  std::replace(s.begin(), s.end(), '-', '_');

  if (s == "logistic" || s == "logit") return ModelKind::Logistic;
  if (s == "cumulative_normal" || s == "cumnorm" || s == "probit" || s == "normal") {
    return ModelKind::CumulativeNormal;
  }
  throw std::runtime_error("Invalid model: '" + s + "' (expected 'logistic' or 'cumulative_normal')");
}

size_t model_parameter_count(ModelKind m) {
  switch (m) {
    case ModelKind::Logistic: return 4;
    case ModelKind::CumulativeNormal: return 2;
  }
  return 0;
}

std::vector<std::string> model_parameter_names(ModelKind m) {
  switch (m) {
    case ModelKind::Logistic: return {"a", "b", "c", "d"};
    case ModelKind::CumulativeNormal: return {"mu", "sigma"};
  }
  return {};
}

double model_predict(ModelKind m, const std::vector<double>& p, double x) {
  require_params(m, p);
  switch (m) {
    case ModelKind::Logistic:
      return p[0] + (p[3] - p[0]) * sigmoid(p[1] * (x - p[2]));
    case ModelKind::CumulativeNormal:
      // sigma <= 0 has no meaning; NaN makes the optimizer reject the step.
      if (!(p[1] > 0.0)) return std::numeric_limits<double>::quiet_NaN();
      return normal_cdf((x - p[0]) / p[1]);
  }
  return std::numeric_limits<double>::quiet_NaN();
}

void model_gradient(ModelKind m, const std::vector<double>& p, double x, std::vector<double>* grad) {
  require_params(m, p);
  if (!grad) return;
  grad->assign(model_parameter_count(m), 0.0);

  switch (m) {
    case ModelKind::Logistic: {
      const double a = p[0], b = p[1], c = p[2], d = p[3];
      const double s = sigmoid(b * (x - c));
      const double ds = s * (1.0 - s);
      (*grad)[0] = 1.0 - s;
      (*grad)[1] = (d - a) * ds * (x - c);
      (*grad)[2] = -(d - a) * ds * b;
      (*grad)[3] = s;
      return;
    }
    case ModelKind::CumulativeNormal: {
      const double mu = p[0], sigma = p[1];
      if (!(sigma > 0.0)) {
        grad->assign(2, std::numeric_limits<double>::quiet_NaN());
        return;
      }
      const double z = (x - mu) / sigma;
      const double phi = normal_pdf(z);
      (*grad)[0] = -phi / sigma;
      (*grad)[1] = -phi * z / sigma;
      return;
    }
  }
}

bool ParameterBounds::contains(const std::vector<double>& p) const {
  if (p.size() != lower.size() || p.size() != upper.size()) return false;
  for (size_t i = 0; i < p.size(); ++i) {
    if (!(p[i] >= lower[i]) || !(p[i] <= upper[i])) return false;
  }
  return true;
}

bool ParameterBounds::bounded() const {
  for (size_t i = 0; i < lower.size(); ++i) {
    if (std::isfinite(lower[i]) || std::isfinite(upper[i])) return true;
  }
  return false;
}

ParameterBounds model_bounds(ModelKind m, const std::vector<PerformanceLevel>& levels) {
  require_levels(levels);
  ParameterBounds b;
  const size_t np = model_parameter_count(m);

  switch (m) {
    case ModelKind::Logistic: {
      const double x_min = levels.front().intensity;
      const double x_max = levels.back().intensity;
      const double range = x_max - x_min;
      double p_min = levels.front().proportion_correct;
      for (const auto& lv : levels) p_min = std::min(p_min, lv.proportion_correct);

      b.lower = {0.4, 0.001, x_min, p_min};
      b.upper = {0.6, (range > 0.0) ? (100.0 / range) : kInf, x_max, 1.0};
      return b;
    }
    case ModelKind::CumulativeNormal:
      b.lower.assign(np, -kInf);
      b.upper.assign(np, kInf);
      return b;
  }
  return b;
}

std::vector<double> model_initial_guess(ModelKind m, const std::vector<PerformanceLevel>& levels) {
  require_levels(levels);

  switch (m) {
    case ModelKind::Logistic: {
      const double x_min = levels.front().intensity;
      const double x_max = levels.back().intensity;
      const double range = x_max - x_min;

      double c0 = x_min + 0.5 * range;
      for (const auto& lv : levels) {
        if (lv.proportion_correct >= 0.7) {
          c0 = lv.intensity;
          break;
        }
      }

      double p_min = levels.front().proportion_correct;
      double p_max = p_min;
      for (const auto& lv : levels) {
        p_min = std::min(p_min, lv.proportion_correct);
        p_max = std::max(p_max, lv.proportion_correct);
      }

      const double b0 = (range > 0.0) ? (4.0 / range) : 1.0;
      std::vector<double> p0 = {p_min, b0, c0, p_max};

      const ParameterBounds bnd = model_bounds(m, levels);
      for (size_t i = 0; i < p0.size(); ++i) {
        p0[i] = std::min(std::max(p0[i], bnd.lower[i]), bnd.upper[i]);
      }
      return p0;
    }
    case ModelKind::CumulativeNormal: {
      std::vector<double> xs;
      xs.reserve(levels.size());
      double mean = 0.0;
      for (const auto& lv : levels) {
        xs.push_back(lv.intensity);
        mean += lv.intensity;
      }
      mean /= static_cast<double>(xs.size());
      double ss = 0.0;
      for (double x : xs) ss += (x - mean) * (x - mean);
      double sd = std::sqrt(ss / static_cast<double>(xs.size()));
      if (!(sd > 0.0)) sd = 1.0;
      return {median_copy(xs), sd};
    }
  }
  return {};
}

std::vector<double> model_weights(ModelKind m, const std::vector<PerformanceLevel>& levels) {
  std::vector<double> w;
  w.reserve(levels.size());
  for (const auto& lv : levels) {
    double wi = std::sqrt(static_cast<double>(lv.trial_count));
    if (m == ModelKind::Logistic) {
      wi *= 1.0 - 0.5 * std::fabs(lv.proportion_correct - 0.5);
    }
    w.push_back(wi);
  }
  return w;
}

double model_threshold(ModelKind m,
                       const std::vector<double>& p,
                       double target,
                       double x_min,
                       double x_max) {
  require_params(m, p);
  const double nan = std::numeric_limits<double>::quiet_NaN();

  switch (m) {
    case ModelKind::Logistic: {
      const double a = p[0], b = p[1], c = p[2], d = p[3];
      if (!(a < target && target < d && b > 0.0)) return nan;
      const double thr = c - std::log((d - a) / (target - a) - 1.0) / b;
      if (!std::isfinite(thr) || thr < x_min || thr > x_max) return nan;
      return thr;
    }
    case ModelKind::CumulativeNormal:
      // Not clipped to [x_min, x_max], unlike the logistic path.
      return p[0] + p[1] * normal_quantile(target);
  }
  return nan;
}

} // namespace psyfit
