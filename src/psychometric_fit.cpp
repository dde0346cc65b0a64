#include "psyfit/psychometric_fit.hpp"

#include "psyfit/bounded_lm.hpp"
#include "psyfit/level_aggregator.hpp"

#include <stdexcept>

namespace psyfit {

double FitResult::parameter_stderr(size_t i) const {
  const size_t n = parameters.size();
  if (!covariance || i >= n || covariance->size() != n * n) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const double v = (*covariance)[i * n + i];
  return (v >= 0.0) ? std::sqrt(v) : std::numeric_limits<double>::quiet_NaN();
}

std::string fit_status_name(FitStatus s) {
  switch (s) {
    case FitStatus::Ok: return "ok";
    case FitStatus::InsufficientData: return "insufficient_data";
    case FitStatus::FitFailed: return "fit_failed";
  }
  return "fit_failed";
}

double r_squared(const std::vector<double>& observed, const std::vector<double>& predicted) {
  if (observed.empty() || observed.size() != predicted.size()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  double mean = 0.0;
  for (double y : observed) mean += y;
  mean /= static_cast<double>(observed.size());

  double ss_res = 0.0;
  double ss_tot = 0.0;
  for (size_t i = 0; i < observed.size(); ++i) {
    const double e = observed[i] - predicted[i];
    const double d = observed[i] - mean;
    ss_res += e * e;
    ss_tot += d * d;
  }
  if (!(ss_tot > 0.0)) return 0.0;
  return 1.0 - ss_res / ss_tot;
}

FitOutcome fit_psychometric_curve(const std::vector<PerformanceLevel>& levels,
                                  const FitOptions& opt) {
  if (!(opt.target > 0.0 && opt.target < 1.0)) {
    throw std::runtime_error("fit_psychometric_curve: target must be in (0,1)");
  }
  if (opt.max_evaluations == 0) {
    throw std::runtime_error("fit_psychometric_curve: max_evaluations must be > 0");
  }

  FitOutcome out;
  if (levels.size() < kMinLevelsForFit) {
    out.status = FitStatus::InsufficientData;
    out.message = "only " + std::to_string(levels.size()) +
                  " stimulus levels with sufficient trials (need " +
                  std::to_string(kMinLevelsForFit) + ")";
    return out;
  }

  const ModelKind model = opt.model;
  const ParameterBounds bounds = model_bounds(model, levels);
  for (size_t i = 0; i < bounds.lower.size(); ++i) {
    if (!(bounds.lower[i] <= bounds.upper[i])) {
      out.status = FitStatus::FitFailed;
      out.message = "empty parameter bounds for " + model_parameter_names(model)[i] +
                    " (stimulus range too wide for the slope limits)";
      return out;
    }
  }
  const std::vector<double> p0 = model_initial_guess(model, levels);
  const std::vector<double> weights = model_weights(model, levels);

  const Eigen::Index m = static_cast<Eigen::Index>(levels.size());
  const Eigen::Index np = static_cast<Eigen::Index>(model_parameter_count(model));

  // r_i = w_i * (y_i - f(x_i; p)), i.e. sigma_i = 1 / w_i.
  const ResidualFunction residuals = [&](const Eigen::VectorXd& p,
                                         Eigen::VectorXd* r,
                                         Eigen::MatrixXd* jac) {
    const std::vector<double> pv(p.data(), p.data() + p.size());
    r->resize(m);
    jac->resize(m, np);
    std::vector<double> grad;
    for (Eigen::Index i = 0; i < m; ++i) {
      const PerformanceLevel& lv = levels[static_cast<size_t>(i)];
      const double w = weights[static_cast<size_t>(i)];
      (*r)[i] = w * (lv.proportion_correct - model_predict(model, pv, lv.intensity));
      model_gradient(model, pv, lv.intensity, &grad);
      for (Eigen::Index j = 0; j < np; ++j) {
        (*jac)(i, j) = -w * grad[static_cast<size_t>(j)];
      }
    }
    return true;
  };

  BoundedLmOptions lm_opt;
  lm_opt.max_evaluations = opt.max_evaluations;
  const BoundedLmResult lm = bounded_levenberg_marquardt(residuals, p0, bounds.lower, bounds.upper, lm_opt);

  if (!lm.converged) {
    out.status = FitStatus::FitFailed;
    out.message = "optimizer did not converge: " + lm.message;
    return out;
  }
  if (!bounds.contains(lm.params)) {
    out.status = FitStatus::FitFailed;
    out.message = "fitted parameters violate the parameter bounds";
    return out;
  }
  if (model == ModelKind::CumulativeNormal && !(lm.params[1] > 0.0)) {
    out.status = FitStatus::FitFailed;
    out.message = "fitted sigma is not positive";
    return out;
  }

  FitResult fit;
  fit.model = model;
  fit.target = opt.target;
  fit.parameter_names = model_parameter_names(model);
  fit.parameters = lm.params;
  fit.n_evaluations = lm.n_evaluations;
  fit.levels_used = levels;

  if (lm.covariance) {
    const Eigen::MatrixXd& c = *lm.covariance;
    std::vector<double> cov(static_cast<size_t>(c.rows() * c.cols()));
    for (Eigen::Index i = 0; i < c.rows(); ++i) {
      for (Eigen::Index j = 0; j < c.cols(); ++j) {
        cov[static_cast<size_t>(i * c.cols() + j)] = c(i, j);
      }
    }
    fit.covariance = cov;
  }

  std::vector<double> observed;
  std::vector<double> predicted;
  observed.reserve(levels.size());
  predicted.reserve(levels.size());
  for (const auto& lv : levels) {
    observed.push_back(lv.proportion_correct);
    predicted.push_back(fit.predict(lv.intensity));
  }
  fit.r_squared = r_squared(observed, predicted);

  fit.threshold = model_threshold(model, fit.parameters, opt.target,
                                  levels.front().intensity, levels.back().intensity);

  out.status = FitStatus::Ok;
  out.message = lm.message;
  out.fit = fit;
  return out;
}

FitOutcome fit_psychometric_curve(const std::vector<PerformanceLevel>& levels,
                                  ModelKind model,
                                  double target) {
  FitOptions opt;
  opt.model = model;
  opt.target = target;
  return fit_psychometric_curve(levels, opt);
}

} // namespace psyfit
