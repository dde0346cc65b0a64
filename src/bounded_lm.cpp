#include "psyfit/bounded_lm.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace psyfit {

namespace {

static bool all_finite(const Eigen::VectorXd& r) {
  return r.allFinite();
}

static Eigen::VectorXd project(const Eigen::VectorXd& p,
                               const Eigen::VectorXd& lo,
                               const Eigen::VectorXd& hi) {
  return p.cwiseMax(lo).cwiseMin(hi);
}

static std::optional<Eigen::MatrixXd> relative_covariance(const Eigen::MatrixXd& jac, double cost) {
  const Eigen::Index m = jac.rows();
  const Eigen::Index n = jac.cols();
  if (m <= n) return std::nullopt;

  const Eigen::MatrixXd jtj = jac.transpose() * jac;
  Eigen::FullPivLU<Eigen::MatrixXd> lu(jtj);
  if (!lu.isInvertible()) return std::nullopt;

  Eigen::MatrixXd cov = lu.inverse() * (cost / static_cast<double>(m - n));
  if (!cov.allFinite()) return std::nullopt;
  return cov;
}

} // namespace

BoundedLmResult bounded_levenberg_marquardt(const ResidualFunction& fn,
                                            const std::vector<double>& p0,
                                            const std::vector<double>& lower,
                                            const std::vector<double>& upper,
                                            const BoundedLmOptions& opt) {
  const size_t n = p0.size();
  if (n == 0) throw std::runtime_error("bounded_levenberg_marquardt: no parameters");
  if (lower.size() != n || upper.size() != n) {
    throw std::runtime_error("bounded_levenberg_marquardt: bounds size mismatch");
  }
  for (size_t i = 0; i < n; ++i) {
    if (!(lower[i] <= upper[i])) {
      throw std::runtime_error("bounded_levenberg_marquardt: lower bound exceeds upper bound");
    }
  }

  const Eigen::Index ni = static_cast<Eigen::Index>(n);
  const Eigen::VectorXd lo = Eigen::Map<const Eigen::VectorXd>(lower.data(), ni);
  const Eigen::VectorXd hi = Eigen::Map<const Eigen::VectorXd>(upper.data(), ni);

  BoundedLmResult out;
  Eigen::VectorXd p = project(Eigen::Map<const Eigen::VectorXd>(p0.data(), ni), lo, hi);

  auto finish = [&](bool converged, const std::string& msg) {
    out.converged = converged;
    out.message = msg;
    out.params.assign(p.data(), p.data() + p.size());
    return out;
  };

  Eigen::VectorXd r;
  Eigen::MatrixXd jac;
  ++out.n_evaluations;
  if (!fn(p, &r, &jac) || !all_finite(r) || !jac.allFinite()) {
    return finish(false, "residuals are not finite at the initial point");
  }
  if (jac.rows() != r.size() || jac.cols() != ni) {
    throw std::runtime_error("bounded_levenberg_marquardt: Jacobian has the wrong shape");
  }
  out.n_residuals = static_cast<size_t>(r.size());
  double cost = r.squaredNorm();
  out.cost = cost;

  double lambda = opt.initial_lambda;
  const double tiny_cost = 1e-30;

  while (true) {
    if (cost <= tiny_cost) {
      out.covariance = relative_covariance(jac, cost);
      return finish(true, "residuals vanished");
    }

    const Eigen::VectorXd g = jac.transpose() * r;

    // Free parameters: not pinned against a bound by the descent direction -g.
    std::vector<Eigen::Index> free_idx;
    double g_free_max = 0.0;
    for (Eigen::Index i = 0; i < ni; ++i) {
      const bool at_lo = p[i] <= lo[i] && g[i] > 0.0;
      const bool at_hi = p[i] >= hi[i] && g[i] < 0.0;
      const bool fixed = lo[i] == hi[i];
      if (at_lo || at_hi || fixed) continue;
      free_idx.push_back(i);
      g_free_max = std::max(g_free_max, std::fabs(g[i]));
    }

    if (free_idx.empty() || g_free_max <= opt.gtol) {
      out.covariance = relative_covariance(jac, cost);
      return finish(true, "projected gradient below tolerance");
    }

    if (out.n_evaluations >= opt.max_evaluations) {
      return finish(false, "maximum number of function evaluations exceeded (" +
                               std::to_string(opt.max_evaluations) + ")");
    }

    const Eigen::Index nf = static_cast<Eigen::Index>(free_idx.size());
    Eigen::MatrixXd jf(jac.rows(), nf);
    Eigen::VectorXd gf(nf);
    for (Eigen::Index k = 0; k < nf; ++k) {
      jf.col(k) = jac.col(free_idx[static_cast<size_t>(k)]);
      gf[k] = g[free_idx[static_cast<size_t>(k)]];
    }
    const Eigen::MatrixXd a = jf.transpose() * jf;
    const double diag_floor = std::max(1e-12 * a.diagonal().maxCoeff(), 1e-300);

    Eigen::MatrixXd damped = a;
    for (Eigen::Index k = 0; k < nf; ++k) {
      damped(k, k) += lambda * std::max(a(k, k), diag_floor);
    }

    Eigen::LDLT<Eigen::MatrixXd> ldlt(damped);
    if (ldlt.info() != Eigen::Success) {
      lambda *= 10.0;
      if (lambda > opt.max_lambda) return finish(false, "normal equations are singular");
      continue;
    }
    const Eigen::VectorXd delta_f = ldlt.solve(-gf);

    Eigen::VectorXd p_trial = p;
    for (Eigen::Index k = 0; k < nf; ++k) {
      p_trial[free_idx[static_cast<size_t>(k)]] += delta_f[k];
    }
    p_trial = project(p_trial, lo, hi);

    const double step = (p_trial - p).norm();
    if (!std::isfinite(step)) {
      lambda *= 10.0;
      if (lambda > opt.max_lambda) return finish(false, "step is not finite");
      continue;
    }
    if (step <= opt.xtol * (opt.xtol + p.norm())) {
      out.covariance = relative_covariance(jac, cost);
      return finish(true, "step size below tolerance");
    }

    Eigen::VectorXd r_trial;
    Eigen::MatrixXd jac_trial;
    ++out.n_evaluations;
    const bool ok = fn(p_trial, &r_trial, &jac_trial) && all_finite(r_trial) && jac_trial.allFinite();
    const double cost_trial = ok ? r_trial.squaredNorm() : std::numeric_limits<double>::infinity();

    if (ok && cost_trial < cost) {
      const double rel_reduction = (cost - cost_trial) / cost;
      p = p_trial;
      r = r_trial;
      jac = jac_trial;
      cost = cost_trial;
      out.cost = cost;
      ++out.n_iterations;
      lambda = std::max(lambda / 10.0, 1e-12);
      if (rel_reduction <= opt.ftol) {
        out.covariance = relative_covariance(jac, cost);
        return finish(true, "relative cost reduction below tolerance");
      }
    } else {
      lambda *= 10.0;
      if (lambda > opt.max_lambda) {
        out.covariance = relative_covariance(jac, cost);
        return finish(true, "no further reduction of the cost");
      }
    }
  }
}

} // namespace psyfit
