#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace psyfit {

// Bounded Levenberg-Marquardt solver for small nonlinear least-squares
// problems (a handful of parameters, tens of residuals).
//
// Minimizes sum_i r_i(p)^2 subject to lower <= p <= upper.
//
// Implementation notes:
// - Marquardt scaling: the damping term is lambda * diag(J^T J).
// - Box constraints are handled by projection. Parameters sitting on a bound
//   whose gradient points out of the feasible box are frozen for that
//   iteration, the step is solved for the free parameters only, and the trial
//   point is clamped back into the box.
// - A trial point with non-finite residuals is treated like a rejected step
//   (lambda grows), so models may return NaN outside their domain.
// - Every residual evaluation counts against max_evaluations; running out of
//   budget is reported as non-convergence.

// Evaluate residuals r (size m) and their Jacobian dr/dp (m x n) at p.
// Return false if the point cannot be evaluated.
using ResidualFunction =
    std::function<bool(const Eigen::VectorXd& p, Eigen::VectorXd* r, Eigen::MatrixXd* jac)>;

struct BoundedLmOptions {
  size_t max_evaluations{5000};

  // Relative reduction of the cost below which an accepted step ends the fit.
  double ftol{1e-10};
  // Relative step size below which the fit ends.
  double xtol{1e-10};
  // Infinity norm of the projected gradient below which the fit ends.
  double gtol{1e-12};

  double initial_lambda{1e-3};
  double max_lambda{1e16};
};

struct BoundedLmResult {
  bool converged{false};
  std::string message;

  std::vector<double> params;
  double cost{0.0};  // sum of squared residuals at params
  size_t n_residuals{0};
  size_t n_evaluations{0};
  size_t n_iterations{0};

  // (J^T J)^-1 * cost / (m - n) at the solution, i.e. the parameter covariance
  // for residuals whose sigmas are only known up to a common scale.
  // Absent when m <= n or J^T J is singular.
  std::optional<Eigen::MatrixXd> covariance;
};

// Throws std::runtime_error if the sizes of p0/lower/upper disagree or a lower
// bound exceeds its upper bound.
BoundedLmResult bounded_levenberg_marquardt(const ResidualFunction& fn,
                                            const std::vector<double>& p0,
                                            const std::vector<double>& lower,
                                            const std::vector<double>& upper,
                                            const BoundedLmOptions& opt = BoundedLmOptions{});

} // namespace psyfit
