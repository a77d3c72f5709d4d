#include "teleop_ik/lm_solver.hpp"

#include <algorithm>
#include <cmath>

namespace teleop_ik {

namespace {
constexpr double kMinMargin = 1e-6;
constexpr double kTinyReduction = 1e-12;
}

Eigen::VectorXd solveLinearSystem(Eigen::MatrixXd A, Eigen::VectorXd b, double pivot_tolerance) {
  const Eigen::Index n = A.rows();
  if (A.cols() != n || b.size() != n) return Eigen::VectorXd::Zero(b.size());

  for (Eigen::Index col = 0; col < n; ++col) {
    Eigen::Index pivot_row = col;
    double pivot_val = std::abs(A(col, col));
    for (Eigen::Index r = col + 1; r < n; ++r) {
      const double v = std::abs(A(r, col));
      if (v > pivot_val) {
        pivot_val = v;
        pivot_row = r;
      }
    }
    if (!(pivot_val >= pivot_tolerance)) return Eigen::VectorXd::Zero(n);
    if (pivot_row != col) {
      A.row(col).swap(A.row(pivot_row));
      std::swap(b[col], b[pivot_row]);
    }

    const double inv = 1.0 / A(col, col);
    A.row(col) *= inv;
    b[col] *= inv;
    for (Eigen::Index r = 0; r < n; ++r) {
      if (r == col) continue;
      const double f = A(r, col);
      if (f == 0.0) continue;
      A.row(r) -= f * A.row(col);
      b[r] -= f * b[col];
    }
  }
  return b;
}

void LimitBarrier::residual(const ControlledDof &dof, double q, double &r, double &dr) const {
  r = 0.0;
  dr = 0.0;
  if (!dof.limited()) return;
  const double margin = std::max(kMinMargin, dof.span() * margin_fraction_);
  const double inner_lo = dof.lower + margin;
  const double inner_hi = dof.upper - margin;
  if (q < inner_lo) {
    r = (inner_lo - q) / margin;
    dr = -1.0 / margin;
  } else if (q > inner_hi) {
    r = (q - inner_hi) / margin;
    dr = 1.0 / margin;
  }
}

LimitBarrier::Terms LimitBarrier::evaluate(const std::vector<ControlledDof> &dofs, const Eigen::VectorXd &q) const {
  Terms t;
  const Eigen::Index n = static_cast<Eigen::Index>(dofs.size());
  t.hessian_diag = Eigen::VectorXd::Zero(n);
  t.gradient = Eigen::VectorXd::Zero(n);
  if (!active()) return t;
  for (Eigen::Index k = 0; k < n; ++k) {
    double r, dr;
    residual(dofs[k], q[k], r, dr);
    if (r == 0.0) continue;
    t.hessian_diag[k] = weight_ * dr * dr;
    t.gradient[k] = -weight_ * dr * r;
  }
  return t;
}

double LimitBarrier::penalty(const std::vector<ControlledDof> &dofs, const Eigen::VectorXd &q) const {
  if (!active()) return 0.0;
  double sum = 0.0;
  for (size_t k = 0; k < dofs.size(); ++k) {
    double r, dr;
    residual(dofs[k], q[static_cast<Eigen::Index>(k)], r, dr);
    sum += weight_ * r * r;
  }
  return sum;
}

std::optional<Eigen::VectorXd> LevenbergMarquardtSolver::solve(const Jacobian &J, const Vector6d &e,
                                                               const Vector6d &w,
                                                               const std::vector<ControlledDof> &dofs,
                                                               const Eigen::VectorXd &q_dofs,
                                                               const TrueCost &true_cost, double &lambda) const {
  trials_.clear();
  const Eigen::Index n = J.cols();
  const Eigen::MatrixXd JtW = J.transpose() * w.asDiagonal();
  Eigen::MatrixXd H = JtW * J;
  Eigen::VectorXd g = JtW * e;

  const LimitBarrier::Terms limit = barrier_.evaluate(dofs, q_dofs);
  H.diagonal() += limit.hessian_diag;
  g += limit.gradient;

  const double current_cost = e.dot(w.cwiseProduct(e)) + barrier_.penalty(dofs, q_dofs);
  lambda = std::min(params_.lambda_max, std::max(params_.lambda_min, lambda));

  for (int trial = 0; trial < params_.max_trials; ++trial) {
    Eigen::MatrixXd H_trial = H;
    H_trial.diagonal().array() += lambda;
    Eigen::VectorXd step = solveLinearSystem(H_trial, g);

    // Uniform scaling keeps the step direction.
    const double max_abs = n > 0 ? step.cwiseAbs().maxCoeff() : 0.0;
    if (max_abs > params_.step_limit) step *= params_.step_limit / max_abs;

    Trial t;
    t.step = step;
    t.current_cost = current_cost;
    if (step.allFinite()) {
      const Vector6d e_pred = e - J * step;
      t.predicted_cost = e_pred.dot(w.cwiseProduct(e_pred)) + barrier_.penalty(dofs, q_dofs + step);
      t.true_cost = true_cost(step);

      const double predicted_change = t.predicted_cost - current_cost;
      const bool tiny = std::abs(predicted_change) < kTinyReduction;
      const double rho = tiny ? 0.0 : (t.true_cost - current_cost) / predicted_change;
      t.accepted = std::isfinite(t.true_cost) && t.true_cost < current_cost &&
                   (tiny || rho >= params_.step_quality_min);
    }
    trials_.push_back(t);

    if (t.accepted) {
      lambda = std::max(params_.lambda_min, lambda / params_.lambda_factor);
      return step;
    }
    lambda = std::min(params_.lambda_max, lambda * params_.lambda_factor);
  }
  return std::nullopt;
}

} // namespace teleop_ik
