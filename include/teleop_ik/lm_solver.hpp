#pragma once

#include "teleop_ik/types.hpp"

#include <Eigen/Dense>
#include <functional>
#include <optional>
#include <vector>

namespace teleop_ik {

// Solve A x = b by Gauss-Jordan elimination with partial pivoting. Returns a zero vector when a
// pivot magnitude falls below pivot_tolerance.
Eigen::VectorXd solveLinearSystem(Eigen::MatrixXd A, Eigen::VectorXd b, double pivot_tolerance = 1e-12);

// Quadratic soft barrier inside a fractional margin of each limited DOF's range.
class LimitBarrier {
public:
  struct Terms {
    Eigen::VectorXd hessian_diag; // w * d^2
    Eigen::VectorXd gradient;     // -w * d * r, a descent direction
  };

  LimitBarrier(double weight, double margin_fraction) : weight_(weight), margin_fraction_(margin_fraction) {}

  bool active() const { return weight_ > 0.0 && margin_fraction_ > 0.0; }

  // q holds one value per DOF.
  Terms evaluate(const std::vector<ControlledDof> &dofs, const Eigen::VectorXd &q) const;
  double penalty(const std::vector<ControlledDof> &dofs, const Eigen::VectorXd &q) const;

private:
  // r = depth into the margin / margin, with dr/dq. Both 0 outside the margin.
  void residual(const ControlledDof &dof, double q, double &r, double &dr) const;

  double weight_;
  double margin_fraction_;
};

class LevenbergMarquardtSolver {
public:
  struct Params {
    double lambda_factor = 2.0;
    double lambda_min = 1e-5;
    double lambda_max = 10.0;
    double step_quality_min = 1e-3;
    int max_trials = 10;
    double step_limit = 0.05;
    double limit_weight = 10.0;
    double limit_margin_fraction = 0.05;
  };

  struct Trial {
    Eigen::VectorXd step;
    double current_cost = 0.0;
    double predicted_cost = 0.0;
    double true_cost = 0.0;
    bool accepted = false;
  };

  // True (nonlinear) cost of the configuration q_dofs + step, barrier included.
  using TrueCost = std::function<double(const Eigen::VectorXd &step)>;

  explicit LevenbergMarquardtSolver(const Params &p) : params_(p), barrier_(p.limit_weight, p.limit_margin_fraction) {}

  // One trust-region solve of (J^T W J + B + lambda I) step = J^T W e + b. lambda is adapted in place.
  // Returns nullopt when no trial is accepted within max_trials.
  std::optional<Eigen::VectorXd> solve(const Jacobian &J, const Vector6d &e, const Vector6d &w,
                                       const std::vector<ControlledDof> &dofs, const Eigen::VectorXd &q_dofs,
                                       const TrueCost &true_cost, double &lambda) const;

  const Params &params() const { return params_; }
  const LimitBarrier &barrier() const { return barrier_; }
  // Trials of the last solve() call.
  const std::vector<Trial> &trials() const { return trials_; }

private:
  Params params_;
  LimitBarrier barrier_;
  mutable std::vector<Trial> trials_;
};

} // namespace teleop_ik
