#pragma once

#include "teleop_ik/config.hpp"
#include "teleop_ik/lm_solver.hpp"
#include "teleop_ik/safety.hpp"
#include "teleop_ik/types.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace teleop_ik {

enum class StepSource { None, LevenbergMarquardt, NearLimitTranspose, FallbackTranspose, Snap };

const char *stepSourceName(StepSource source);

// Ordered per-iteration strategies. The first one that yields a decision wins.
enum class Strategy {
  NearLimitTranspose, // transpose step directly when a DOF is close to a limit
  LevenbergMarquardt,
  JacobianTranspose,  // transpose step after LM failure
  SnapTarget,         // give up: snap the target to the current pose
};

struct StepDecision {
  StepSource source = StepSource::None;
  Eigen::VectorXd step;
  // snap the target instead of applying a step
  bool snap = false;
};

// Inputs of one iteration, all evaluated at the current configuration.
struct StepContext {
  const Jacobian &J;
  const Vector6d &e;       // gain-scaled residual
  const Vector6d &e_jt;    // residual for the transpose step
  const Vector6d &weights;
  const std::vector<ControlledDof> &dofs;
  const Eigen::VectorXd &q;
  const LevenbergMarquardtSolver::TrueCost &true_cost;
};

class StepPolicy {
public:
  explicit StepPolicy(const TeleopIkConfig &cfg);

  // Runs the strategy list. lambda and the fallback counter are updated in place.
  StepDecision decide(const StepContext &ctx, double &lambda, int &fallback_count) const;

  const std::vector<Strategy> &strategies() const { return strategies_; }
  const LevenbergMarquardtSolver &solver() const { return solver_; }

private:
  std::vector<Strategy> strategies_;
  LevenbergMarquardtSolver solver_;
  TransposeStepParams transpose_;
  double near_limit_margin_;
  int fallback_cap_;
};

} // namespace teleop_ik
