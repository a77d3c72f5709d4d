#pragma once

#include "teleop_ik/kinematic_provider.hpp"
#include "teleop_ik/types.hpp"

#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace teleop_ik {

// True if any limited DOF lies within margin_fraction * span of either limit. q holds one value per DOF.
bool anyDofNearLimit(const std::vector<ControlledDof> &dofs, const Eigen::VectorXd &q, double margin_fraction);

struct TransposeStepParams {
  double damping_scale = 1.5;
  // attenuation zone is 2 * limit_margin_fraction * span
  double limit_margin_fraction = 0.05;
  double step_limit = 0.05;
};

// J^T e with per-DOF attenuation of motion into a limit, scaled and clamped to the step limit.
Eigen::VectorXd jacobianTransposeStep(const Jacobian &J, const Vector6d &e, const std::vector<ControlledDof> &dofs,
                                      const Eigen::VectorXd &q, const TransposeStepParams &p);

// Consecutive iterations whose error improvement stays below a threshold.
class StallDetector {
public:
  StallDetector(double min_improvement, int max_iterations)
    : min_improvement_(min_improvement), max_iterations_(max_iterations) {}

  // Record this iteration's combined error. Returns true when the stall threshold is reached.
  bool observe(double error);
  void reset();

  int count() const { return count_; }
  const std::optional<double> &lastError() const { return last_error_; }

private:
  double min_improvement_;
  int max_iterations_; // 0 disables
  int count_ = 0;
  std::optional<double> last_error_;
};

// Integrates joint steps into actuator commands with range, soft-wall and anti-windup clamps.
class ActuatorIntegrator {
public:
  struct Params {
    bool use_safety_margin = true;
    double safety_margin_fraction = 0.06;
    double max_ctrl_offset = 0.5; // <= 0 disables
  };

  explicit ActuatorIntegrator(const Params &p) : params_(p) {}

  // New command for one DOF from the previous command, the step and the measured coordinate.
  double command(const ControlledDof &dof, const ActuatorBinding &binding, double previous, double step,
                 double measured) const;

  // Writes commands for every binding into provider.controls(). With preview, the controlled
  // coordinates are set to the new commands. Returns false (and writes nothing) when a binding
  // points outside the command buffer.
  bool apply(KinematicProvider &provider, const std::vector<ControlledDof> &dofs,
             const std::vector<ActuatorBinding> &bindings, const Eigen::VectorXd &step, bool preview) const;

private:
  Params params_;
};

} // namespace teleop_ik
