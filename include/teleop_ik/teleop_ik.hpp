#pragma once

#include "teleop_ik/config.hpp"
#include "teleop_ik/joint_resolver.hpp"
#include "teleop_ik/kinematic_provider.hpp"
#include "teleop_ik/pose_error.hpp"
#include "teleop_ik/pose_target.hpp"
#include "teleop_ik/safety.hpp"
#include "teleop_ik/step_policy.hpp"
#include "teleop_ik/types.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace teleop_ik {

// Per-instance solver memory, kept across update() calls.
struct SolverState {
  double lambda = 0.1;
  StallDetector stall{1e-4, 3};
  int fallback_count = 0;
  StepSource last_source = StepSource::None;
  // iterations run by the last solving update()
  int last_iterations = 0;
};

struct Diagnostics {
  std::string mode;
  std::string end_effector;
  int dof_count = 0;
  bool dirty = false;
  bool converged = false;
  bool disabled = false;
  Pose target;
  std::optional<double> last_error;
  double lambda = 0.0;
  int stall_count = 0;
  int fallback_count = 0;
  StepSource last_source = StepSource::None;
  int last_iterations = 0;
  double last_solve_time_ms = 0.0;
};

// Teleoperation IK: turns pose intents into actuator commands once per host tick.
class TeleopIk {
public:
  // Validates cfg, resolves the joint/actuator tables and syncs commands to the measured
  // coordinates. Throws ConfigurationError on a model/configuration mismatch.
  TeleopIk(KinematicProvider &provider, const TeleopIkConfig &cfg);

  TeleopIk(const TeleopIk &) = delete;
  TeleopIk &operator=(const TeleopIk &) = delete;

  void setTargetPositionDelta(const Eigen::Vector3d &delta);
  void setTargetOrientationDelta(const Eigen::Vector3d &euler_xyz);
  void resetToCurrentPose();

  // Never throws. An internal failure is logged and disables the instance until onModelReloaded().
  void update(double timestamp_ms, bool host_paused);

  // Rebuild tables after the host reloaded the model. Throws ConfigurationError.
  void onModelReloaded();

  const Pose &target() const { return target_.pose(); }
  bool dirty() const { return target_.dirty(); }
  bool converged() const { return converged_; }
  bool disabled() const { return disabled_; }
  const std::optional<double> &lastError() const { return state_.stall.lastError(); }
  const SolverState &state() const { return state_; }
  const PoseTarget &poseTarget() const { return target_; }
  const Resolution &resolution() const { return res_; }
  const TeleopIkConfig &config() const { return cfg_; }

  Diagnostics diagnostics() const;
  nlohmann::json diagnosticsJson() const;

private:
  Pose currentPose();
  void syncControlsFromCoordinates();
  void resetSolverState();
  void snapTarget(const Pose &current);
  void solveJointSpace(double timestamp_ms, bool host_paused);
  Eigen::VectorXd dofValues() const;
  Vector6d poseWeights() const;
  double trueCost(const Eigen::VectorXd &step, const Eigen::VectorXd &q_dofs, const Vector6d &w);

  KinematicProvider &provider_;
  TeleopIkConfig cfg_;
  Resolution res_;
  StepPolicy policy_;
  ActuatorIntegrator integrator_;
  PoseTarget target_;
  SolverState state_;
  bool converged_ = false;
  bool disabled_ = false;
  double last_solve_time_ms_ = 0.0;
  std::optional<double> last_no_dof_warning_ms_;
};

} // namespace teleop_ik
