#include "teleop_ik/teleop_ik.hpp"

#include <rclcpp/rclcpp.hpp>

namespace teleop_ik {

namespace {

const rclcpp::Logger kLogger = rclcpp::get_logger("teleop_ik");

constexpr double kNoDofWarningPeriodMs = 1000.0;

ActuatorIntegrator::Params integratorParams(const TeleopIkConfig &cfg) {
  ActuatorIntegrator::Params p;
  p.use_safety_margin = cfg.use_safety_margin;
  p.safety_margin_fraction = cfg.safety_margin_fraction;
  p.max_ctrl_offset = cfg.max_ctrl_offset;
  return p;
}

const TeleopIkConfig &validated(const TeleopIkConfig &cfg) {
  validateConfig(cfg);
  return cfg;
}

nlohmann::json vec3Json(const Eigen::Vector3d &v) {
  return nlohmann::json::array({v.x(), v.y(), v.z()});
}

} // namespace

TeleopIk::TeleopIk(KinematicProvider &provider, const TeleopIkConfig &cfg)
  : provider_(provider),
    cfg_(validated(cfg)),
    res_(JointResolver::resolve(provider, cfg_)),
    policy_(cfg_),
    integrator_(integratorParams(cfg_)) {
  resetSolverState();
  syncControlsFromCoordinates();
  target_.reset(currentPose());
  RCLCPP_INFO(kLogger, "TeleopIk ready: end effector '%s', %zu DOFs, %s path", res_.end_effector_name.c_str(),
              res_.dofs.size(), res_.directProxy() ? "direct proxy" : "joint space");
}

Pose TeleopIk::currentPose() {
  provider_.forward();
  return provider_.bodyPose(res_.end_effector_body);
}

void TeleopIk::syncControlsFromCoordinates() {
  Eigen::VectorXd &ctrl = provider_.controls();
  const Eigen::VectorXd &q = provider_.coordinates();
  for (const auto &b : res_.bindings) {
    if (b.channel < ctrl.size() && b.q_address < q.size()) ctrl[b.channel] = q[b.q_address];
  }
}

void TeleopIk::resetSolverState() {
  state_.lambda = cfg_.lambda_initial;
  state_.stall = StallDetector(cfg_.stall_min_improvement, cfg_.stall_max_iterations);
  state_.fallback_count = 0;
  state_.last_source = StepSource::None;
  state_.last_iterations = 0;
}

void TeleopIk::snapTarget(const Pose &current) {
  target_.snapTo(current, cfg_.lock_orientation_on_translate);
  state_.lambda = cfg_.lambda_initial;
  state_.stall.reset();
  state_.fallback_count = 0;
  state_.last_source = StepSource::Snap;
}

void TeleopIk::setTargetPositionDelta(const Eigen::Vector3d &delta) {
  target_.translate(delta, currentPose(), cfg_.max_target_lead, cfg_.lock_orientation_on_translate);
  converged_ = false;
}

void TeleopIk::setTargetOrientationDelta(const Eigen::Vector3d &euler_xyz) {
  if (!target_.initialized()) target_.syncFrom(currentPose());
  target_.rotate(euler_xyz);
  converged_ = false;
}

void TeleopIk::resetToCurrentPose() {
  syncControlsFromCoordinates();
  resetSolverState();
  target_.reset(currentPose());
  converged_ = false;
}

void TeleopIk::onModelReloaded() {
  res_ = JointResolver::resolve(provider_, cfg_);
  disabled_ = false;
  last_no_dof_warning_ms_.reset();
  resetToCurrentPose();
}

void TeleopIk::update(double timestamp_ms, bool host_paused) {
  if (disabled_) return;
  try {
    if (res_.directProxy()) {
      if (!target_.initialized()) target_.syncFrom(currentPose());
      provider_.setProxyPose(res_.proxy, target_.pose());
      target_.markClean();
      converged_ = true;
      return;
    }
    if (res_.dofs.empty()) {
      if (!last_no_dof_warning_ms_ || timestamp_ms - *last_no_dof_warning_ms_ >= kNoDofWarningPeriodMs) {
        RCLCPP_WARN(kLogger, "No controlled DOFs resolved; IK update skipped");
        last_no_dof_warning_ms_ = timestamp_ms;
      }
      return;
    }
    if (!target_.dirty()) return;
    solveJointSpace(timestamp_ms, host_paused);
  } catch (const std::exception &e) {
    RCLCPP_ERROR(kLogger, "IK update failed, disabling solver until the model is reloaded: %s", e.what());
    disabled_ = true;
  } catch (...) {
    RCLCPP_ERROR(kLogger, "IK update failed with a non-standard exception, disabling solver until the model is reloaded");
    disabled_ = true;
  }
}

Eigen::VectorXd TeleopIk::dofValues() const {
  const Eigen::VectorXd &q = provider_.coordinates();
  Eigen::VectorXd out(static_cast<Eigen::Index>(res_.dofs.size()));
  for (size_t i = 0; i < res_.dofs.size(); ++i) out[static_cast<Eigen::Index>(i)] = q[res_.dofs[i].q_address];
  return out;
}

Vector6d TeleopIk::poseWeights() const {
  const double w_ori =
      (cfg_.hold_orientation_on_translate && target_.holding()) ? cfg_.hold_ori_weight : cfg_.ori_weight;
  Vector6d w;
  w << cfg_.pos_weight, cfg_.pos_weight, cfg_.pos_weight, w_ori, w_ori, w_ori;
  return w;
}

double TeleopIk::trueCost(const Eigen::VectorXd &step, const Eigen::VectorXd &q_dofs, const Vector6d &w) {
  const Eigen::VectorXd candidate = q_dofs + step;
  ScopedCoordinateGuard guard(provider_);
  Eigen::VectorXd &q = provider_.coordinates();
  for (size_t i = 0; i < res_.dofs.size(); ++i) q[res_.dofs[i].q_address] = candidate[static_cast<Eigen::Index>(i)];
  provider_.forward();
  const PoseError err = computePoseError(target_.pose(), provider_.bodyPose(res_.end_effector_body));
  const Vector6d e = err.stacked(cfg_.translation_gain, cfg_.rotation_gain);
  return e.dot(w.cwiseProduct(e)) + policy_.solver().barrier().penalty(res_.dofs, candidate);
}

void TeleopIk::solveJointSpace(double timestamp_ms, bool host_paused) {
  last_solve_time_ms_ = timestamp_ms;
  const int cap = host_paused ? cfg_.max_iterations : cfg_.running_iterations;
  const bool preview = host_paused && cfg_.preview_when_paused;
  state_.last_iterations = 0;

  for (int iter = 0; iter < cap; ++iter) {
    const Pose current = currentPose();
    if (cfg_.lock_orientation_on_translate) target_.applyLock();

    const PoseError err = computePoseError(target_.pose(), current);
    const double magnitude = err.magnitude();
    const bool stalled = state_.stall.observe(magnitude);
    state_.last_iterations = iter + 1;

    if (stalled) {
      RCLCPP_DEBUG(kLogger, "IK stalled at error %.6f", magnitude);
      if (cfg_.snap_target_on_stall) {
        snapTarget(current);
      } else {
        target_.markClean();
        state_.stall.reset();
      }
      break;
    }
    if (magnitude < cfg_.convergence_threshold) {
      target_.markClean();
      converged_ = true;
      state_.stall.reset();
      break;
    }
    converged_ = false;

    const Jacobian J = numericalJacobian(provider_, res_.end_effector_body, res_.dofs, cfg_.jacobian_epsilon);
    const Eigen::VectorXd q_dofs = dofValues();
    const Vector6d e = err.stacked(cfg_.translation_gain, cfg_.rotation_gain);
    const Vector6d e_jt = cfg_.jt_fallback_use_gain ? e : err.stacked(1.0, 1.0);
    const Vector6d w = poseWeights();
    const LevenbergMarquardtSolver::TrueCost cost = [&](const Eigen::VectorXd &step) {
      return trueCost(step, q_dofs, w);
    };

    const StepContext ctx{J, e, e_jt, w, res_.dofs, q_dofs, cost};
    StepDecision decision = policy_.decide(ctx, state_.lambda, state_.fallback_count);
    state_.last_source = decision.source;
    if (decision.snap) {
      snapTarget(current);
      break;
    }
    if (!integrator_.apply(provider_, res_.dofs, res_.bindings, decision.step, preview)) {
      break;
    }
  }
}

Diagnostics TeleopIk::diagnostics() const {
  Diagnostics d;
  d.mode = res_.directProxy() ? "direct" : "joint";
  d.end_effector = res_.end_effector_name;
  d.dof_count = static_cast<int>(res_.dofs.size());
  d.dirty = target_.dirty();
  d.converged = converged_;
  d.disabled = disabled_;
  d.target = target_.pose();
  d.last_error = state_.stall.lastError();
  d.lambda = state_.lambda;
  d.stall_count = state_.stall.count();
  d.fallback_count = state_.fallback_count;
  d.last_source = state_.last_source;
  d.last_iterations = state_.last_iterations;
  d.last_solve_time_ms = last_solve_time_ms_;
  return d;
}

nlohmann::json TeleopIk::diagnosticsJson() const {
  const Diagnostics d = diagnostics();
  nlohmann::json j;
  j["mode"] = d.mode;
  j["end_effector"] = d.end_effector;
  j["dofs"] = d.dof_count;
  j["dirty"] = d.dirty;
  j["converged"] = d.converged;
  j["disabled"] = d.disabled;
  j["target"]["position"] = vec3Json(d.target.position);
  const Eigen::Quaterniond &q = d.target.orientation;
  j["target"]["orientation"] = nlohmann::json::array({q.x(), q.y(), q.z(), q.w()});
  j["last_error"] = d.last_error ? nlohmann::json(*d.last_error) : nlohmann::json(nullptr);
  j["lambda"] = d.lambda;
  j["stall_count"] = d.stall_count;
  j["fallback_count"] = d.fallback_count;
  j["last_step"] = stepSourceName(d.last_source);
  j["iterations"] = d.last_iterations;
  j["last_solve_time_ms"] = d.last_solve_time_ms;
  return j;
}

} // namespace teleop_ik
