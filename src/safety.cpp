#include "teleop_ik/safety.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cmath>

namespace teleop_ik {

namespace {
constexpr double kMinMargin = 1e-6;
}

bool anyDofNearLimit(const std::vector<ControlledDof> &dofs, const Eigen::VectorXd &q, double margin_fraction) {
  for (size_t k = 0; k < dofs.size(); ++k) {
    const ControlledDof &dof = dofs[k];
    if (!dof.limited()) continue;
    const double margin = dof.span() * margin_fraction;
    const double v = q[static_cast<Eigen::Index>(k)];
    if (v <= dof.lower + margin || v >= dof.upper - margin) return true;
  }
  return false;
}

Eigen::VectorXd jacobianTransposeStep(const Jacobian &J, const Vector6d &e, const std::vector<ControlledDof> &dofs,
                                      const Eigen::VectorXd &q, const TransposeStepParams &p) {
  Eigen::VectorXd step = J.transpose() * e;
  for (Eigen::Index k = 0; k < step.size(); ++k) {
    const ControlledDof &dof = dofs[static_cast<size_t>(k)];
    if (dof.limited()) {
      const double margin = std::max(kMinMargin, dof.span() * 2.0 * p.limit_margin_fraction);
      if (q[k] < dof.lower + margin && step[k] < 0.0) {
        step[k] *= std::max(0.0, (q[k] - dof.lower) / margin);
      } else if (q[k] > dof.upper - margin && step[k] > 0.0) {
        step[k] *= std::max(0.0, (dof.upper - q[k]) / margin);
      }
    }
    const double scaled = step[k] * p.damping_scale;
    step[k] = std::isfinite(scaled) ? std::min(p.step_limit, std::max(-p.step_limit, scaled)) : 0.0;
  }
  return step;
}

bool StallDetector::observe(double error) {
  if (last_error_) {
    const double improvement = *last_error_ - error;
    if (improvement < min_improvement_) {
      ++count_;
    } else {
      count_ = 0;
    }
  }
  last_error_ = error;
  return max_iterations_ > 0 && count_ >= max_iterations_;
}

void StallDetector::reset() {
  count_ = 0;
  last_error_.reset();
}

double ActuatorIntegrator::command(const ControlledDof &dof, const ActuatorBinding &binding, double previous,
                                   double step, double measured) const {
  double cmd = previous + step;

  if (binding.ctrlLimited()) {
    cmd = std::min(binding.ctrl_upper, std::max(binding.ctrl_lower, cmd));
  }

  if (dof.limited()) {
    if (params_.use_safety_margin && params_.safety_margin_fraction > 0.0) {
      const double margin = dof.span() * params_.safety_margin_fraction;
      const double safe_lo = dof.lower + margin;
      const double safe_hi = dof.upper - margin;
      if (measured <= safe_lo && step < 0.0) {
        cmd = std::max(cmd, measured);
      } else if (measured >= safe_hi && step > 0.0) {
        cmd = std::min(cmd, measured);
      } else if (cmd < safe_lo && step < 0.0) {
        cmd = safe_lo;
      } else if (cmd > safe_hi && step > 0.0) {
        cmd = safe_hi;
      }
    }
    cmd = std::min(dof.upper, std::max(dof.lower, cmd));
  }

  if (params_.max_ctrl_offset > 0.0) {
    cmd = std::min(measured + params_.max_ctrl_offset, std::max(measured - params_.max_ctrl_offset, cmd));
  }
  return cmd;
}

bool ActuatorIntegrator::apply(KinematicProvider &provider, const std::vector<ControlledDof> &dofs,
                               const std::vector<ActuatorBinding> &bindings, const Eigen::VectorXd &step,
                               bool preview) const {
  Eigen::VectorXd &ctrl = provider.controls();
  Eigen::VectorXd &q = provider.coordinates();
  if (bindings.size() != dofs.size() || step.size() != static_cast<Eigen::Index>(dofs.size())) {
    RCLCPP_ERROR(rclcpp::get_logger("teleop_ik"), "step/binding size mismatch: %zu dofs, %zu bindings, %ld steps",
                 dofs.size(), bindings.size(), static_cast<long>(step.size()));
    return false;
  }
  for (const auto &b : bindings) {
    if (b.channel < 0 || b.channel >= ctrl.size() || b.q_address < 0 || b.q_address >= q.size()) {
      RCLCPP_ERROR(rclcpp::get_logger("teleop_ik"), "actuator '%s' channel %d is outside the command buffer (%ld)",
                   b.actuator_name.c_str(), b.channel, static_cast<long>(ctrl.size()));
      return false;
    }
  }

  for (size_t i = 0; i < bindings.size(); ++i) {
    const ActuatorBinding &b = bindings[i];
    const double measured = q[b.q_address];
    ctrl[b.channel] = command(dofs[i], b, ctrl[b.channel], step[static_cast<Eigen::Index>(i)], measured);
    if (preview) q[b.q_address] = ctrl[b.channel];
  }
  return true;
}

} // namespace teleop_ik
