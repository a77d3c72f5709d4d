#include "teleop_ik/step_policy.hpp"

#include <rclcpp/rclcpp.hpp>

namespace teleop_ik {

namespace {

LevenbergMarquardtSolver::Params solverParams(const TeleopIkConfig &cfg) {
  LevenbergMarquardtSolver::Params p;
  p.lambda_factor = cfg.lambda_factor;
  p.lambda_min = cfg.lambda_min;
  p.lambda_max = cfg.lambda_max;
  p.step_quality_min = cfg.step_quality_min;
  p.max_trials = cfg.lm_max_trials;
  p.step_limit = cfg.step_limit;
  p.limit_weight = cfg.limit_weight;
  p.limit_margin_fraction = cfg.limit_margin_fraction;
  return p;
}

} // namespace

const char *stepSourceName(StepSource source) {
  switch (source) {
  case StepSource::LevenbergMarquardt:
    return "lm";
  case StepSource::NearLimitTranspose:
    return "near_limit_jt";
  case StepSource::FallbackTranspose:
    return "fallback_jt";
  case StepSource::Snap:
    return "snap";
  default:
    return "none";
  }
}

StepPolicy::StepPolicy(const TeleopIkConfig &cfg)
  : solver_(solverParams(cfg)),
    near_limit_margin_(cfg.smart_selection_margin_fraction),
    fallback_cap_(cfg.jt_fallback_max_consecutive) {
  transpose_.damping_scale = cfg.jt_fallback_damping_scale;
  transpose_.limit_margin_fraction = cfg.limit_margin_fraction;
  transpose_.step_limit = cfg.step_limit;

  if (cfg.use_smart_solver_selection && cfg.use_jt_fallback) strategies_.push_back(Strategy::NearLimitTranspose);
  strategies_.push_back(Strategy::LevenbergMarquardt);
  if (cfg.use_jt_fallback) strategies_.push_back(Strategy::JacobianTranspose);
  strategies_.push_back(Strategy::SnapTarget);
}

StepDecision StepPolicy::decide(const StepContext &ctx, double &lambda, int &fallback_count) const {
  StepDecision d;
  for (Strategy s : strategies_) {
    switch (s) {
    case Strategy::NearLimitTranspose:
      if (!anyDofNearLimit(ctx.dofs, ctx.q, near_limit_margin_)) break;
      d.source = StepSource::NearLimitTranspose;
      d.step = jacobianTransposeStep(ctx.J, ctx.e_jt, ctx.dofs, ctx.q, transpose_);
      break;
    case Strategy::LevenbergMarquardt: {
      auto step = solver_.solve(ctx.J, ctx.e, ctx.weights, ctx.dofs, ctx.q, ctx.true_cost, lambda);
      if (!step) break;
      d.source = StepSource::LevenbergMarquardt;
      d.step = *step;
      fallback_count = 0;
      return d;
    }
    case Strategy::JacobianTranspose:
      d.source = StepSource::FallbackTranspose;
      d.step = jacobianTransposeStep(ctx.J, ctx.e_jt, ctx.dofs, ctx.q, transpose_);
      RCLCPP_DEBUG(rclcpp::get_logger("teleop_ik"), "LM found no step, using Jacobian-transpose fallback (%d)",
                   fallback_count + 1);
      break;
    case Strategy::SnapTarget:
      d.source = StepSource::Snap;
      d.snap = true;
      return d;
    }

    if (d.source == StepSource::NearLimitTranspose || d.source == StepSource::FallbackTranspose) {
      ++fallback_count;
      if (fallback_count >= fallback_cap_) {
        RCLCPP_DEBUG(rclcpp::get_logger("teleop_ik"), "%d consecutive transpose steps, snapping target",
                     fallback_count);
        fallback_count = 0;
        d.source = StepSource::Snap;
        d.snap = true;
        d.step.resize(0);
      }
      return d;
    }
  }
  return d;
}

} // namespace teleop_ik
