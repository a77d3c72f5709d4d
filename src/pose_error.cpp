#include "teleop_ik/pose_error.hpp"

#include <cmath>

namespace teleop_ik {

namespace {
constexpr double kMinRotationAngle = 1e-9;
}

Eigen::Vector3d shortestArcRotationVector(const Eigen::Quaterniond &target, const Eigen::Quaterniond &current) {
  Eigen::Quaterniond rel = target.normalized() * current.normalized().conjugate();
  if (rel.w() < 0.0) rel.coeffs() *= -1.0;
  const Eigen::Vector3d v = rel.vec();
  const double s = v.norm();
  const double angle = 2.0 * std::atan2(s, rel.w());
  if (!std::isfinite(angle) || angle < kMinRotationAngle || s <= 0.0) {
    return Eigen::Vector3d::Zero();
  }
  return v / s * angle;
}

PoseError computePoseError(const Pose &target, const Pose &current) {
  PoseError err;
  err.translation = target.position - current.position;
  err.rotation = shortestArcRotationVector(target.orientation, current.orientation);
  return err;
}

Eigen::Quaterniond orientationDelta(const Eigen::Vector3d &euler_xyz) {
  Eigen::Quaterniond q = Eigen::AngleAxisd(euler_xyz.x(), Eigen::Vector3d::UnitX()) *
                         Eigen::AngleAxisd(euler_xyz.y(), Eigen::Vector3d::UnitY()) *
                         Eigen::AngleAxisd(euler_xyz.z(), Eigen::Vector3d::UnitZ());
  return q.normalized();
}

Jacobian numericalJacobian(KinematicProvider &provider, int body,
                           const std::vector<ControlledDof> &dofs, double epsilon) {
  const int n = static_cast<int>(dofs.size());
  Jacobian J = Jacobian::Zero(6, n);
  ScopedCoordinateGuard guard(provider);

  provider.forward();
  const Pose base = provider.bodyPose(body);

  Eigen::VectorXd &q = provider.coordinates();
  for (int c = 0; c < n; ++c) {
    const int addr = dofs[c].q_address;
    q[addr] = guard.saved()[addr] + epsilon;
    provider.forward();
    const Pose moved = provider.bodyPose(body);
    J.block<3, 1>(0, c) = (moved.position - base.position) / epsilon;
    J.block<3, 1>(3, c) = shortestArcRotationVector(moved.orientation, base.orientation) / epsilon;
    guard.rewind();
  }
  return J;
}

} // namespace teleop_ik
