#pragma once

#include "teleop_ik/kinematic_provider.hpp"
#include "teleop_ik/types.hpp"

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <vector>

namespace teleop_ik {

struct PoseError {
  Eigen::Vector3d translation{Eigen::Vector3d::Zero()};
  Eigen::Vector3d rotation{Eigen::Vector3d::Zero()};

  // ||translation|| + ||rotation||
  double magnitude() const { return translation.norm() + rotation.norm(); }

  // Gain-scaled 6-vector, translation first.
  Vector6d stacked(double translation_gain, double rotation_gain) const {
    Vector6d e;
    e.head<3>() = translation * translation_gain;
    e.tail<3>() = rotation * rotation_gain;
    return e;
  }
};

// Axis-angle vector of target * current^-1, taken on the hemisphere with a non-negative scalar
// part so q and -q give the same result.
Eigen::Vector3d shortestArcRotationVector(const Eigen::Quaterniond &target, const Eigen::Quaterniond &current);

PoseError computePoseError(const Pose &target, const Pose &current);

// Intrinsic XYZ Euler increment as a unit quaternion.
Eigen::Quaterniond orientationDelta(const Eigen::Vector3d &euler_xyz);

// Forward-difference Jacobian of the body pose over the given DOFs (6 x dofs.size()).
// Coordinates are restored and forward kinematics re-evaluated before returning, also when
// forward() throws.
Jacobian numericalJacobian(KinematicProvider &provider, int body,
                           const std::vector<ControlledDof> &dofs, double epsilon);

} // namespace teleop_ik
