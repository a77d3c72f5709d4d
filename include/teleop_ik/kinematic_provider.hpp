#pragma once

#include "teleop_ik/types.hpp"

#include <Eigen/Dense>
#include <string>
#include <utility>
#include <vector>

namespace teleop_ik {

// Host-side kinematic model consumed by the IK core.
//
// The provider owns the generalized-coordinate buffer and the actuator command buffer. Both are
// shared with the host's own consumers (rendering, physics stepping) within a frame, so anything
// in the core that perturbs coordinates must restore them before returning
// (see ScopedCoordinateGuard).
class KinematicProvider {
public:
  virtual ~KinematicProvider() = default;

  // Name tables. Rebuilt by the host when the model is reloaded.
  virtual const std::vector<JointInfo> &joints() const = 0;
  virtual const std::vector<ActuatorInfo> &actuators() const = 0;
  virtual std::vector<std::string> bodyNames() const = 0;
  // Returns -1 when no body carries that name.
  virtual int findBody(const std::string &name) const = 0;
  // Returns a proxy handle when the body is free-floating (pose can be written directly), else -1.
  virtual int proxyIndex(int body) const = 0;

  virtual Eigen::VectorXd &coordinates() = 0;
  virtual const Eigen::VectorXd &coordinates() const = 0;
  virtual Eigen::VectorXd &controls() = 0;
  virtual const Eigen::VectorXd &controls() const = 0;

  // Evaluate forward kinematics for the current coordinates.
  virtual void forward() = 0;
  // World pose of a body as of the last forward().
  virtual Pose bodyPose(int body) const = 0;
  virtual void setProxyPose(int proxy, const Pose &pose) = 0;

  std::pair<double, double> jointRange(int joint_id) const;
  std::pair<double, double> actuatorRange(int channel) const;
};

// Saves the coordinate buffer on construction; restores it and re-evaluates forward kinematics
// on destruction, whichever way the scope is left.
class ScopedCoordinateGuard {
public:
  explicit ScopedCoordinateGuard(KinematicProvider &provider);
  ~ScopedCoordinateGuard();

  ScopedCoordinateGuard(const ScopedCoordinateGuard &) = delete;
  ScopedCoordinateGuard &operator=(const ScopedCoordinateGuard &) = delete;

  const Eigen::VectorXd &saved() const { return saved_; }
  // Put the saved values back without re-evaluating kinematics.
  void rewind();

private:
  KinematicProvider &provider_;
  Eigen::VectorXd saved_;
};

} // namespace teleop_ik
