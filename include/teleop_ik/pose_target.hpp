#pragma once

#include "teleop_ik/types.hpp"

#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace teleop_ik {

// Desired end-effector pose with dirty flag and the orientation lock used while translating.
class PoseTarget {
public:
  // Target := current pose. Does not touch the lock or dirty flag.
  void syncFrom(const Pose &current);

  // Clamp the lead over current to max_lead, re-apply the orientation lock (snapshotting it
  // first if needed), add delta. Sets hold and dirty.
  void translate(const Eigen::Vector3d &delta, const Pose &current, double max_lead, bool lock_orientation);

  // target := target * delta(euler XYZ). Clears hold and lock, sets dirty.
  void rotate(const Eigen::Vector3d &euler_xyz);

  // Overwrite the target orientation with the locked one when the lock is active.
  void applyLock();

  // Target := current, lock reference refreshed when refresh_lock, dirty cleared.
  void snapTo(const Pose &current, bool refresh_lock);

  // Clear the lock, set hold, target := current, dirty cleared.
  void reset(const Pose &current);

  void markClean() { dirty_ = false; }

  const Pose &pose() const { return pose_; }
  bool dirty() const { return dirty_; }
  bool initialized() const { return initialized_; }
  bool holding() const { return hold_; }
  bool locked() const { return locked_; }
  const Eigen::Quaterniond &lockedOrientation() const { return locked_orientation_; }

private:
  Pose pose_;
  bool dirty_ = false;
  bool initialized_ = false;
  bool hold_ = true;
  bool locked_ = false;
  Eigen::Quaterniond locked_orientation_{Eigen::Quaterniond::Identity()};
};

} // namespace teleop_ik
