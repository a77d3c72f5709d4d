#include "teleop_ik/pose_target.hpp"
#include "teleop_ik/pose_error.hpp"

namespace teleop_ik {

void PoseTarget::syncFrom(const Pose &current) {
  pose_.position = current.position;
  pose_.orientation = current.orientation.normalized();
  initialized_ = true;
}

void PoseTarget::translate(const Eigen::Vector3d &delta, const Pose &current, double max_lead,
                           bool lock_orientation) {
  if (!initialized_) syncFrom(current);

  const Eigen::Vector3d lead = pose_.position - current.position;
  const double dist = lead.norm();
  if (max_lead > 0.0 && dist > max_lead) {
    pose_.position = current.position + lead * (max_lead / dist);
  }

  if (lock_orientation) {
    if (!locked_) {
      locked_orientation_ = pose_.orientation.normalized();
      locked_ = true;
    }
    pose_.orientation = locked_orientation_;
  }

  pose_.position += delta;
  hold_ = true;
  dirty_ = true;
}

void PoseTarget::rotate(const Eigen::Vector3d &euler_xyz) {
  pose_.orientation = (pose_.orientation * orientationDelta(euler_xyz)).normalized();
  hold_ = false;
  locked_ = false;
  dirty_ = true;
}

void PoseTarget::applyLock() {
  if (locked_ && hold_) pose_.orientation = locked_orientation_;
}

void PoseTarget::snapTo(const Pose &current, bool refresh_lock) {
  syncFrom(current);
  if (refresh_lock && locked_) locked_orientation_ = pose_.orientation;
  dirty_ = false;
}

void PoseTarget::reset(const Pose &current) {
  locked_ = false;
  hold_ = true;
  syncFrom(current);
  dirty_ = false;
}

} // namespace teleop_ik
