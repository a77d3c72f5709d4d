#include "teleop_ik/kinematic_provider.hpp"

#include <rclcpp/rclcpp.hpp>

#include <stdexcept>
#include <string>

namespace teleop_ik {

const char *jointKindName(JointKind kind) {
  switch (kind) {
  case JointKind::Hinge:
    return "hinge";
  case JointKind::Slide:
    return "slide";
  case JointKind::Ball:
    return "ball";
  case JointKind::Free:
    return "free";
  default:
    return "other";
  }
}

std::pair<double, double> KinematicProvider::jointRange(int joint_id) const {
  const auto &table = joints();
  if (joint_id < 0 || joint_id >= static_cast<int>(table.size())) {
    throw std::out_of_range("joint id " + std::to_string(joint_id) + " out of range");
  }
  return {table[joint_id].lower, table[joint_id].upper};
}

std::pair<double, double> KinematicProvider::actuatorRange(int channel) const {
  const auto &table = actuators();
  if (channel < 0 || channel >= static_cast<int>(table.size())) {
    throw std::out_of_range("actuator channel " + std::to_string(channel) + " out of range");
  }
  return {table[channel].ctrl_lower, table[channel].ctrl_upper};
}

ScopedCoordinateGuard::ScopedCoordinateGuard(KinematicProvider &provider)
  : provider_(provider), saved_(provider.coordinates()) {}

ScopedCoordinateGuard::~ScopedCoordinateGuard() {
  provider_.coordinates() = saved_;
  try {
    provider_.forward();
  } catch (const std::exception &e) {
    RCLCPP_ERROR(rclcpp::get_logger("teleop_ik"),
                 "forward kinematics failed while restoring coordinates: %s", e.what());
  } catch (...) {
    RCLCPP_ERROR(rclcpp::get_logger("teleop_ik"),
                 "forward kinematics failed while restoring coordinates: unknown exception");
  }
}

void ScopedCoordinateGuard::rewind() {
  provider_.coordinates() = saved_;
}

} // namespace teleop_ik
