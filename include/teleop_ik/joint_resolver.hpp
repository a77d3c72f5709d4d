#pragma once

#include "teleop_ik/config.hpp"
#include "teleop_ik/kinematic_provider.hpp"
#include "teleop_ik/types.hpp"

#include <string>
#include <vector>

namespace teleop_ik {

// Controlled DOF and actuator tables for one kinematic model.
struct Resolution {
  int end_effector_body = -1;
  std::string end_effector_name;
  // proxy handle when the direct pose-injection path is used, else -1
  int proxy = -1;
  std::vector<ControlledDof> dofs;
  // bindings[i] drives dofs[i]
  std::vector<ActuatorBinding> bindings;

  bool directProxy() const { return proxy >= 0; }
};

class JointResolver {
public:
  // Throws ConfigurationError when the end effector cannot be found, when direct mode is
  // requested without a proxy body, or when a controlled DOF has no actuator of its own.
  static Resolution resolve(const KinematicProvider &provider, const TeleopIkConfig &cfg);

  // Model joint names for the configured identifiers: exact, then joint_prefix, then suffix
  // ("name" or ".../name"), then whatever exact subset exists. An empty list selects every
  // hinge/slide joint.
  static std::vector<std::string> resolveJointNames(const KinematicProvider &provider,
                                                    const TeleopIkConfig &cfg);

  // Actuator channel for a joint: exact name, actuator_prefix + joint, then suffix. In the suffix
  // pass, with joint_id >= 0, only an actuator driving that joint (or one with no known joint)
  // matches. -1 on miss.
  static int findActuatorChannel(const KinematicProvider &provider, const std::string &joint_name,
                                 const std::string &actuator_prefix, int joint_id = -1);
};

} // namespace teleop_ik
