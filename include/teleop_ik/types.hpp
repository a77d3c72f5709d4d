#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <stdexcept>
#include <string>

namespace teleop_ik {

using Vector6d = Eigen::Matrix<double, 6, 1>;
// Pose Jacobian: 3 translational rows over 3 rotational rows, one column per controlled DOF.
using Jacobian = Eigen::Matrix<double, 6, Eigen::Dynamic>;

struct Pose {
  Eigen::Vector3d position{Eigen::Vector3d::Zero()};
  Eigen::Quaterniond orientation{Eigen::Quaterniond::Identity()};
};

enum class JointKind { Hinge, Slide, Ball, Free, Other };

const char *jointKindName(JointKind kind);

// One entry of the provider's joint name table.
struct JointInfo {
  std::string name;
  JointKind kind = JointKind::Other;
  int q_address = -1;
  int nq = 0;
  // lower == upper (both 0) means the joint is not limited
  double lower = 0.0;
  double upper = 0.0;
};

// One entry of the provider's actuator table. joint_id indexes joints(), -1 when the
// actuator does not drive a joint directly.
struct ActuatorInfo {
  std::string name;
  int joint_id = -1;
  double ctrl_lower = 0.0;
  double ctrl_upper = 0.0;
};

struct ControlledDof {
  int q_address = -1;
  int joint_id = -1;
  std::string joint_name;
  double lower = 0.0;
  double upper = 0.0;

  bool limited() const { return upper > lower; }
  double span() const { return upper - lower; }
};

struct ActuatorBinding {
  int q_address = -1;
  int channel = -1;
  std::string actuator_name;
  double ctrl_lower = 0.0;
  double ctrl_upper = 0.0;

  bool ctrlLimited() const { return ctrl_upper > ctrl_lower; }
};

// Model/configuration mismatch detected while building the solver tables.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace teleop_ik
