#pragma once

#include "teleop_ik/kinematic_provider.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

// Include Pinocchio forward declarations (typedefs) instead of forward-declaring class names
#include <pinocchio/multibody/fwd.hpp>

namespace teleop_ik {

// KinematicProvider over a Pinocchio model. Bodies are Pinocchio BODY frames; a body whose parent
// joint is a free flyer attached to the universe is a proxy whose pose can be injected directly.
// Pinocchio has no actuator notion, so the position-actuator table is supplied by the host.
class PinocchioProvider : public KinematicProvider {
public:
  struct ActuatorSpec {
    std::string name;
    std::string joint;
    // ctrl_lower == ctrl_upper means unlimited
    double ctrl_lower = 0.0;
    double ctrl_upper = 0.0;
  };

  explicit PinocchioProvider(const pinocchio::Model &model,
                             const std::vector<ActuatorSpec> &actuators = {});
  ~PinocchioProvider() override;

  // Parse URDF XML or a URDF file path. Throws std::runtime_error.
  static pinocchio::Model modelFromUrdf(const std::string &urdf_xml_or_path);

  // Build from URDF XML or a URDF file path. No actuators means positionActuators(model).
  static std::unique_ptr<PinocchioProvider> fromUrdf(const std::string &urdf_xml_or_path,
                                                     const std::vector<ActuatorSpec> &actuators = {});

  // One position actuator per hinge/slide joint, named prefix + joint name, with the joint range
  // as command range.
  static std::vector<ActuatorSpec> positionActuators(const pinocchio::Model &model,
                                                     const std::string &prefix = "");

  // Swap in a new model. Coordinates reset to the neutral configuration and the host must call
  // TeleopIk::onModelReloaded() afterwards.
  void reload(const pinocchio::Model &model, const std::vector<ActuatorSpec> &actuators);

  const std::vector<JointInfo> &joints() const override { return joints_; }
  const std::vector<ActuatorInfo> &actuators() const override { return actuators_; }
  std::vector<std::string> bodyNames() const override;
  int findBody(const std::string &name) const override;
  int proxyIndex(int body) const override;

  Eigen::VectorXd &coordinates() override { return q_; }
  const Eigen::VectorXd &coordinates() const override { return q_; }
  Eigen::VectorXd &controls() override { return ctrl_; }
  const Eigen::VectorXd &controls() const override { return ctrl_; }

  void forward() override;
  Pose bodyPose(int body) const override;
  void setProxyPose(int proxy, const Pose &pose) override;

  const pinocchio::Model &model() const;
  int findJoint(const std::string &name) const;

private:
  PinocchioProvider(const PinocchioProvider &) = delete;
  PinocchioProvider &operator=(const PinocchioProvider &) = delete;

  void rebuildTables(const std::vector<ActuatorSpec> &actuators);

  // Pinocchio model/data are implementation details; store via pointers to avoid exposing headers here.
  std::unique_ptr<pinocchio::Model> model_;
  std::unique_ptr<pinocchio::Data> data_;
  std::vector<JointInfo> joints_;
  std::vector<ActuatorInfo> actuators_;
  Eigen::VectorXd q_;
  Eigen::VectorXd ctrl_;
};

} // namespace teleop_ik
