#include <pinocchio/multibody/model.hpp>
#include <pinocchio/multibody/data.hpp>
#include <pinocchio/algorithm/joint-configuration.hpp>
#include <pinocchio/algorithm/frames.hpp>
#include <pinocchio/algorithm/kinematics.hpp>
#include <pinocchio/parsers/urdf.hpp>
#include "teleop_ik/pinocchio_provider.hpp"

#include <rclcpp/rclcpp.hpp>

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace teleop_ik {

namespace {

const rclcpp::Logger kLogger = rclcpp::get_logger("teleop_ik");

// Pinocchio reports unlimited joints with +-max(double) bounds.
constexpr double kUnlimitedBound = 1e10;

JointKind classifyJoint(const std::string &shortname, int nq) {
  if (shortname == "JointModelFreeFlyer") return JointKind::Free;
  if (shortname == "JointModelSpherical" || shortname == "JointModelSphericalZYX") return JointKind::Ball;
  if (nq == 1 && shortname.rfind("JointModelR", 0) == 0) return JointKind::Hinge;
  if (nq == 1 && shortname.rfind("JointModelP", 0) == 0) return JointKind::Slide;
  return JointKind::Other;
}

pinocchio::JointIndex frameParentJoint(const pinocchio::Frame &frame) {
#if PINOCCHIO_VERSION_AT_LEAST(3, 0, 0)
  return frame.parentJoint;
#else
  return frame.parent;
#endif
}

std::string load_urdf_xml(const std::string &urdf_xml_or_path) {
  if (urdf_xml_or_path.find("<robot") != std::string::npos ||
      urdf_xml_or_path.find("<?xml") != std::string::npos) {
    return urdf_xml_or_path;
  }

  std::ifstream ifs(urdf_xml_or_path);
  if (!ifs) {
    throw std::runtime_error("Failed to open URDF file: " + urdf_xml_or_path);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  std::string xml = oss.str();
  if (xml.empty()) {
    throw std::runtime_error("URDF file is empty: " + urdf_xml_or_path);
  }
  return xml;
}

} // namespace

PinocchioProvider::PinocchioProvider(const pinocchio::Model &model,
                                     const std::vector<ActuatorSpec> &actuators) {
  reload(model, actuators);
}

PinocchioProvider::~PinocchioProvider() {}

pinocchio::Model PinocchioProvider::modelFromUrdf(const std::string &urdf_xml_or_path) {
  pinocchio::Model model;
  try {
    const std::string xml = load_urdf_xml(urdf_xml_or_path);
    pinocchio::urdf::buildModelFromXML(xml, model);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Failed to build Pinocchio model: ") + e.what());
  }
  return model;
}

std::unique_ptr<PinocchioProvider> PinocchioProvider::fromUrdf(const std::string &urdf_xml_or_path,
                                                               const std::vector<ActuatorSpec> &actuators) {
  const pinocchio::Model model = modelFromUrdf(urdf_xml_or_path);
  if (actuators.empty()) {
    return std::make_unique<PinocchioProvider>(model, positionActuators(model));
  }
  return std::make_unique<PinocchioProvider>(model, actuators);
}

std::vector<PinocchioProvider::ActuatorSpec> PinocchioProvider::positionActuators(const pinocchio::Model &model,
                                                                                  const std::string &prefix) {
  std::vector<ActuatorSpec> out;
  for (pinocchio::JointIndex j = 1; j < static_cast<pinocchio::JointIndex>(model.njoints); ++j) {
    const int nq = model.joints[j].nq();
    const JointKind kind = classifyJoint(model.joints[j].shortname(), nq);
    if (kind != JointKind::Hinge && kind != JointKind::Slide) continue;
    ActuatorSpec spec;
    spec.name = prefix + model.names[j];
    spec.joint = model.names[j];
    const int iq = model.joints[j].idx_q();
    const double lo = model.lowerPositionLimit[iq];
    const double hi = model.upperPositionLimit[iq];
    if (std::abs(lo) < kUnlimitedBound && std::abs(hi) < kUnlimitedBound && hi > lo) {
      spec.ctrl_lower = lo;
      spec.ctrl_upper = hi;
    }
    out.push_back(spec);
  }
  return out;
}

void PinocchioProvider::reload(const pinocchio::Model &model, const std::vector<ActuatorSpec> &actuators) {
  model_ = std::make_unique<pinocchio::Model>(model);
  data_ = std::make_unique<pinocchio::Data>(*model_);
  q_ = pinocchio::neutral(*model_);
  rebuildTables(actuators);
  forward();
  RCLCPP_INFO(kLogger, "Pinocchio model loaded: nq=%d nv=%d joints=%zu actuators=%zu",
              static_cast<int>(model_->nq), static_cast<int>(model_->nv), joints_.size(), actuators_.size());
}

void PinocchioProvider::rebuildTables(const std::vector<ActuatorSpec> &actuators) {
  joints_.clear();
  for (pinocchio::JointIndex j = 1; j < static_cast<pinocchio::JointIndex>(model_->njoints); ++j) {
    JointInfo info;
    info.name = model_->names[j];
    info.nq = model_->joints[j].nq();
    info.q_address = model_->joints[j].idx_q();
    info.kind = classifyJoint(model_->joints[j].shortname(), info.nq);
    if (info.nq == 1) {
      const double lo = model_->lowerPositionLimit[info.q_address];
      const double hi = model_->upperPositionLimit[info.q_address];
      if (std::abs(lo) < kUnlimitedBound && std::abs(hi) < kUnlimitedBound && hi > lo) {
        info.lower = lo;
        info.upper = hi;
      }
    }
    joints_.push_back(info);
  }

  actuators_.clear();
  for (const auto &spec : actuators) {
    ActuatorInfo info;
    info.name = spec.name;
    info.joint_id = findJoint(spec.joint);
    info.ctrl_lower = spec.ctrl_lower;
    info.ctrl_upper = spec.ctrl_upper;
    if (info.joint_id < 0) {
      RCLCPP_WARN(kLogger, "Actuator '%s' targets unknown joint '%s'", spec.name.c_str(), spec.joint.c_str());
    }
    actuators_.push_back(info);
  }

  ctrl_ = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(actuators_.size()));
  for (size_t a = 0; a < actuators_.size(); ++a) {
    const int jid = actuators_[a].joint_id;
    if (jid >= 0 && joints_[jid].nq == 1) ctrl_[a] = q_[joints_[jid].q_address];
  }
}

int PinocchioProvider::findJoint(const std::string &name) const {
  for (size_t i = 0; i < joints_.size(); ++i) {
    if (joints_[i].name == name) return static_cast<int>(i);
  }
  return -1;
}

std::vector<std::string> PinocchioProvider::bodyNames() const {
  std::vector<std::string> names;
  for (const auto &frame : model_->frames) {
    if (frame.type == pinocchio::BODY) names.push_back(frame.name);
  }
  return names;
}

int PinocchioProvider::findBody(const std::string &name) const {
  for (size_t i = 0; i < model_->frames.size(); ++i) {
    const auto &frame = model_->frames[i];
    if (frame.type == pinocchio::BODY && frame.name == name) return static_cast<int>(i);
  }
  return -1;
}

int PinocchioProvider::proxyIndex(int body) const {
  if (body < 0 || body >= static_cast<int>(model_->frames.size())) return -1;
  const pinocchio::JointIndex j = frameParentJoint(model_->frames[body]);
  if (j == 0 || j >= static_cast<pinocchio::JointIndex>(model_->njoints)) return -1;
  if (model_->parents[j] != 0) return -1;
  if (model_->joints[j].shortname() != "JointModelFreeFlyer") return -1;
  return body;
}

void PinocchioProvider::forward() {
  if (q_.size() != model_->nq) {
    throw std::runtime_error("coordinate buffer size " + std::to_string(q_.size()) +
                             " does not match model nq " + std::to_string(model_->nq));
  }
  pinocchio::forwardKinematics(*model_, *data_, q_);
  pinocchio::updateFramePlacements(*model_, *data_);
}

Pose PinocchioProvider::bodyPose(int body) const {
  if (body < 0 || body >= static_cast<int>(data_->oMf.size())) {
    throw std::out_of_range("body " + std::to_string(body) + " out of range");
  }
  const pinocchio::SE3 &placement = data_->oMf[body];
  Pose pose;
  pose.position = placement.translation();
  pose.orientation = Eigen::Quaterniond(placement.rotation()).normalized();
  return pose;
}

void PinocchioProvider::setProxyPose(int proxy, const Pose &pose) {
  if (proxyIndex(proxy) < 0) {
    throw std::invalid_argument("body " + std::to_string(proxy) + " is not a free-floating proxy");
  }
  const pinocchio::Frame &frame = model_->frames[proxy];
  const pinocchio::JointIndex j = frameParentJoint(frame);
  const pinocchio::SE3 world_body(pose.orientation.normalized().toRotationMatrix(), pose.position);
  // oMf = jointPlacement * M(q) * frame.placement  =>  M(q) = jointPlacement^-1 * oMf * frame.placement^-1
  const pinocchio::SE3 joint_motion =
      model_->jointPlacements[j].inverse() * world_body * frame.placement.inverse();
  const Eigen::Quaterniond quat(joint_motion.rotation());
  const int iq = model_->joints[j].idx_q();
  q_.segment<3>(iq) = joint_motion.translation();
  q_[iq + 3] = quat.x();
  q_[iq + 4] = quat.y();
  q_[iq + 5] = quat.z();
  q_[iq + 6] = quat.w();
  forward();
}

const pinocchio::Model &PinocchioProvider::model() const {
  return *model_;
}

} // namespace teleop_ik
