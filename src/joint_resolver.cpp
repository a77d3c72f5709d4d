#include "teleop_ik/joint_resolver.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <sstream>

namespace teleop_ik {

namespace {

const rclcpp::Logger kLogger = rclcpp::get_logger("teleop_ik");

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

int findJointId(const std::vector<JointInfo> &joints, const std::string &name) {
  for (size_t i = 0; i < joints.size(); ++i) {
    if (joints[i].name == name) return static_cast<int>(i);
  }
  return -1;
}

int resolveEndEffector(const KinematicProvider &provider, const TeleopIkConfig &cfg, std::string &name_out) {
  std::vector<std::string> candidates;
  if (!cfg.end_effector.empty()) candidates.push_back(cfg.end_effector);
  candidates.insert(candidates.end(), cfg.end_effector_candidates.begin(), cfg.end_effector_candidates.end());
  for (const auto &name : candidates) {
    const int body = provider.findBody(name);
    if (body >= 0) {
      name_out = name;
      return body;
    }
  }
  std::ostringstream oss;
  oss << "end-effector body not found (tried";
  for (const auto &name : candidates) oss << " '" << name << "'";
  if (candidates.empty()) oss << " nothing, no end_effector configured";
  oss << ")";
  throw ConfigurationError(oss.str());
}

} // namespace

std::vector<std::string> JointResolver::resolveJointNames(const KinematicProvider &provider,
                                                          const TeleopIkConfig &cfg) {
  const auto &joints = provider.joints();
  const auto &configured = cfg.joint_names;

  if (configured.empty() && cfg.joint_prefix.empty()) {
    std::vector<std::string> all;
    for (const auto &j : joints) {
      if (j.kind == JointKind::Hinge || j.kind == JointKind::Slide) all.push_back(j.name);
    }
    return all;
  }

  std::vector<std::string> exact;
  for (const auto &name : configured) {
    if (findJointId(joints, name) >= 0) exact.push_back(name);
  }
  if (!configured.empty() && exact.size() == configured.size()) return exact;

  if (!cfg.joint_prefix.empty()) {
    std::vector<std::string> prefixed;
    for (const auto &j : joints) {
      if (starts_with(j.name, cfg.joint_prefix)) prefixed.push_back(j.name);
    }
    if (!prefixed.empty()) return prefixed;
  }

  std::vector<std::string> suffixed;
  for (const auto &name : configured) {
    for (const auto &j : joints) {
      if (j.name == name || ends_with(j.name, "/" + name)) {
        suffixed.push_back(j.name);
        break;
      }
    }
  }
  if (!configured.empty() && suffixed.size() == configured.size()) return suffixed;

  for (const auto &name : configured) {
    if (findJointId(joints, name) < 0) {
      RCLCPP_WARN(kLogger, "Configured joint '%s' not found in model", name.c_str());
    }
  }
  return exact;
}

int JointResolver::findActuatorChannel(const KinematicProvider &provider, const std::string &joint_name,
                                       const std::string &actuator_prefix, int joint_id) {
  const auto &actuators = provider.actuators();
  for (size_t a = 0; a < actuators.size(); ++a) {
    if (actuators[a].name == joint_name) return static_cast<int>(a);
  }
  if (!actuator_prefix.empty()) {
    const std::string prefixed = actuator_prefix + joint_name;
    for (size_t a = 0; a < actuators.size(); ++a) {
      if (actuators[a].name == prefixed) return static_cast<int>(a);
    }
  }
  // suffix: an actuator that drives this joint wins over one that merely shares the name ending
  int fallback = -1;
  for (size_t a = 0; a < actuators.size(); ++a) {
    if (!ends_with(actuators[a].name, joint_name)) continue;
    if (joint_id < 0 || actuators[a].joint_id == joint_id) return static_cast<int>(a);
    if (fallback < 0 && actuators[a].joint_id < 0) fallback = static_cast<int>(a);
  }
  return fallback;
}

Resolution JointResolver::resolve(const KinematicProvider &provider, const TeleopIkConfig &cfg) {
  Resolution res;
  res.end_effector_body = resolveEndEffector(provider, cfg, res.end_effector_name);

  const int proxy = provider.proxyIndex(res.end_effector_body);
  if (cfg.mode == TeleopIkConfig::Mode::DirectProxy && proxy < 0) {
    throw ConfigurationError("direct mode requested but end effector '" + res.end_effector_name +
                             "' is not a free-floating body");
  }
  if (cfg.mode != TeleopIkConfig::Mode::JointSpace && proxy >= 0) {
    res.proxy = proxy;
    RCLCPP_INFO(kLogger, "End effector '%s' is a free-floating proxy; using direct pose injection",
                res.end_effector_name.c_str());
    return res;
  }

  const auto &joints = provider.joints();
  for (const auto &name : resolveJointNames(provider, cfg)) {
    const int jid = findJointId(joints, name);
    if (jid < 0) continue;
    const JointInfo &info = joints[jid];
    if (info.kind != JointKind::Hinge && info.kind != JointKind::Slide) {
      RCLCPP_WARN(kLogger, "Skipping joint '%s': %s joints are not supported", name.c_str(),
                  jointKindName(info.kind));
      continue;
    }
    const bool duplicate = std::any_of(res.dofs.begin(), res.dofs.end(),
                                       [&](const ControlledDof &d) { return d.q_address == info.q_address; });
    if (duplicate) continue;
    ControlledDof dof;
    dof.q_address = info.q_address;
    dof.joint_id = jid;
    dof.joint_name = info.name;
    const auto range = provider.jointRange(jid);
    dof.lower = range.first;
    dof.upper = range.second;
    res.dofs.push_back(dof);
  }

  std::vector<std::string> missing;
  for (const auto &dof : res.dofs) {
    const int channel = findActuatorChannel(provider, dof.joint_name, cfg.actuator_prefix, dof.joint_id);
    if (channel < 0) {
      missing.push_back(dof.joint_name);
      continue;
    }
    const auto shared = std::find_if(res.bindings.begin(), res.bindings.end(),
                                     [&](const ActuatorBinding &b) { return b.channel == channel; });
    if (shared != res.bindings.end()) {
      const auto owner = std::find_if(res.dofs.begin(), res.dofs.end(),
                                      [&](const ControlledDof &d) { return d.q_address == shared->q_address; });
      throw ConfigurationError("actuator '" + provider.actuators()[channel].name + "' matched both joint '" +
                               owner->joint_name + "' and joint '" + dof.joint_name + "'");
    }
    const ActuatorInfo &act = provider.actuators()[channel];
    if (act.joint_id >= 0 && act.joint_id != dof.joint_id) {
      RCLCPP_WARN(kLogger, "Actuator '%s' matched joint '%s' by name but drives joint '%s'",
                  act.name.c_str(), dof.joint_name.c_str(), joints[act.joint_id].name.c_str());
    }
    ActuatorBinding binding;
    binding.q_address = dof.q_address;
    binding.channel = channel;
    binding.actuator_name = act.name;
    const auto range = provider.actuatorRange(channel);
    binding.ctrl_lower = range.first;
    binding.ctrl_upper = range.second;
    res.bindings.push_back(binding);
  }
  if (!missing.empty()) {
    std::ostringstream oss;
    oss << "no actuator for controlled joint(s):";
    for (const auto &m : missing) oss << " " << m;
    throw ConfigurationError(oss.str());
  }

  RCLCPP_INFO(kLogger, "Resolved %zu controlled DOFs for end effector '%s'", res.dofs.size(),
              res.end_effector_name.c_str());
  return res;
}

} // namespace teleop_ik
