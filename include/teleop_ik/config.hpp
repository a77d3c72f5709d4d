#pragma once

#include <string>
#include <vector>

namespace teleop_ik {

struct TeleopIkConfig {
  enum class Mode { Auto, DirectProxy, JointSpace };

  // Resolution
  std::string end_effector;
  std::vector<std::string> end_effector_candidates;
  std::vector<std::string> joint_names;
  std::string joint_prefix;
  std::string actuator_prefix;
  Mode mode = Mode::Auto;

  // Gains / iteration caps
  double translation_gain = 0.3;
  double rotation_gain = 0.3;
  int max_iterations = 5;     // host paused
  int running_iterations = 1; // host running
  double step_limit = 0.05;

  // Pose cost weights
  double pos_weight = 50.0;
  double ori_weight = 100.0;
  double hold_ori_weight = 2000.0;
  bool hold_orientation_on_translate = true;
  bool lock_orientation_on_translate = true;

  // Joint-limit soft barrier
  double limit_weight = 10.0;
  double limit_margin_fraction = 0.05;

  // Levenberg-Marquardt trust region
  double lambda_initial = 0.1;
  double lambda_factor = 2.0;
  double lambda_min = 1e-5;
  double lambda_max = 10.0;
  double step_quality_min = 1e-3;
  int lm_max_trials = 10;

  // Jacobian-transpose fallback
  bool use_jt_fallback = true;
  double jt_fallback_damping_scale = 1.5;
  bool jt_fallback_use_gain = true;
  int jt_fallback_max_consecutive = 10;

  bool use_smart_solver_selection = true;
  double smart_selection_margin_fraction = 0.02;
  bool use_safety_margin = true;
  double safety_margin_fraction = 0.06;

  // Stall detection; stall_max_iterations == 0 disables it
  double stall_min_improvement = 1e-4;
  int stall_max_iterations = 3;
  bool snap_target_on_stall = true;

  // Anti-windup; max_ctrl_offset <= 0 disables the clamp
  double max_ctrl_offset = 0.5;
  double max_target_lead = 0.03;

  double convergence_threshold = 1e-3;
  double jacobian_epsilon = 1e-4;
  // Mirror commands into coordinates while the host is paused.
  bool preview_when_paused = true;
};

// Parses "auto", "direct", "joint" (case-insensitive). Throws ConfigurationError otherwise.
TeleopIkConfig::Mode parseMode(const std::string &name);
const char *modeName(TeleopIkConfig::Mode mode);

// Load a simple YAML-style file (key: value, lists as [a, b]). Keys may sit under a
// "teleop_ik:" section. Returns false when the file cannot be read; a malformed value throws
// ConfigurationError.
bool loadConfigFromFile(const std::string &path, TeleopIkConfig &cfg);

// Apply one key/value pair. Returns false for an unknown key.
bool applyConfigValue(const std::string &key, const std::string &value, TeleopIkConfig &cfg);

// Range checks on numeric parameters. Throws ConfigurationError.
void validateConfig(const TeleopIkConfig &cfg);

} // namespace teleop_ik
