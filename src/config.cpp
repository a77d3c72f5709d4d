#include "teleop_ik/config.hpp"
#include "teleop_ik/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace teleop_ik {

namespace {

std::string trim_copy(const std::string &s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string strip_quotes(const std::string &s) {
  if (s.size() >= 2) {
    if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
      return s.substr(1, s.size() - 2);
    }
  }
  return s;
}

// Cuts the line at the first '#' that is not inside single or double quotes.
std::string strip_comment(const std::string &line) {
  char quote = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string lower_copy(const std::string &s) {
  std::string v;
  v.reserve(s.size());
  for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return v;
}

bool parse_bool(const std::string &val) {
  const std::string v = trim_copy(lower_copy(val));
  return (v == "true" || v == "1" || v == "yes" || v == "on");
}

std::vector<std::string> parse_string_list(const std::string &val) {
  std::vector<std::string> out;
  const auto a = val.find('[');
  const auto b = val.find(']');
  if (a == std::string::npos || b == std::string::npos || b <= a) {
    // a bare scalar is a one-element list
    const std::string single = strip_quotes(trim_copy(val));
    if (!single.empty()) out.push_back(single);
    return out;
  }
  std::stringstream ss(val.substr(a + 1, b - a - 1));
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = strip_quotes(trim_copy(item));
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

double parse_double(const std::string &key, const std::string &val) {
  try {
    size_t used = 0;
    const double x = std::stod(val, &used);
    if (trim_copy(val.substr(used)).empty()) return x;
  } catch (const std::exception &) {
  }
  throw ConfigurationError("invalid number for '" + key + "': " + val);
}

int parse_int(const std::string &key, const std::string &val) {
  try {
    size_t used = 0;
    const int x = std::stoi(val, &used);
    if (trim_copy(val.substr(used)).empty()) return x;
  } catch (const std::exception &) {
  }
  throw ConfigurationError("invalid integer for '" + key + "': " + val);
}

} // namespace

TeleopIkConfig::Mode parseMode(const std::string &name) {
  const std::string v = lower_copy(trim_copy(strip_quotes(name)));
  if (v == "auto") return TeleopIkConfig::Mode::Auto;
  if (v == "direct" || v == "direct_proxy" || v == "proxy") return TeleopIkConfig::Mode::DirectProxy;
  if (v == "joint" || v == "joint_space") return TeleopIkConfig::Mode::JointSpace;
  throw ConfigurationError("unknown IK mode: " + name);
}

const char *modeName(TeleopIkConfig::Mode mode) {
  switch (mode) {
  case TeleopIkConfig::Mode::DirectProxy:
    return "direct";
  case TeleopIkConfig::Mode::JointSpace:
    return "joint";
  default:
    return "auto";
  }
}

bool applyConfigValue(const std::string &key, const std::string &val, TeleopIkConfig &cfg) {
  if (key == "end_effector" || key == "end_effector_body" || key == "ee_body") {
    cfg.end_effector = strip_quotes(val);
  } else if (key == "end_effector_candidates" || key == "ee_candidates") {
    cfg.end_effector_candidates = parse_string_list(val);
  } else if (key == "joint_names" || key == "joints") {
    cfg.joint_names = parse_string_list(val);
  } else if (key == "joint_prefix") {
    cfg.joint_prefix = strip_quotes(val);
  } else if (key == "actuator_prefix") {
    cfg.actuator_prefix = strip_quotes(val);
  } else if (key == "mode") {
    cfg.mode = parseMode(val);
  } else if (key == "translation_gain") {
    cfg.translation_gain = parse_double(key, val);
  } else if (key == "rotation_gain") {
    cfg.rotation_gain = parse_double(key, val);
  } else if (key == "max_iterations") {
    cfg.max_iterations = parse_int(key, val);
  } else if (key == "running_iterations") {
    cfg.running_iterations = parse_int(key, val);
  } else if (key == "step_limit") {
    cfg.step_limit = parse_double(key, val);
  } else if (key == "pos_weight") {
    cfg.pos_weight = parse_double(key, val);
  } else if (key == "ori_weight") {
    cfg.ori_weight = parse_double(key, val);
  } else if (key == "hold_ori_weight") {
    cfg.hold_ori_weight = parse_double(key, val);
  } else if (key == "hold_orientation_on_translate") {
    cfg.hold_orientation_on_translate = parse_bool(val);
  } else if (key == "lock_orientation_on_translate") {
    cfg.lock_orientation_on_translate = parse_bool(val);
  } else if (key == "limit_weight") {
    cfg.limit_weight = parse_double(key, val);
  } else if (key == "limit_margin_fraction") {
    cfg.limit_margin_fraction = parse_double(key, val);
  } else if (key == "lambda_initial") {
    cfg.lambda_initial = parse_double(key, val);
  } else if (key == "lambda_factor") {
    cfg.lambda_factor = parse_double(key, val);
  } else if (key == "lambda_min") {
    cfg.lambda_min = parse_double(key, val);
  } else if (key == "lambda_max") {
    cfg.lambda_max = parse_double(key, val);
  } else if (key == "step_quality_min") {
    cfg.step_quality_min = parse_double(key, val);
  } else if (key == "lm_max_trials") {
    cfg.lm_max_trials = parse_int(key, val);
  } else if (key == "use_jt_fallback") {
    cfg.use_jt_fallback = parse_bool(val);
  } else if (key == "jt_fallback_damping_scale") {
    cfg.jt_fallback_damping_scale = parse_double(key, val);
  } else if (key == "jt_fallback_use_gain") {
    cfg.jt_fallback_use_gain = parse_bool(val);
  } else if (key == "jt_fallback_max_consecutive") {
    cfg.jt_fallback_max_consecutive = parse_int(key, val);
  } else if (key == "use_smart_solver_selection") {
    cfg.use_smart_solver_selection = parse_bool(val);
  } else if (key == "smart_selection_margin_fraction") {
    cfg.smart_selection_margin_fraction = parse_double(key, val);
  } else if (key == "use_safety_margin") {
    cfg.use_safety_margin = parse_bool(val);
  } else if (key == "safety_margin_fraction") {
    cfg.safety_margin_fraction = parse_double(key, val);
  } else if (key == "stall_min_improvement") {
    cfg.stall_min_improvement = parse_double(key, val);
  } else if (key == "stall_max_iterations") {
    cfg.stall_max_iterations = parse_int(key, val);
  } else if (key == "snap_target_on_stall" || key == "snap_target_to_current_on_stall") {
    cfg.snap_target_on_stall = parse_bool(val);
  } else if (key == "max_ctrl_offset") {
    cfg.max_ctrl_offset = parse_double(key, val);
  } else if (key == "max_target_lead") {
    cfg.max_target_lead = parse_double(key, val);
  } else if (key == "convergence_threshold") {
    cfg.convergence_threshold = parse_double(key, val);
  } else if (key == "jacobian_epsilon") {
    cfg.jacobian_epsilon = parse_double(key, val);
  } else if (key == "preview_when_paused") {
    cfg.preview_when_paused = parse_bool(val);
  } else {
    return false;
  }
  return true;
}

bool loadConfigFromFile(const std::string &path, TeleopIkConfig &cfg) {
  std::ifstream ifs(path);
  if (!ifs) return false;
  std::string line;
  while (std::getline(ifs, line)) {
    line = trim_copy(strip_comment(line));
    if (line.empty()) continue;
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    std::string key = trim_copy(line.substr(0, colon));
    std::string val = trim_copy(line.substr(colon + 1));
    // section header such as "teleop_ik:"
    if (val.empty()) continue;
    if (!applyConfigValue(key, val, cfg)) {
      RCLCPP_WARN(rclcpp::get_logger("teleop_ik"), "Ignoring unknown IK config key '%s' in %s",
                  key.c_str(), path.c_str());
    }
  }
  return true;
}

void validateConfig(const TeleopIkConfig &cfg) {
  auto require = [](bool ok, const std::string &msg) {
    if (!ok) throw ConfigurationError("invalid IK config: " + msg);
  };
  require(cfg.translation_gain > 0.0, "translation_gain must be > 0");
  require(cfg.rotation_gain > 0.0, "rotation_gain must be > 0");
  require(cfg.max_iterations >= 1, "max_iterations must be >= 1");
  require(cfg.running_iterations >= 1, "running_iterations must be >= 1");
  require(cfg.step_limit > 0.0, "step_limit must be > 0");
  require(cfg.pos_weight >= 0.0 && cfg.ori_weight >= 0.0 && cfg.hold_ori_weight >= 0.0,
          "pose weights must be >= 0");
  require(cfg.limit_weight >= 0.0, "limit_weight must be >= 0");
  require(cfg.limit_margin_fraction > 0.0 && cfg.limit_margin_fraction < 0.5,
          "limit_margin_fraction must be in (0, 0.5)");
  require(cfg.lambda_min > 0.0 && cfg.lambda_min <= cfg.lambda_max, "need 0 < lambda_min <= lambda_max");
  require(cfg.lambda_initial >= cfg.lambda_min && cfg.lambda_initial <= cfg.lambda_max,
          "lambda_initial must lie in [lambda_min, lambda_max]");
  require(cfg.lambda_factor > 1.0, "lambda_factor must be > 1");
  require(cfg.lm_max_trials >= 0, "lm_max_trials must be >= 0");
  require(cfg.jt_fallback_damping_scale >= 0.0, "jt_fallback_damping_scale must be >= 0");
  require(cfg.jt_fallback_max_consecutive >= 1, "jt_fallback_max_consecutive must be >= 1");
  require(cfg.smart_selection_margin_fraction >= 0.0 && cfg.smart_selection_margin_fraction < 0.5,
          "smart_selection_margin_fraction must be in [0, 0.5)");
  require(cfg.safety_margin_fraction >= 0.0 && cfg.safety_margin_fraction < 0.5,
          "safety_margin_fraction must be in [0, 0.5)");
  require(cfg.stall_min_improvement >= 0.0, "stall_min_improvement must be >= 0");
  require(cfg.stall_max_iterations >= 0, "stall_max_iterations must be >= 0");
  require(cfg.max_target_lead > 0.0, "max_target_lead must be > 0");
  require(cfg.convergence_threshold > 0.0, "convergence_threshold must be > 0");
  require(cfg.jacobian_epsilon > 0.0, "jacobian_epsilon must be > 0");
}

} // namespace teleop_ik
