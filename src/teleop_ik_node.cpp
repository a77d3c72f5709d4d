#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/joint_state.hpp>
#include <geometry_msgs/msg/twist.hpp>
#include <std_msgs/msg/bool.hpp>
#include <std_msgs/msg/empty.hpp>
#include <std_msgs/msg/string.hpp>

#include <pinocchio/multibody/model.hpp>

#include "teleop_ik/config.hpp"
#include "teleop_ik/pinocchio_provider.hpp"
#include "teleop_ik/teleop_ik.hpp"

#include <Eigen/Dense>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

using teleop_ik::PinocchioProvider;
using teleop_ik::TeleopIk;
using teleop_ik::TeleopIkConfig;

class TeleopIkNode : public rclcpp::Node {
public:
  TeleopIkNode() : Node("teleop_ik_node") {
    // Read ROS2 parameters under the namespace 'teleop' (use --params-file to load).
    // A teleop.config_file is applied first; explicit parameters override it.
    urdf_path_ = this->declare_parameter<std::string>("teleop.urdf_path", "");
    const std::string config_file = this->declare_parameter<std::string>("teleop.config_file", "");

    TeleopIkConfig cfg;
    if (!config_file.empty()) {
      if (!teleop_ik::loadConfigFromFile(config_file, cfg)) {
        RCLCPP_ERROR(this->get_logger(), "Failed to read IK config: %s", config_file.c_str());
        throw std::runtime_error("IK config read failed");
      }
      RCLCPP_INFO(this->get_logger(), "Loaded IK config from %s", config_file.c_str());
    }
    declareConfigParameters(cfg);

    delta_scale_linear_ = this->declare_parameter<double>("teleop.delta_linear_scale", 0.005);
    delta_scale_angular_ = this->declare_parameter<double>("teleop.delta_angular_scale", 0.02); // radians per unit
    control_frequency_ = this->declare_parameter<double>("teleop.control_frequency", 50.0);

    if (urdf_path_.empty()) {
      RCLCPP_ERROR(this->get_logger(), "urdf_path param required");
      throw std::runtime_error("urdf_path missing");
    }

    const pinocchio::Model model = PinocchioProvider::modelFromUrdf(urdf_path_);
    provider_ = std::make_unique<PinocchioProvider>(model, PinocchioProvider::positionActuators(model, cfg.actuator_prefix));
    ik_ = std::make_unique<TeleopIk>(*provider_, cfg);

    for (const auto &j : provider_->joints()) {
      if (j.nq == 1) joint_address_[j.name] = j.q_address;
    }

    sub_js_ = this->create_subscription<sensor_msgs::msg::JointState>(
        "joint_states", 10, std::bind(&TeleopIkNode::onJointState, this, std::placeholders::_1));
    sub_delta_ = this->create_subscription<geometry_msgs::msg::Twist>(
        "ik_delta", 10, std::bind(&TeleopIkNode::onIkDelta, this, std::placeholders::_1));
    sub_reset_ = this->create_subscription<std_msgs::msg::Empty>(
        "ik_reset", 10, std::bind(&TeleopIkNode::onReset, this, std::placeholders::_1));
    sub_paused_ = this->create_subscription<std_msgs::msg::Bool>(
        "sim_paused", 10, std::bind(&TeleopIkNode::onPaused, this, std::placeholders::_1));
    pub_cmd_ = this->create_publisher<sensor_msgs::msg::JointState>("joint_command", 10);
    pub_status_ = this->create_publisher<std_msgs::msg::String>("ik_status", 10);

    const double hz = control_frequency_ > 0.0 ? control_frequency_ : 50.0;
    timer_ = this->create_wall_timer(std::chrono::microseconds(static_cast<int64_t>(1e6 / hz)),
                                     std::bind(&TeleopIkNode::spinOnce, this));
    start_time_ = this->get_clock()->now();

    RCLCPP_INFO(this->get_logger(), "teleop_ik_node initialized, end_effector=%s mode=%s",
                ik_->resolution().end_effector_name.c_str(), teleop_ik::modeName(cfg.mode));
  }

private:
  void declareConfigParameters(TeleopIkConfig &cfg) {
    cfg.end_effector = this->declare_parameter<std::string>("teleop.end_effector", cfg.end_effector);
    cfg.end_effector_candidates =
        this->declare_parameter<std::vector<std::string>>("teleop.end_effector_candidates", cfg.end_effector_candidates);
    cfg.joint_names = this->declare_parameter<std::vector<std::string>>("teleop.joint_names", cfg.joint_names);
    cfg.joint_prefix = this->declare_parameter<std::string>("teleop.joint_prefix", cfg.joint_prefix);
    cfg.actuator_prefix = this->declare_parameter<std::string>("teleop.actuator_prefix", cfg.actuator_prefix);
    cfg.mode = teleop_ik::parseMode(
        this->declare_parameter<std::string>("teleop.mode", teleop_ik::modeName(cfg.mode)));

    cfg.translation_gain = this->declare_parameter<double>("teleop.translation_gain", cfg.translation_gain);
    cfg.rotation_gain = this->declare_parameter<double>("teleop.rotation_gain", cfg.rotation_gain);
    cfg.max_iterations = this->declare_parameter<int>("teleop.max_iterations", cfg.max_iterations);
    cfg.running_iterations = this->declare_parameter<int>("teleop.running_iterations", cfg.running_iterations);
    cfg.step_limit = this->declare_parameter<double>("teleop.step_limit", cfg.step_limit);
    cfg.pos_weight = this->declare_parameter<double>("teleop.pos_weight", cfg.pos_weight);
    cfg.ori_weight = this->declare_parameter<double>("teleop.ori_weight", cfg.ori_weight);
    cfg.hold_ori_weight = this->declare_parameter<double>("teleop.hold_ori_weight", cfg.hold_ori_weight);
    cfg.limit_weight = this->declare_parameter<double>("teleop.limit_weight", cfg.limit_weight);
    cfg.limit_margin_fraction =
        this->declare_parameter<double>("teleop.limit_margin_fraction", cfg.limit_margin_fraction);
    cfg.lambda_initial = this->declare_parameter<double>("teleop.lambda_initial", cfg.lambda_initial);
    cfg.lm_max_trials = this->declare_parameter<int>("teleop.lm_max_trials", cfg.lm_max_trials);
    cfg.use_jt_fallback = this->declare_parameter<bool>("teleop.use_jt_fallback", cfg.use_jt_fallback);
    cfg.jt_fallback_max_consecutive =
        this->declare_parameter<int>("teleop.jt_fallback_max_consecutive", cfg.jt_fallback_max_consecutive);
    cfg.safety_margin_fraction =
        this->declare_parameter<double>("teleop.safety_margin_fraction", cfg.safety_margin_fraction);
    cfg.stall_max_iterations = this->declare_parameter<int>("teleop.stall_max_iterations", cfg.stall_max_iterations);
    cfg.max_ctrl_offset = this->declare_parameter<double>("teleop.max_ctrl_offset", cfg.max_ctrl_offset);
    cfg.max_target_lead = this->declare_parameter<double>("teleop.max_target_lead", cfg.max_target_lead);
    cfg.preview_when_paused = this->declare_parameter<bool>("teleop.preview_when_paused", cfg.preview_when_paused);
  }

  void onJointState(const sensor_msgs::msg::JointState::SharedPtr msg) {
    std::lock_guard<std::mutex> lk(mutex_);
    Eigen::VectorXd &q = provider_->coordinates();
    for (size_t i = 0; i < msg->name.size() && i < msg->position.size(); ++i) {
      auto it = joint_address_.find(msg->name[i]);
      if (it != joint_address_.end()) q[it->second] = msg->position[i];
    }
    if (!have_state_) {
      have_state_ = true;
      // First measurement: re-anchor target and commands on the real arm.
      ik_->resetToCurrentPose();
      const auto &p = ik_->target().position;
      RCLCPP_INFO(this->get_logger(), "Initial end-effector pose: pos=(%.4f, %.4f, %.4f)", p.x(), p.y(), p.z());
    }
  }

  // Apply incremental pose deltas (e.g. from a teleop key node) to the IK target
  void onIkDelta(const geometry_msgs::msg::Twist::SharedPtr msg) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!have_state_) return;
    const Eigen::Vector3d lin(msg->linear.x, msg->linear.y, msg->linear.z);
    const Eigen::Vector3d ang(msg->angular.x, msg->angular.y, msg->angular.z);
    try {
      if (lin.squaredNorm() > 0.0) ik_->setTargetPositionDelta(lin * delta_scale_linear_);
      if (ang.squaredNorm() > 0.0) ik_->setTargetOrientationDelta(ang * delta_scale_angular_);
    } catch (const std::exception &e) {
      RCLCPP_WARN(this->get_logger(), "Failed to apply IK delta: %s", e.what());
    }
  }

  void onReset(const std_msgs::msg::Empty::SharedPtr) {
    std::lock_guard<std::mutex> lk(mutex_);
    try {
      ik_->resetToCurrentPose();
      RCLCPP_INFO(this->get_logger(), "IK target reset to current pose");
    } catch (const std::exception &e) {
      RCLCPP_WARN(this->get_logger(), "IK reset failed: %s", e.what());
    }
  }

  void onPaused(const std_msgs::msg::Bool::SharedPtr msg) {
    std::lock_guard<std::mutex> lk(mutex_);
    paused_ = msg->data;
  }

  void spinOnce() {
    sensor_msgs::msg::JointState out;
    std_msgs::msg::String status;
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (!have_state_) return;
      const double now_ms = (this->get_clock()->now() - start_time_).seconds() * 1000.0;
      ik_->update(now_ms, paused_);

      const Eigen::VectorXd &ctrl = provider_->controls();
      out.header.stamp = this->get_clock()->now();
      for (const auto &b : ik_->resolution().bindings) {
        out.name.push_back(provider_->joints()[provider_->actuators()[b.channel].joint_id].name);
        out.position.push_back(ctrl[b.channel]);
      }
      status.data = ik_->diagnosticsJson().dump();
    }
    if (!out.name.empty()) pub_cmd_->publish(out);
    pub_status_->publish(status);
    RCLCPP_DEBUG(this->get_logger(), "ik_status %s", status.data.c_str());
  }

  std::mutex mutex_;
  std::string urdf_path_;
  std::unique_ptr<PinocchioProvider> provider_;
  std::unique_ptr<TeleopIk> ik_;
  std::unordered_map<std::string, int> joint_address_;
  bool have_state_{false};
  bool paused_{false};
  double delta_scale_linear_{0.005};
  double delta_scale_angular_{0.02};
  double control_frequency_{50.0};
  rclcpp::Time start_time_;

  rclcpp::Subscription<sensor_msgs::msg::JointState>::SharedPtr sub_js_;
  rclcpp::Subscription<geometry_msgs::msg::Twist>::SharedPtr sub_delta_;
  rclcpp::Subscription<std_msgs::msg::Empty>::SharedPtr sub_reset_;
  rclcpp::Subscription<std_msgs::msg::Bool>::SharedPtr sub_paused_;
  rclcpp::Publisher<sensor_msgs::msg::JointState>::SharedPtr pub_cmd_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_status_;
  rclcpp::TimerBase::SharedPtr timer_;
};

int main(int argc, char **argv) {
  rclcpp::init(argc, argv);
  auto node = std::make_shared<TeleopIkNode>();
  rclcpp::spin(node);
  rclcpp::shutdown();
  return 0;
}
