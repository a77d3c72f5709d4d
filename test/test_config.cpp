#include "teleop_ik/config.hpp"
#include "teleop_ik/types.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

using namespace teleop_ik;

/* ---------- helpers ---------------------------------------------------- */
static std::string writeTempConfig(const std::string &name, const std::string &text)
{
  const std::string path = ::testing::TempDir() + name;
  std::ofstream ofs(path);
  ofs << text;
  return path;
}

/* ---------- file loading ------------------------------------------------ */
TEST(Config, LoadsSectionedFile)
{
  const std::string path = writeTempConfig("teleop_ik_full.yaml",
                                           "# teleop IK\n"
                                           "teleop_ik:\n"
                                           "  end_effector: \"hand\"\n"
                                           "  end_effector_candidates: [tcp, 'gripper']\n"
                                           "  joint_names: [j1, j2, j3]   # arm only\n"
                                           "  actuator_prefix: act_\n"
                                           "  mode: Joint\n"
                                           "  max_iterations: 12\n"
                                           "  lambda_initial: 0.2\n"
                                           "  use_jt_fallback: false\n"
                                           "  preview_when_paused: off\n"
                                           "  some_future_key: 3\n");
  TeleopIkConfig cfg;
  ASSERT_TRUE(loadConfigFromFile(path, cfg));
  EXPECT_EQ(cfg.end_effector, "hand");
  EXPECT_EQ(cfg.end_effector_candidates, (std::vector<std::string>{"tcp", "gripper"}));
  EXPECT_EQ(cfg.joint_names, (std::vector<std::string>{"j1", "j2", "j3"}));
  EXPECT_EQ(cfg.actuator_prefix, "act_");
  EXPECT_EQ(cfg.mode, TeleopIkConfig::Mode::JointSpace);
  EXPECT_EQ(cfg.max_iterations, 12);
  EXPECT_DOUBLE_EQ(cfg.lambda_initial, 0.2);
  EXPECT_FALSE(cfg.use_jt_fallback);
  EXPECT_FALSE(cfg.preview_when_paused);
  // untouched keys keep their defaults
  EXPECT_DOUBLE_EQ(cfg.step_limit, 0.05);
  EXPECT_NO_THROW(validateConfig(cfg));
}

TEST(Config, HashInsideQuotesIsKept)
{
  const std::string path = writeTempConfig("teleop_ik_hash.yaml",
                                           "end_effector: \"tool#1\"  # trailing comment\n"
                                           "joint_names: ['a#1', b]  # c\n"
                                           "actuator_prefix: act_#not part of the value\n");
  TeleopIkConfig cfg;
  ASSERT_TRUE(loadConfigFromFile(path, cfg));
  EXPECT_EQ(cfg.end_effector, "tool#1");
  EXPECT_EQ(cfg.joint_names, (std::vector<std::string>{"a#1", "b"}));
  EXPECT_EQ(cfg.actuator_prefix, "act_");
}

TEST(Config, MissingFileIsReported)
{
  TeleopIkConfig cfg;
  EXPECT_FALSE(loadConfigFromFile(::testing::TempDir() + "does_not_exist.yaml", cfg));
  EXPECT_EQ(cfg.max_iterations, 5);
}

TEST(Config, MalformedNumberThrows)
{
  const std::string path = writeTempConfig("teleop_ik_bad.yaml", "step_limit: 0.05rad\n");
  TeleopIkConfig cfg;
  EXPECT_THROW(loadConfigFromFile(path, cfg), ConfigurationError);
}

TEST(Config, ScalarJointListIsSingleEntry)
{
  TeleopIkConfig cfg;
  ASSERT_TRUE(applyConfigValue("joint_names", "elbow", cfg));
  EXPECT_EQ(cfg.joint_names, (std::vector<std::string>{"elbow"}));
  EXPECT_FALSE(applyConfigValue("elbow_gain", "1", cfg));
}

/* ---------- modes ------------------------------------------------------- */
TEST(Config, ParsesModeNames)
{
  EXPECT_EQ(parseMode("auto"), TeleopIkConfig::Mode::Auto);
  EXPECT_EQ(parseMode("DIRECT"), TeleopIkConfig::Mode::DirectProxy);
  EXPECT_EQ(parseMode("proxy"), TeleopIkConfig::Mode::DirectProxy);
  EXPECT_EQ(parseMode("joint_space"), TeleopIkConfig::Mode::JointSpace);
  EXPECT_THROW(parseMode("cartesian"), ConfigurationError);
  EXPECT_STREQ(modeName(TeleopIkConfig::Mode::JointSpace), "joint");
}

/* ---------- validation -------------------------------------------------- */
TEST(Config, DefaultsAreValid)
{
  EXPECT_NO_THROW(validateConfig(TeleopIkConfig{}));
}

TEST(Config, RejectsOutOfRangeValues)
{
  TeleopIkConfig cfg;
  cfg.lambda_factor = 1.0;
  EXPECT_THROW(validateConfig(cfg), ConfigurationError);

  cfg = TeleopIkConfig{};
  cfg.lambda_min = 1.0;
  cfg.lambda_max = 0.5;
  EXPECT_THROW(validateConfig(cfg), ConfigurationError);

  cfg = TeleopIkConfig{};
  cfg.lambda_initial = 20.0;
  EXPECT_THROW(validateConfig(cfg), ConfigurationError);

  cfg = TeleopIkConfig{};
  cfg.limit_margin_fraction = 0.5;
  EXPECT_THROW(validateConfig(cfg), ConfigurationError);

  cfg = TeleopIkConfig{};
  cfg.max_iterations = 0;
  EXPECT_THROW(validateConfig(cfg), ConfigurationError);

  cfg = TeleopIkConfig{};
  cfg.step_limit = 0.0;
  EXPECT_THROW(validateConfig(cfg), ConfigurationError);

  cfg = TeleopIkConfig{};
  cfg.stall_max_iterations = 0; // disables stall detection
  cfg.lm_max_trials = 0;
  EXPECT_NO_THROW(validateConfig(cfg));
}
