#include "arm_fixture.hpp"

#include "teleop_ik/teleop_ik.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <random>

using namespace teleop_ik;
using namespace teleop_ik_test;

/* ---------- helpers ---------------------------------------------------- */
static Eigen::VectorXd boundControls(const TeleopIk &ik, const KinematicProvider &provider)
{
  Eigen::VectorXd out(static_cast<Eigen::Index>(ik.resolution().bindings.size()));
  for (size_t i = 0; i < ik.resolution().bindings.size(); ++i) {
    out[static_cast<Eigen::Index>(i)] = provider.controls()[ik.resolution().bindings[i].channel];
  }
  return out;
}

static Pose handPose(KinematicProvider &provider)
{
  provider.forward();
  return provider.bodyPose(provider.findBody("hand"));
}

/* ---------- idle behaviour ---------------------------------------------- */
TEST(TeleopIk, ConstructionSyncsCommandsToCoordinates)
{
  auto provider = makeArmProvider();
  provider->controls().setZero();
  const TeleopIk ik(*provider, armConfig());
  for (const auto &b : ik.resolution().bindings) {
    EXPECT_DOUBLE_EQ(provider->controls()[b.channel], provider->coordinates()[b.q_address]);
  }
  EXPECT_FALSE(ik.dirty());
  EXPECT_TRUE(ik.target().position.isApprox(handPose(*provider).position));
}

TEST(TeleopIk, UpdateWithoutIntentLeavesCommandsUntouched)
{
  auto provider = makeArmProvider();
  TeleopIk ik(*provider, armConfig());
  const Eigen::VectorXd ctrl = provider->controls();
  const Eigen::VectorXd q = provider->coordinates();
  for (int i = 0; i < 5; ++i) ik.update(i * 20.0, i % 2 == 0);
  EXPECT_TRUE(provider->controls() == ctrl);
  EXPECT_TRUE(provider->coordinates() == q);
  EXPECT_EQ(ik.state().last_iterations, 0);
}

/* ---------- joint-space solve ------------------------------------------- */
TEST(TeleopIk, PausedSolveReachesTranslatedTarget)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.max_iterations = 40;
  TeleopIk ik(*provider, cfg);

  const Pose start = handPose(*provider);
  ik.setTargetPositionDelta(Eigen::Vector3d(0.02, 0.0, 0.0));
  EXPECT_TRUE(ik.dirty());
  // one paused update is enough within its iteration cap
  ik.update(0.0, true);

  EXPECT_FALSE(ik.dirty());
  EXPECT_TRUE(ik.converged());
  EXPECT_LT(ik.state().last_iterations, cfg.max_iterations);
  EXPECT_NE(ik.state().last_source, StepSource::Snap);
  const Pose reached = handPose(*provider);
  EXPECT_NEAR((reached.position - (start.position + Eigen::Vector3d(0.02, 0.0, 0.0))).norm(), 0.0, 2e-3);
  EXPECT_LT(reached.orientation.angularDistance(start.orientation), 2e-3);
  // preview keeps coordinates equal to the commands
  for (const auto &b : ik.resolution().bindings) {
    EXPECT_DOUBLE_EQ(provider->controls()[b.channel], provider->coordinates()[b.q_address]);
  }
}

TEST(TeleopIk, RunningHostOnlyWritesCommands)
{
  auto provider = makeArmProvider();
  TeleopIk ik(*provider, armConfig());
  const Eigen::VectorXd q = provider->coordinates();
  const Eigen::VectorXd ctrl = boundControls(ik, *provider);

  ik.setTargetPositionDelta(Eigen::Vector3d(0.0, 0.01, 0.0));
  ik.update(0.0, false);

  EXPECT_EQ(ik.state().last_iterations, 1);
  EXPECT_TRUE(provider->coordinates() == q);
  EXPECT_GT((boundControls(ik, *provider) - ctrl).norm(), 0.0);
}

// Random intents from a given start of j2; commands and coordinates never leave their ranges.
static void expectRandomIntentsStayInRange(double j2_start)
{
  auto provider = makeArmProvider();
  const int j2 = provider->findJoint("j2");
  provider->coordinates()[provider->joints()[j2].q_address] = j2_start;
  provider->forward();
  TeleopIk ik(*provider, armConfig());

  std::mt19937 rng(7);
  std::uniform_real_distribution<double> dist(-0.01, 0.01);
  for (int i = 0; i < 200; ++i) {
    ik.setTargetPositionDelta(Eigen::Vector3d(dist(rng), dist(rng), dist(rng)));
    if (i % 10 == 0) ik.setTargetOrientationDelta(Eigen::Vector3d(dist(rng), dist(rng), dist(rng)));
    ik.update(i * 20.0, true);
    ASSERT_FALSE(ik.disabled());

    for (size_t k = 0; k < ik.resolution().dofs.size(); ++k) {
      const ControlledDof &dof = ik.resolution().dofs[k];
      const ActuatorBinding &b = ik.resolution().bindings[k];
      const double q = provider->coordinates()[dof.q_address];
      const double c = provider->controls()[b.channel];
      EXPECT_GE(q, dof.lower - 1e-12);
      EXPECT_LE(q, dof.upper + 1e-12);
      EXPECT_GE(c, b.ctrl_lower - 1e-12);
      EXPECT_LE(c, b.ctrl_upper + 1e-12);
    }
  }
}

TEST(TeleopIk, CommandsAndCoordinatesStayInsideRanges)
{
  expectRandomIntentsStayInRange(-1.75);
}

TEST(TeleopIk, JointStartingAtLimitStaysInRange)
{
  expectRandomIntentsStayInRange(-1.8);
}

TEST(TeleopIk, JointAtLimitIsNotCommandedFurtherIntoIt)
{
  auto provider = makeArmProvider();
  const int j2 = provider->findJoint("j2");
  const int addr = provider->joints()[j2].q_address;
  provider->coordinates()[addr] = -1.8;
  provider->forward();
  TeleopIkConfig cfg = armConfig();
  cfg.stall_max_iterations = 0;
  TeleopIk ik(*provider, cfg);

  // running host: coordinates never move, so j2 is measured at its limit every cycle
  for (int i = 0; i < 50; ++i) {
    ik.setTargetPositionDelta(Eigen::Vector3d(-0.01, 0.0, -0.01));
    ik.update(i * 20.0, false);
    ASSERT_FALSE(ik.disabled());
    for (size_t k = 0; k < ik.resolution().dofs.size(); ++k) {
      if (ik.resolution().dofs[k].q_address != addr) continue;
      EXPECT_GE(provider->controls()[ik.resolution().bindings[k].channel], -1.8);
    }
  }
}

TEST(TeleopIk, CommandsCannotWindUpAgainstStuckJoints)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.stall_max_iterations = 0;
  cfg.max_ctrl_offset = 0.2;
  TeleopIk ik(*provider, cfg);

  // no physics: coordinates never follow the commands
  for (int i = 0; i < 300; ++i) {
    ik.setTargetPositionDelta(Eigen::Vector3d(0.01, 0.0, 0.0));
    ik.update(i * 20.0, false);
    for (const auto &b : ik.resolution().bindings) {
      EXPECT_LE(std::abs(provider->controls()[b.channel] - provider->coordinates()[b.q_address]), 0.2 + 1e-12);
    }
  }
  EXPECT_FALSE(ik.disabled());
}

/* ---------- fallback and snap ------------------------------------------- */
TEST(TeleopIk, LmFailureUsesTransposeFallback)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.lm_max_trials = 0;
  cfg.use_smart_solver_selection = false;
  cfg.max_iterations = 1;
  TeleopIk ik(*provider, cfg);

  ik.setTargetPositionDelta(Eigen::Vector3d(0.0, 0.0, -0.02));
  ik.update(0.0, true);
  EXPECT_EQ(ik.state().last_source, StepSource::FallbackTranspose);
  EXPECT_EQ(ik.state().fallback_count, 1);
  EXPECT_TRUE(provider->controls().allFinite());
  EXPECT_TRUE(ik.dirty());
}

TEST(TeleopIk, RepeatedFallbackSnapsTargetToCurrentPose)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.lm_max_trials = 0;
  cfg.use_smart_solver_selection = false;
  cfg.jt_fallback_max_consecutive = 2;
  cfg.stall_max_iterations = 0;
  cfg.max_iterations = 5;
  TeleopIk ik(*provider, cfg);

  ik.setTargetPositionDelta(Eigen::Vector3d(0.02, 0.0, 0.0));
  ik.update(0.0, true);

  EXPECT_EQ(ik.state().last_source, StepSource::Snap);
  EXPECT_EQ(ik.state().fallback_count, 0);
  EXPECT_FALSE(ik.dirty());
  EXPECT_TRUE(ik.target().position.isApprox(handPose(*provider).position, 1e-12));
  EXPECT_DOUBLE_EQ(ik.state().lambda, cfg.lambda_initial);
}

TEST(TeleopIk, StallSnapsTargetWhenEnabled)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.stall_max_iterations = 1;
  cfg.stall_min_improvement = 1.0; // any iteration counts as flat
  cfg.max_iterations = 5;
  TeleopIk ik(*provider, cfg);

  ik.setTargetPositionDelta(Eigen::Vector3d(0.0, 0.02, 0.0));
  ik.update(0.0, true);
  EXPECT_EQ(ik.state().last_source, StepSource::Snap);
  EXPECT_FALSE(ik.dirty());
  EXPECT_EQ(ik.state().last_iterations, 2);
}

/* ---------- orientation hold -------------------------------------------- */
TEST(TeleopIk, TranslationHoldsOrientationTarget)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.stall_max_iterations = 0;
  cfg.max_iterations = 10;
  TeleopIk ik(*provider, cfg);
  const Eigen::Quaterniond initial = ik.target().orientation;

  for (int i = 0; i < 30; ++i) {
    ik.setTargetPositionDelta(Eigen::Vector3d(0.0, 0.005, 0.002));
    ik.update(i * 20.0, true);
    EXPECT_NEAR(ik.target().orientation.angularDistance(initial), 0.0, 1e-12);
  }
  EXPECT_TRUE(ik.poseTarget().locked());
  EXPECT_LT(handPose(*provider).orientation.angularDistance(initial), 0.05);
}

/* ---------- direct proxy ------------------------------------------------ */
TEST(TeleopIk, DirectProxyFollowsTargetExactly)
{
  PinocchioProvider provider(buildProxy());
  TeleopIkConfig cfg;
  cfg.end_effector = "ee_proxy";
  TeleopIk ik(provider, cfg);
  ASSERT_TRUE(ik.resolution().directProxy());

  ik.setTargetPositionDelta(Eigen::Vector3d(0.1, -0.05, 0.2));
  ik.setTargetOrientationDelta(Eigen::Vector3d(0.0, 0.0, 0.3));
  ik.update(0.0, false);

  const int body = provider.findBody("ee_proxy");
  const Pose pose = provider.bodyPose(body);
  EXPECT_NEAR((pose.position - Eigen::Vector3d(0.1, -0.05, 0.2)).norm(), 0.0, 1e-9);
  EXPECT_NEAR(pose.orientation.angularDistance(ik.target().orientation), 0.0, 1e-9);
  EXPECT_TRUE(ik.converged());
  EXPECT_FALSE(ik.dirty());
}

TEST(TeleopIk, DirectModeOnArmIsRejected)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.mode = TeleopIkConfig::Mode::DirectProxy;
  EXPECT_THROW({ TeleopIk ik(*provider, cfg); }, ConfigurationError);
}

TEST(TeleopIk, InvalidParametersAreRejected)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.lambda_factor = 1.0;
  EXPECT_THROW({ TeleopIk ik(*provider, cfg); }, ConfigurationError);
}

/* ---------- failure containment ----------------------------------------- */
TEST(TeleopIk, UpdateDisablesInsteadOfThrowing)
{
  auto arm = makeArmProvider();
  FaultyProvider provider(*arm);
  TeleopIk ik(provider, armConfig());
  ik.setTargetPositionDelta(Eigen::Vector3d(0.01, 0.0, 0.0));

  provider.armAfter(0);
  EXPECT_NO_THROW(ik.update(0.0, true));
  EXPECT_TRUE(ik.disabled());

  // stays quiet while disabled
  const int calls = provider.forwardCalls();
  EXPECT_NO_THROW(ik.update(20.0, true));
  EXPECT_EQ(provider.forwardCalls(), calls);

  provider.disarm();
  ik.onModelReloaded();
  EXPECT_FALSE(ik.disabled());
  EXPECT_FALSE(ik.dirty());
}

TEST(TeleopIk, FailureInsideJacobianRestoresCoordinates)
{
  auto arm = makeArmProvider();
  FaultyProvider provider(*arm);
  TeleopIk ik(provider, armConfig());
  ik.setTargetPositionDelta(Eigen::Vector3d(0.01, 0.0, 0.0));
  const Eigen::VectorXd q = provider.coordinates();
  const Eigen::VectorXd ctrl = provider.controls();

  // current pose, Jacobian base pose and the first column succeed
  provider.armAfter(3);
  ik.update(0.0, true);
  EXPECT_TRUE(ik.disabled());
  EXPECT_TRUE(provider.coordinates() == q);
  EXPECT_TRUE(provider.controls() == ctrl);
}

TEST(TeleopIk, NonStandardExceptionAlsoDisables)
{
  auto arm = makeArmProvider();
  FaultyProvider provider(*arm);
  TeleopIk ik(provider, armConfig());
  ik.setTargetPositionDelta(Eigen::Vector3d(0.01, 0.0, 0.0));
  const Eigen::VectorXd q = provider.coordinates();

  provider.armAfter(0, true);
  EXPECT_NO_THROW(ik.update(0.0, true));
  EXPECT_TRUE(ik.disabled());

  provider.disarm();
  ik.onModelReloaded();
  EXPECT_FALSE(ik.disabled());

  // same fault inside the Jacobian, where coordinates are restored on the way out
  ik.setTargetPositionDelta(Eigen::Vector3d(0.01, 0.0, 0.0));
  provider.armAfter(3, true);
  EXPECT_NO_THROW(ik.update(20.0, true));
  EXPECT_TRUE(ik.disabled());
  EXPECT_TRUE(provider.coordinates() == q);
}

/* ---------- reset and diagnostics --------------------------------------- */
TEST(TeleopIk, ResetClearsSolverMemory)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.lm_max_trials = 0;
  cfg.use_smart_solver_selection = false;
  cfg.max_iterations = 1;
  TeleopIk ik(*provider, cfg);
  ik.setTargetPositionDelta(Eigen::Vector3d(0.01, 0.0, 0.0));
  ik.update(0.0, false);
  ASSERT_EQ(ik.state().fallback_count, 1);

  ik.resetToCurrentPose();
  EXPECT_EQ(ik.state().fallback_count, 0);
  EXPECT_EQ(ik.state().last_source, StepSource::None);
  EXPECT_DOUBLE_EQ(ik.state().lambda, cfg.lambda_initial);
  EXPECT_FALSE(ik.lastError().has_value());
  EXPECT_FALSE(ik.dirty());
  EXPECT_FALSE(ik.poseTarget().locked());
  for (const auto &b : ik.resolution().bindings) {
    EXPECT_DOUBLE_EQ(provider->controls()[b.channel], provider->coordinates()[b.q_address]);
  }
}

TEST(TeleopIk, DiagnosticsReportSolverState)
{
  auto provider = makeArmProvider();
  TeleopIkConfig cfg = armConfig();
  cfg.max_iterations = 1;
  TeleopIk ik(*provider, cfg);
  ik.setTargetPositionDelta(Eigen::Vector3d(0.01, 0.0, 0.0));
  ik.update(120.0, true);

  const nlohmann::json j = ik.diagnosticsJson();
  EXPECT_EQ(j["mode"], "joint");
  EXPECT_EQ(j["end_effector"], "hand");
  EXPECT_EQ(j["dofs"], 6);
  EXPECT_EQ(j["iterations"], 1);
  EXPECT_DOUBLE_EQ(j["last_solve_time_ms"].get<double>(), 120.0);
  EXPECT_TRUE(j["last_error"].is_number());
  EXPECT_EQ(j["target"]["position"].size(), 3u);
  EXPECT_EQ(j["target"]["orientation"].size(), 4u);
  EXPECT_EQ(j["last_step"].get<std::string>(), stepSourceName(ik.state().last_source));
}
