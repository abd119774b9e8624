// Ticket: 0007_consistent_initialization
// Test: consistent initial accelerations and multipliers

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cmath>
#include <memory>

#include "mbs-sim/src/Model/BodyPoint.hpp"
#include "mbs-sim/src/Model/Particle.hpp"
#include "mbs-sim/src/Model/RigidBody2D.hpp"
#include "mbs-sim/src/Model/System.hpp"
#include "mbs-sim/src/Physics/Constraints/KnifeEdgeConstraint.hpp"
#include "mbs-sim/src/Physics/Constraints/RodConstraint.hpp"
#include "mbs-sim/src/Physics/Forces/ConstantForce.hpp"
#include "mbs-sim/src/Physics/Integration/ConsistentInitialization.hpp"
#include "mbs-sim/src/Physics/Solver/SolverErrors.hpp"
#include "mbs-sim/test/Helpers/TestSystems.hpp"

namespace mbs_sim
{
namespace test
{

namespace
{

constexpr double kTolerance = 1e-8;

UnknownLayout layoutFor(const Model& model, DAEIndex index, bool useGGL)
{
  return UnknownLayout{model.nq(),
                       model.nu(),
                       model.nlaG(),
                       model.nlaGamma(),
                       model.nlaN(),
                       index,
                       useGGL};
}

// Pendulum bob at (0, -1, 0) with the given velocity, rod length 1
std::unique_ptr<System> makeMovingPendulum(const Eigen::Vector3d& velocity)
{
  auto system = std::make_unique<System>();
  auto& bob = system->add(std::make_unique<Particle>(
    1.0, Eigen::Vector3d{0.0, -1.0, 0.0}, velocity));
  system->add(std::make_unique<GravityForce>(bob));
  system->add(std::make_unique<RodConstraint>(
    BodyPoint::fixed(Eigen::Vector3d::Zero()), BodyPoint::on(bob)));
  system->assemble();
  return system;
}

}  // namespace

// ========== Pendulum ==========

TEST(ConsistentInitialization, PendulumAtRest_TangentialAccelerationAndTension)
{
  constexpr double theta0 = 0.5;
  auto system = makePendulum(1.0, theta0, 1.0);
  UnknownLayout const layout = layoutFor(*system, DAEIndex::Two, true);

  const StepState state =
    makeConsistentInitialState(*system, layout, kTolerance);

  // Only gravity's tangential component accelerates the bob
  const Eigen::Vector3d radial{std::sin(theta0), -std::cos(theta0), 0.0};
  EXPECT_NEAR(state.uDot.dot(radial), 0.0, 1e-12);
  EXPECT_NEAR(state.uDot.norm(), 9.81 * std::sin(theta0), 1e-12);

  // g = |r|² - L², W_g = 2r: 2L λ_g = -m g cos θ0
  const Unknowns unknowns = layout.unpack(state.x);
  ASSERT_EQ(unknowns.laG.size(), 1);
  EXPECT_NEAR(unknowns.laG(0), -0.5 * 9.81 * std::cos(theta0), 1e-12);
}

TEST(ConsistentInitialization, PendulumAtRest_DynamicsHold)
{
  auto system = makePendulum();
  UnknownLayout const layout = layoutFor(*system, DAEIndex::One, true);

  const StepState state =
    makeConsistentInitialState(*system, layout, kTolerance);
  const Unknowns unknowns = layout.unpack(state.x);

  const double t0 = system->t0();
  const Eigen::VectorXd residual =
    system->M(t0, state.q) * state.uDot - system->h(t0, state.q, state.u) -
    system->Wg(t0, state.q) * unknowns.laG;
  EXPECT_LT(residual.lpNorm<Eigen::Infinity>(), 1e-12);
}

TEST(ConsistentInitialization, History_StartsFromInitialRates)
{
  auto system = makePendulum();
  UnknownLayout const layout = layoutFor(*system, DAEIndex::One, true);

  const StepState state =
    makeConsistentInitialState(*system, layout, kTolerance);

  EXPECT_DOUBLE_EQ(state.t, 0.0);
  EXPECT_EQ(state.history.y.head(3), state.q);
  EXPECT_EQ(state.history.y.tail(3), state.u);
  EXPECT_EQ(state.history.yDot.tail(3), state.uDot);
  EXPECT_EQ(state.history.v, state.history.yDot);
  EXPECT_EQ(state.x.size(), layout.size());

  // κ and Λ start at zero
  const Unknowns unknowns = layout.unpack(state.x);
  EXPECT_TRUE(unknowns.kappaG.isZero());
  EXPECT_TRUE(unknowns.LaG.isZero());
}

TEST(ConsistentInitialization, RadialVelocity_Throws)
{
  auto system = makeMovingPendulum(Eigen::Vector3d{0.0, 0.5, 0.0});
  UnknownLayout const layout = layoutFor(*system, DAEIndex::Two, true);

  EXPECT_THROW((void)makeConsistentInitialState(*system, layout, kTolerance),
               InconsistentInitialConditions);
}

TEST(ConsistentInitialization, TangentialVelocity_Accepted)
{
  auto system = makeMovingPendulum(Eigen::Vector3d{2.0, 0.0, 0.0});
  UnknownLayout const layout = layoutFor(*system, DAEIndex::One, true);

  const StepState state =
    makeConsistentInitialState(*system, layout, kTolerance);

  // Centripetal acceleration v²/L points to the hinge
  EXPECT_NEAR(state.uDot(1), 4.0, 1e-10);
}

TEST(ConsistentInitialization, RodLengthViolated_Throws)
{
  auto system = std::make_unique<System>();
  auto& bob = system->add(
    std::make_unique<Particle>(1.0, Eigen::Vector3d{0.0, -1.0, 0.0}));
  system->add(std::make_unique<RodConstraint>(
    BodyPoint::fixed(Eigen::Vector3d::Zero()), BodyPoint::on(bob), 1.5));
  system->assemble();
  UnknownLayout const layout = layoutFor(*system, DAEIndex::Two, true);

  EXPECT_THROW((void)makeConsistentInitialState(*system, layout, kTolerance),
               InconsistentInitialConditions);
}

// ========== Non-holonomic ==========

TEST(ConsistentInitialization, SidewaysSkate_Throws)
{
  auto system = std::make_unique<System>();
  auto& body = system->add(std::make_unique<RigidBody2D>(
    1.0, 0.1, Eigen::Vector3d::Zero(), Eigen::Vector3d{0.0, 1.0, 0.0}));
  system->add(std::make_unique<KnifeEdgeConstraint>(body));
  system->assemble();
  UnknownLayout const layout = layoutFor(*system, DAEIndex::Two, false);

  EXPECT_THROW((void)makeConsistentInitialState(*system, layout, kTolerance),
               InconsistentInitialConditions);
}

TEST(ConsistentInitialization, TurningSkate_LateralForceBalancesTurn)
{
  auto system = makeSkate(1.0, 2.0);
  UnknownLayout const layout = layoutFor(*system, DAEIndex::One, true);

  const StepState state =
    makeConsistentInitialState(*system, layout, kTolerance);
  const Unknowns unknowns = layout.unpack(state.x);

  // γ̇ = 0 at heading 0 requires ÿ = ω ẋ, supplied by λ_γ on a unit mass
  EXPECT_NEAR(state.uDot(1), 2.0, 1e-12);
  EXPECT_NEAR(unknowns.laGamma(0), 2.0, 1e-12);
  EXPECT_NEAR(state.uDot(0), 0.0, 1e-12);
  EXPECT_NEAR(state.uDot(2), 0.0, 1e-12);
}

// ========== Contacts ==========

TEST(ConsistentInitialization, BallAboveGround_ContactsInactive)
{
  auto system = makeBallOnGround(1.0);
  UnknownLayout const layout = layoutFor(*system, DAEIndex::Two, true);

  const StepState state =
    makeConsistentInitialState(*system, layout, kTolerance);

  ASSERT_EQ(state.contactModes.size(), 1U);
  EXPECT_EQ(state.contactModes[0], ContactMode::Inactive);
  EXPECT_NEAR(state.uDot(1), -9.81, 1e-12);
  EXPECT_EQ(state.laNBar, state.laN);
}

TEST(ConsistentInitialization, BallBelowGround_Throws)
{
  auto system = makeBallOnGround(-0.1);
  UnknownLayout const layout = layoutFor(*system, DAEIndex::Two, true);

  EXPECT_THROW((void)makeConsistentInitialState(*system, layout, kTolerance),
               InconsistentInitialConditions);
}

}  // namespace test
}  // namespace mbs_sim
