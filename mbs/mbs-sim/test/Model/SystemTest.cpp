// Ticket: 0003_system_assembly
// Test: System assembly, global layout and stacked constraint terms

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <cmath>
#include <memory>
#include <numbers>
#include <stdexcept>

#include "mbs-sim/src/Model/BodyPoint.hpp"
#include "mbs-sim/src/Model/Particle.hpp"
#include "mbs-sim/src/Model/RigidBody2D.hpp"
#include "mbs-sim/src/Model/System.hpp"
#include "mbs-sim/src/Physics/Constraints/KnifeEdgeConstraint.hpp"
#include "mbs-sim/src/Physics/Constraints/PointPlaneContact.hpp"
#include "mbs-sim/src/Physics/Constraints/RodConstraint.hpp"
#include "mbs-sim/src/Physics/Forces/ConstantForce.hpp"
#include "mbs-sim/test/Helpers/TestSystems.hpp"

namespace mbs_sim
{
namespace test
{

namespace
{

// Jacobian of a vector function of q by central differences
template <typename F>
Eigen::MatrixXd numericalJacobian(F&& f, const Eigen::VectorXd& q)
{
  constexpr double h = 1e-6;
  const Eigen::VectorXd f0 = f(q);
  Eigen::MatrixXd J(f0.size(), q.size());
  for (Eigen::Index i = 0; i < q.size(); ++i)
  {
    Eigen::VectorXd qp = q;
    Eigen::VectorXd qm = q;
    qp(i) += h;
    qm(i) -= h;
    J.col(i) = (f(qp) - f(qm)) / (2.0 * h);
  }
  return J;
}

}  // namespace

/**
 * Particle (m = 2) tied by a rod to a point on a planar body (m = 3,
 * I = 0.5). The particle touches a floor, the body skates on a knife edge.
 */
class SystemTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto& particle = system_.add(std::make_unique<Particle>(
      2.0, Eigen::Vector3d{1.0, 0.5, 0.0}, Eigen::Vector3d{0.1, -0.2, 0.3}));
    auto& body = system_.add(std::make_unique<RigidBody2D>(
      3.0,
      0.5,
      Eigen::Vector3d{0.0, 1.0, 0.3},
      Eigen::Vector3d{0.4, 0.2, -1.5}));
    particle_ = &particle;
    body_ = &body;

    system_.add(std::make_unique<GravityForce>(particle));
    rod_ = &system_.add(std::make_unique<RodConstraint>(
      BodyPoint::on(particle),
      BodyPoint::on(body, Eigen::Vector3d{0.5, 0.0, 0.0})));
    system_.add(std::make_unique<KnifeEdgeConstraint>(
      body, Eigen::Vector3d{0.2, 0.1, 0.0}));
    system_.add(std::make_unique<PointPlaneContact>(BodyPoint::on(particle),
                                                    Eigen::Vector3d::Zero(),
                                                    Eigen::Vector3d::UnitY()));
    system_.assemble();

    q_ = system_.q0();
    u_ = system_.u0();
  }

  System system_;
  const Particle* particle_{nullptr};
  const RigidBody2D* body_{nullptr};
  const RodConstraint* rod_{nullptr};
  Eigen::VectorXd q_;
  Eigen::VectorXd u_;
};

// ========== Layout ==========

TEST_F(SystemTest, Dimensions_SumOverComponents)
{
  EXPECT_TRUE(system_.isAssembled());
  EXPECT_EQ(system_.nq(), 6);
  EXPECT_EQ(system_.nu(), 6);
  EXPECT_EQ(system_.nlaG(), 1);
  EXPECT_EQ(system_.nlaGamma(), 1);
  EXPECT_EQ(system_.nlaN(), 1);
  EXPECT_EQ(system_.bodies().size(), 2U);
  EXPECT_EQ(system_.forces().size(), 1U);
}

TEST_F(SystemTest, Offsets_FollowInsertionOrder)
{
  EXPECT_EQ(particle_->qOffset(), 0);
  EXPECT_EQ(particle_->uOffset(), 0);
  EXPECT_EQ(body_->qOffset(), 3);
  EXPECT_EQ(body_->uOffset(), 3);

  EXPECT_EQ(q_.segment(3, 3), (Eigen::Vector3d{0.0, 1.0, 0.3}));
  EXPECT_EQ(u_.head(3), (Eigen::Vector3d{0.1, -0.2, 0.3}));
}

TEST_F(SystemTest, InitialMultipliers_AreZero)
{
  EXPECT_EQ(system_.laG0(), Eigen::VectorXd::Zero(1));
  EXPECT_EQ(system_.laGamma0(), Eigen::VectorXd::Zero(1));
  EXPECT_EQ(system_.laN0(), Eigen::VectorXd::Zero(1));
  EXPECT_DOUBLE_EQ(system_.t0(), 0.0);
}

// ========== Equations of motion ==========

TEST_F(SystemTest, MassMatrix_BlockDiagonal)
{
  const Eigen::MatrixXd M = Eigen::MatrixXd(system_.M(0.0, q_));
  Eigen::VectorXd expected(6);
  expected << 2.0, 2.0, 2.0, 3.0, 3.0, 0.5;

  EXPECT_EQ(M.diagonal(), expected);
  Eigen::MatrixXd offDiagonal = M;
  offDiagonal.diagonal().setZero();
  EXPECT_TRUE(offDiagonal.isZero(0.0));
}

TEST_F(SystemTest, ForceVector_CollectsGravityOnParticle)
{
  const Eigen::VectorXd h = system_.h(0.0, q_, u_);

  EXPECT_DOUBLE_EQ(h(1), -2.0 * 9.81);
  EXPECT_DOUBLE_EQ(h(0), 0.0);
  EXPECT_EQ(h.tail(3), Eigen::Vector3d::Zero());
}

TEST_F(SystemTest, Kinematics_IdentityForParticleAndPlanarBody)
{
  EXPECT_EQ(system_.qDot(0.0, q_, u_), u_);
  EXPECT_EQ(Eigen::MatrixXd(system_.B(0.0, q_)),
            Eigen::MatrixXd::Identity(6, 6));
}

// ========== Bilateral constraints ==========

TEST_F(SystemTest, Rod_LengthTakenFromInitialConfiguration)
{
  const Eigen::Vector3d end{
    0.5 * std::cos(0.3), 1.0 + 0.5 * std::sin(0.3), 0.0};
  EXPECT_NEAR(rod_->length(), (Eigen::Vector3d{1.0, 0.5, 0.0} - end).norm(),
              1e-14);
  EXPECT_NEAR(system_.g(0.0, q_)(0), 0.0, 1e-14);
}

TEST_F(SystemTest, Wg_MatchesDerivativeOfG)
{
  Eigen::VectorXd q = q_;
  q(1) += 0.05;
  q(5) -= 0.2;

  const Eigen::MatrixXd numerical = numericalJacobian(
    [this](const Eigen::VectorXd& x) { return system_.g(0.0, x); }, q);
  const Eigen::MatrixXd Wg = Eigen::MatrixXd(system_.Wg(0.0, q));

  ASSERT_EQ(Wg.rows(), 6);
  ASSERT_EQ(Wg.cols(), 1);
  EXPECT_LT((Wg.transpose() - numerical).norm(), 1e-8);
}

TEST_F(SystemTest, GDot_EqualsWgTransposeU)
{
  const Eigen::MatrixXd Wg = Eigen::MatrixXd(system_.Wg(0.0, q_));
  EXPECT_NEAR(system_.gDot(0.0, q_, u_)(0), (Wg.transpose() * u_)(0), 1e-12);
}

TEST_F(SystemTest, GDDot_MatchesDerivativeAlongMotion)
{
  const Eigen::VectorXd uDot =
    (Eigen::VectorXd(6) << 0.3, -1.0, 0.2, 0.5, 0.1, 2.0).finished();

  // d/dt ġ(q + t u, u + t u̇) at t = 0
  constexpr double h = 1e-6;
  const double numerical =
    (system_.gDot(0.0, q_ + h * u_, u_ + h * uDot)(0) -
     system_.gDot(0.0, q_ - h * u_, u_ - h * uDot)(0)) /
    (2.0 * h);

  EXPECT_NEAR(system_.gDDot(0.0, q_, u_, uDot)(0), numerical, 1e-7);
}

// ========== Non-holonomic constraints ==========

TEST_F(SystemTest, Gamma_LinearInVelocity)
{
  const Eigen::MatrixXd Wgamma = Eigen::MatrixXd(system_.Wgamma(0.0, q_));
  ASSERT_EQ(Wgamma.rows(), 6);
  ASSERT_EQ(Wgamma.cols(), 1);

  // Only the planar body carries the knife edge
  EXPECT_EQ(Wgamma.col(0).head(3), Eigen::Vector3d::Zero());
  EXPECT_NEAR(
    system_.gamma(0.0, q_, u_)(0), (Wgamma.transpose() * u_)(0), 1e-12);
}

TEST_F(SystemTest, GammaDot_MatchesDerivativeAlongMotion)
{
  const Eigen::VectorXd uDot =
    (Eigen::VectorXd(6) << 0.0, 0.0, 0.0, -0.7, 0.4, 1.2).finished();

  constexpr double h = 1e-6;
  const double numerical =
    (system_.gamma(0.0, q_ + h * u_, u_ + h * uDot)(0) -
     system_.gamma(0.0, q_ - h * u_, u_ - h * uDot)(0)) /
    (2.0 * h);

  EXPECT_NEAR(system_.gammaDot(0.0, q_, u_, uDot)(0), numerical, 1e-7);
}

// ========== Contacts ==========

TEST_F(SystemTest, Contact_GapAndDirection)
{
  EXPECT_DOUBLE_EQ(system_.gN(0.0, q_)(0), 0.5);
  EXPECT_DOUBLE_EQ(system_.gNDot(0.0, q_, u_)(0), -0.2);

  const Eigen::MatrixXd WN = Eigen::MatrixXd(system_.WN(0.0, q_));
  Eigen::VectorXd expected = Eigen::VectorXd::Zero(6);
  expected(1) = 1.0;
  EXPECT_EQ(WN.col(0), expected);
  EXPECT_EQ(system_.proxRN(), Eigen::VectorXd::Constant(1, 1e3));
}

TEST_F(SystemTest, ContactXi_NewtonImpactLaw)
{
  // e_N = 0: ξ is the post-impact normal velocity
  Eigen::VectorXd u = u_;
  u(1) = 0.7;
  EXPECT_DOUBLE_EQ(system_.xiN(0.0, q_, u_, u)(0), 0.7);
}

// ========== Step callback and energy ==========

TEST_F(SystemTest, StepCallback_WrapsOnlyPlanarHeading)
{
  Eigen::VectorXd q = q_;
  q(2) = 4.0;  // particle z, left alone
  q(5) = 3.5;

  const auto [qOut, uOut] = system_.stepCallback(0.0, q, u_);

  EXPECT_DOUBLE_EQ(qOut(2), 4.0);
  EXPECT_NEAR(qOut(5), 3.5 - 2.0 * std::numbers::pi, 1e-14);
  EXPECT_EQ(uOut, u_);
}

TEST_F(SystemTest, Energy_KineticAndGravitational)
{
  // T = 0.5 (2 * 0.14 + 3 * 0.2 + 0.5 * 2.25)
  EXPECT_NEAR(system_.kineticEnergy(0.0, q_, u_),
              0.5 * (2.0 * 0.14 + 3.0 * 0.2 + 0.5 * 2.25),
              1e-12);
  // V = m g y for the particle only
  EXPECT_NEAR(system_.potentialEnergy(0.0, q_), 2.0 * 9.81 * 0.5, 1e-12);
}

// ========== Lifecycle ==========

TEST(System, QueriesBeforeAssemble_Throw)
{
  System system;
  system.add(std::make_unique<Particle>(1.0));

  EXPECT_FALSE(system.isAssembled());
  EXPECT_THROW((void)system.nq(), std::logic_error);
  EXPECT_THROW((void)system.q0(), std::logic_error);
  EXPECT_THROW((void)system.M(0.0, Eigen::VectorXd::Zero(3)),
               std::logic_error);
}

TEST(System, AddOrAssembleAfterAssemble_Throws)
{
  System system;
  auto& particle = system.add(std::make_unique<Particle>(1.0));
  system.assemble();

  EXPECT_THROW(system.add(std::make_unique<GravityForce>(particle)),
               std::logic_error);
  EXPECT_THROW(system.assemble(), std::logic_error);
}

TEST(System, EmptyGroups_GiveZeroSizedTerms)
{
  auto system = makeSpringOscillator(1.0, 10.0, 0.1);

  EXPECT_EQ(system->nlaG(), 0);
  EXPECT_EQ(system->g(0.0, system->q0()).size(), 0);
  EXPECT_EQ(system->Wg(0.0, system->q0()).cols(), 0);
  EXPECT_EQ(system->Wg(0.0, system->q0()).rows(), 3);
  EXPECT_EQ(system->WN(0.0, system->q0()).cols(), 0);
  EXPECT_EQ(system->proxRN().size(), 0);
}

TEST(System, StartTime_Stored)
{
  System system{2.5};
  system.add(std::make_unique<Particle>(1.0));
  system.assemble();
  EXPECT_DOUBLE_EQ(system.t0(), 2.5);
}

}  // namespace test
}  // namespace mbs_sim
