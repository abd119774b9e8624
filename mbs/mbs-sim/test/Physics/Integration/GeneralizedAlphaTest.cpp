// Ticket: 0001_generalized_alpha_dae
// Test: generalized-alpha coefficients and update rule

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <stdexcept>

#include "mbs-sim/src/Physics/Integration/GeneralizedAlpha.hpp"

namespace mbs_sim
{
namespace test
{

namespace
{

Eigen::VectorXd scalar(double value)
{
  return Eigen::VectorXd::Constant(1, value);
}

AlphaHistory scalarHistory(double y, double yDot, double v)
{
  return AlphaHistory{scalar(y), scalar(yDot), scalar(v)};
}

}  // namespace

// ========== Coefficients ==========

TEST(GeneralizedAlphaParameters, RhoZero_AsymptoticAnnihilation)
{
  const auto p = GeneralizedAlphaParameters::fromSpectralRadius(0.0);
  EXPECT_DOUBLE_EQ(p.alphaM, -1.0);
  EXPECT_DOUBLE_EQ(p.alphaF, 0.0);
  EXPECT_DOUBLE_EQ(p.gamma, 1.5);
  EXPECT_DOUBLE_EQ(p.beta, 1.0);
}

TEST(GeneralizedAlphaParameters, RhoHalf_ExpectedCoefficients)
{
  const auto p = GeneralizedAlphaParameters::fromSpectralRadius(0.5);
  EXPECT_NEAR(p.alphaM, 0.0, 1e-15);
  EXPECT_NEAR(p.alphaF, 1.0 / 3.0, 1e-15);
  EXPECT_NEAR(p.gamma, 5.0 / 6.0, 1e-15);
  EXPECT_NEAR(p.beta, 4.0 / 9.0, 1e-15);
}

TEST(GeneralizedAlphaParameters, RhoOne_TrapezoidalLimit)
{
  const auto p = GeneralizedAlphaParameters::fromSpectralRadius(1.0);
  EXPECT_DOUBLE_EQ(p.rhoInf, 1.0);
  EXPECT_DOUBLE_EQ(p.alphaM, 0.5);
  EXPECT_DOUBLE_EQ(p.alphaF, 0.5);
  EXPECT_DOUBLE_EQ(p.gamma, 0.5);
  EXPECT_DOUBLE_EQ(p.beta, 0.25);
}

TEST(GeneralizedAlphaParameters, OutOfRange_Throws)
{
  EXPECT_THROW((void)GeneralizedAlphaParameters::fromSpectralRadius(-0.1),
               std::invalid_argument);
  EXPECT_THROW((void)GeneralizedAlphaParameters::fromSpectralRadius(1.1),
               std::invalid_argument);
}

// ========== Update rule ==========

TEST(GeneralizedAlphaUpdate, NonPositiveStep_Throws)
{
  const auto p = GeneralizedAlphaParameters::fromSpectralRadius(0.5);
  EXPECT_THROW(GeneralizedAlphaUpdate(p, 0.0), std::invalid_argument);
  EXPECT_THROW(GeneralizedAlphaUpdate(p, -1e-3), std::invalid_argument);
}

TEST(GeneralizedAlphaUpdate, ConstantRate_IntegratedExactly)
{
  for (double rho : {0.0, 0.5, 0.9, 1.0})
  {
    const GeneralizedAlphaUpdate update{
      GeneralizedAlphaParameters::fromSpectralRadius(rho), 0.1};
    const auto trial =
      update.evaluate(scalarHistory(1.0, 2.0, 2.0), scalar(2.0));

    EXPECT_NEAR(trial.v(0), 2.0, 1e-14) << "rho = " << rho;
    EXPECT_NEAR(trial.y(0), 1.2, 1e-14) << "rho = " << rho;
  }
}

TEST(GeneralizedAlphaUpdate, RhoHalf_MatchesHandComputedStep)
{
  const GeneralizedAlphaUpdate update{
    GeneralizedAlphaParameters::fromSpectralRadius(0.5), 0.1};

  // v1 = (1/3 · 1 + 2/3 · 3) = 7/3
  // y1 = 0.1 (1/6 · 1 + 5/6 · 7/3) = 38/180
  const auto trial =
    update.evaluate(scalarHistory(0.0, 1.0, 1.0), scalar(3.0));

  EXPECT_NEAR(trial.v(0), 7.0 / 3.0, 1e-14);
  EXPECT_NEAR(trial.y(0), 38.0 / 180.0, 1e-14);
}

TEST(GeneralizedAlphaUpdate, Evaluate_LeavesHistoryUntouched)
{
  const GeneralizedAlphaUpdate update{
    GeneralizedAlphaParameters::fromSpectralRadius(0.5), 0.1};
  const AlphaHistory history = scalarHistory(0.0, 1.0, 1.0);

  const auto first = update.evaluate(history, scalar(3.0));
  const auto second = update.evaluate(history, scalar(3.0));

  EXPECT_DOUBLE_EQ(history.y(0), 0.0);
  EXPECT_DOUBLE_EQ(history.yDot(0), 1.0);
  EXPECT_DOUBLE_EQ(history.v(0), 1.0);
  EXPECT_EQ(first.y, second.y);
  EXPECT_EQ(first.v, second.v);
}

TEST(GeneralizedAlphaUpdate, Commit_MatchesEvaluateAndStoresRate)
{
  const GeneralizedAlphaUpdate update{
    GeneralizedAlphaParameters::fromSpectralRadius(0.8), 0.05};
  const AlphaHistory history = scalarHistory(0.3, -1.0, -0.7);

  const auto trial = update.evaluate(history, scalar(2.5));
  const AlphaHistory next = update.commit(history, scalar(2.5));

  EXPECT_EQ(next.y, trial.y);
  EXPECT_EQ(next.v, trial.v);
  EXPECT_DOUBLE_EQ(next.yDot(0), 2.5);
}

// ========== Multiplier filter ==========

TEST(GeneralizedAlphaUpdate, MultiplierFilter_UsesSameBlend)
{
  const GeneralizedAlphaUpdate update{
    GeneralizedAlphaParameters::fromSpectralRadius(0.5), 0.1};

  const Eigen::VectorXd laBar =
    update.filterMultiplier(scalar(1.0), scalar(1.0), scalar(3.0));
  EXPECT_NEAR(laBar(0), 7.0 / 3.0, 1e-14);

  // P_N = Λ_N + dt (1/6 · 1 + 5/6 · 7/3)
  const Eigen::VectorXd P = update.impulse(scalar(0.5), scalar(1.0), laBar);
  EXPECT_NEAR(P(0), 0.5 + 38.0 / 180.0, 1e-14);

  // κ̂_N = κ_N + dt² (1/18 · 1 + 4/9 · 7/3)
  const Eigen::VectorXd kappaHat =
    update.positionImpulse(scalar(0.0), scalar(1.0), laBar);
  EXPECT_NEAR(kappaHat(0), 0.01 * 59.0 / 54.0, 1e-14);
}

TEST(GeneralizedAlphaUpdate, EmptyMultipliers_StayEmpty)
{
  const GeneralizedAlphaUpdate update{
    GeneralizedAlphaParameters::fromSpectralRadius(0.5), 0.1};
  const Eigen::VectorXd empty;

  EXPECT_EQ(update.filterMultiplier(empty, empty, empty).size(), 0);
  EXPECT_EQ(update.impulse(empty, empty, empty).size(), 0);
  EXPECT_EQ(update.positionImpulse(empty, empty, empty).size(), 0);
}

}  // namespace test
}  // namespace mbs_sim
