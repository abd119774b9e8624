// Ticket: 0002_newton_solver
// Test: finite-difference and analytical Jacobian providers

#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "mbs-sim/src/Physics/Solver/JacobianProvider.hpp"
#include "mbs-sim/src/Physics/Solver/NonlinearSystem.hpp"

namespace mbs_sim
{
namespace test
{

namespace
{

// f(x) = (x0² + sin x1, x0·x1, exp(x1))
Eigen::VectorXd smoothFunction(const Eigen::VectorXd& x)
{
  Eigen::VectorXd f(3);
  f << x(0) * x(0) + std::sin(x(1)), x(0) * x(1), std::exp(x(1));
  return f;
}

Eigen::SparseMatrix<double> smoothFunctionJacobian(const Eigen::VectorXd& x)
{
  Eigen::MatrixXd J(3, 2);
  J << 2.0 * x(0), std::cos(x(1)), x(1), x(0), 0.0, std::exp(x(1));
  return J.sparseView();
}

Eigen::VectorXd elementwiseSquare(const Eigen::VectorXd& x)
{
  return x.array().square().matrix();
}

void expectMatrixNear(const Eigen::MatrixXd& actual,
                      const Eigen::MatrixXd& expected,
                      double tolerance)
{
  ASSERT_EQ(actual.rows(), expected.rows());
  ASSERT_EQ(actual.cols(), expected.cols());
  for (Eigen::Index i = 0; i < actual.rows(); ++i)
  {
    for (Eigen::Index j = 0; j < actual.cols(); ++j)
    {
      EXPECT_NEAR(actual(i, j), expected(i, j), tolerance)
        << "entry (" << i << ", " << j << ")";
    }
  }
}

}  // namespace

// ========== Finite differences ==========

TEST(FiniteDifferenceJacobian, Forward_MatchesAnalytical)
{
  FunctionSystem const system{smoothFunction};
  Eigen::Vector2d const x{0.7, -0.3};
  Eigen::VectorXd const fx = system.evaluate(x);

  FiniteDifferenceJacobian const provider{DifferenceScheme::Forward};
  Eigen::MatrixXd const J = provider.jacobian(system, x, fx);

  expectMatrixNear(J, Eigen::MatrixXd{smoothFunctionJacobian(x)}, 1e-6);
}

TEST(FiniteDifferenceJacobian, Central_MatchesAnalyticalMoreTightly)
{
  FunctionSystem const system{smoothFunction};
  Eigen::Vector2d const x{0.7, -0.3};
  Eigen::VectorXd const fx = system.evaluate(x);

  FiniteDifferenceJacobian const provider{DifferenceScheme::Central};
  Eigen::MatrixXd const J = provider.jacobian(system, x, fx);

  expectMatrixNear(J, Eigen::MatrixXd{smoothFunctionJacobian(x)}, 1e-9);
}

TEST(FiniteDifferenceJacobian, LargeCoordinates_StepScalesWithMagnitude)
{
  FunctionSystem const system{elementwiseSquare};
  Eigen::Vector2d const x{1.0e4, -2.0e4};
  Eigen::VectorXd const fx = system.evaluate(x);

  FiniteDifferenceJacobian const provider{DifferenceScheme::Central};
  Eigen::MatrixXd const J = provider.jacobian(system, x, fx);

  // Central differences are exact for quadratics up to round-off
  EXPECT_NEAR(J(0, 0), 2.0e4, 1e-3);
  EXPECT_NEAR(J(1, 1), -4.0e4, 1e-3);
}

TEST(FiniteDifferenceJacobian, DecoupledFunction_StoresOnlyStructuralNonZeros)
{
  FunctionSystem const system{elementwiseSquare};
  Eigen::VectorXd const x = Eigen::VectorXd::LinSpaced(5, 1.0, 5.0);
  Eigen::VectorXd const fx = system.evaluate(x);

  FiniteDifferenceJacobian const provider;
  Eigen::SparseMatrix<double> const J = provider.jacobian(system, x, fx);

  EXPECT_EQ(J.rows(), 5);
  EXPECT_EQ(J.cols(), 5);
  EXPECT_EQ(J.nonZeros(), 5);
}

TEST(FiniteDifferenceJacobian, DefaultSteps_DependOnScheme)
{
  constexpr double eps = std::numeric_limits<double>::epsilon();

  FiniteDifferenceJacobian const forward{DifferenceScheme::Forward};
  EXPECT_DOUBLE_EQ(forward.relativeStep(), std::sqrt(eps));

  FiniteDifferenceJacobian const central{DifferenceScheme::Central};
  EXPECT_DOUBLE_EQ(central.relativeStep(), std::cbrt(eps));

  FiniteDifferenceJacobian const custom{DifferenceScheme::Forward, 1e-6};
  EXPECT_DOUBLE_EQ(custom.relativeStep(), 1e-6);
}

TEST(FiniteDifferenceJacobian, NegativeStep_Throws)
{
  EXPECT_THROW(FiniteDifferenceJacobian(DifferenceScheme::Forward, -1e-6),
               std::invalid_argument);
}

// ========== Analytical ==========

TEST(AnalyticalJacobian, ReturnsCallableResult)
{
  FunctionSystem const system{smoothFunction};
  Eigen::Vector2d const x{0.2, 0.4};

  AnalyticalJacobian const provider{smoothFunctionJacobian};
  Eigen::MatrixXd const J = provider.jacobian(system, x, system.evaluate(x));

  expectMatrixNear(J, Eigen::MatrixXd{smoothFunctionJacobian(x)}, 0.0);
}

TEST(AnalyticalJacobian, EmptyCallable_Throws)
{
  EXPECT_THROW(AnalyticalJacobian{AnalyticalJacobian::Function{}},
               std::invalid_argument);
}

}  // namespace test
}  // namespace mbs_sim
