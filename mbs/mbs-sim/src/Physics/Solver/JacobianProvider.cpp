// Ticket: 0002_newton_solver

#include "mbs-sim/src/Physics/Solver/JacobianProvider.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mbs_sim
{

FiniteDifferenceJacobian::FiniteDifferenceJacobian(DifferenceScheme scheme,
                                                   double relativeStep)
  : scheme_{scheme}, relative_step_{relativeStep}
{
  if (relative_step_ < 0.0 || !std::isfinite(relative_step_))
  {
    throw std::invalid_argument(
      "FiniteDifferenceJacobian: step must be non-negative and finite, got " +
      std::to_string(relativeStep));
  }
  if (relative_step_ == 0.0)
  {
    constexpr double eps = std::numeric_limits<double>::epsilon();
    relative_step_ =
      scheme_ == DifferenceScheme::Forward ? std::sqrt(eps) : std::cbrt(eps);
  }
}

Eigen::SparseMatrix<double> FiniteDifferenceJacobian::jacobian(
  const NonlinearSystem& system,
  const Eigen::VectorXd& x,
  const Eigen::VectorXd& fx) const
{
  const auto n = x.size();
  const auto m = fx.size();

  std::vector<Eigen::Triplet<double>> triplets;
  Eigen::VectorXd xPerturbed = x;

  for (Eigen::Index j = 0; j < n; ++j)
  {
    const double h = relative_step_ * std::max(1.0, std::abs(x(j)));

    Eigen::VectorXd column;
    if (scheme_ == DifferenceScheme::Forward)
    {
      xPerturbed(j) = x(j) + h;
      column = (system.evaluate(xPerturbed) - fx) / h;
    }
    else
    {
      xPerturbed(j) = x(j) + h;
      const Eigen::VectorXd fPlus = system.evaluate(xPerturbed);
      xPerturbed(j) = x(j) - h;
      const Eigen::VectorXd fMinus = system.evaluate(xPerturbed);
      column = (fPlus - fMinus) / (2.0 * h);
    }
    xPerturbed(j) = x(j);

    for (Eigen::Index i = 0; i < m; ++i)
    {
      if (column(i) != 0.0)
      {
        triplets.emplace_back(
          static_cast<int>(i), static_cast<int>(j), column(i));
      }
    }
  }

  Eigen::SparseMatrix<double> J(m, n);
  J.setFromTriplets(triplets.begin(), triplets.end());
  return J;
}

AnalyticalJacobian::AnalyticalJacobian(Function function)
  : function_{std::move(function)}
{
  if (!function_)
  {
    throw std::invalid_argument("AnalyticalJacobian: empty callable");
  }
}

Eigen::SparseMatrix<double> AnalyticalJacobian::jacobian(
  const NonlinearSystem& /* system */,
  const Eigen::VectorXd& x,
  const Eigen::VectorXd& /* fx */) const
{
  return function_(x);
}

}  // namespace mbs_sim
