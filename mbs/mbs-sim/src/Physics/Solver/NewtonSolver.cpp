// Ticket: 0002_newton_solver

#include "mbs-sim/src/Physics/Solver/NewtonSolver.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "mbs-sim/src/Physics/Solver/SparseLinearSolver.hpp"

namespace mbs_sim
{

double NewtonSolver::maxAbsError(const Eigen::VectorXd& residual)
{
  if (residual.size() == 0)
  {
    return 0.0;
  }
  return residual.lpNorm<Eigen::Infinity>();
}

NewtonSolver::NewtonSolver(Settings settings) : settings_{std::move(settings)}
{
  if (!(settings_.atol > 0.0))
  {
    throw std::invalid_argument(
      "NewtonSolver: atol must be positive, got " +
      std::to_string(settings_.atol));
  }
  if (settings_.maxIterations < 1)
  {
    throw std::invalid_argument(
      "NewtonSolver: maxIterations must be at least 1, got " +
      std::to_string(settings_.maxIterations));
  }
  if (!settings_.errorFunction)
  {
    throw std::invalid_argument("NewtonSolver: empty error function");
  }
}

NewtonSolver::Result NewtonSolver::solve(NonlinearSystem& system,
                                         const Eigen::VectorXd& x0,
                                         const JacobianProvider& jacobian) const
{
  const auto& errorOf = settings_.errorFunction;

  Result result;
  result.x = x0;

  system.updateDiscreteState(result.x);
  result.residual = system.evaluate(result.x);
  result.error = errorOf(result.residual);

  // Convergence needs a small residual and the system's approval. A rejected
  // solution changed the discrete state, so the residual is re-evaluated.
  auto hasConverged = [&]()
  {
    if (!(result.error <= settings_.atol))
    {
      return false;
    }
    if (system.confirmSolution(result.x))
    {
      return true;
    }
    result.residual = system.evaluate(result.x);
    result.error = errorOf(result.residual);
    return false;
  };

  result.converged = hasConverged();

  while (!result.converged && result.iterations < settings_.maxIterations)
  {
    const Eigen::SparseMatrix<double> J =
      jacobian.jacobian(system, result.x, result.residual);

    const auto dx = SparseLinearSolver::solve(J, result.residual);
    if (!dx)
    {
      break;
    }

    Eigen::VectorXd xNext = result.x - *dx;
    if (settings_.lineSearch)
    {
      double lambda = 1.0;
      for (int halving = 0; halving < settings_.lineSearchMaxHalvings;
           ++halving)
      {
        if (errorOf(system.evaluate(xNext)) < result.error)
        {
          break;
        }
        lambda *= 0.5;
        xNext = result.x - lambda * (*dx);
      }
    }

    result.x = std::move(xNext);
    ++result.iterations;

    system.updateDiscreteState(result.x);
    result.residual = system.evaluate(result.x);
    result.error = errorOf(result.residual);
    result.converged = hasConverged();
  }

  return result;
}

}  // namespace mbs_sim
