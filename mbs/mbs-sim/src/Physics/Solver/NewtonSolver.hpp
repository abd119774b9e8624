// Ticket: 0002_newton_solver

#ifndef MBS_SIM_PHYSICS_NEWTON_SOLVER_HPP
#define MBS_SIM_PHYSICS_NEWTON_SOLVER_HPP

#include <Eigen/Dense>

#include <functional>
#include <limits>

#include "mbs-sim/src/Physics/Solver/JacobianProvider.hpp"
#include "mbs-sim/src/Physics/Solver/NonlinearSystem.hpp"

namespace mbs_sim
{

/**
 * @brief Newton-Raphson iteration x <- x - J(x)^-1 R(x)
 *
 * Iterates until errorFunction(R) <= atol or maxIterations updates have been
 * performed. The Jacobian comes from a JacobianProvider and is solved with
 * SparseLU every iteration.
 *
 * Optional damping: a backtracking line search halves the step until the
 * error decreases (at most lineSearchMaxHalvings times). Trial points are
 * evaluated without touching the system's discrete state.
 *
 * Error handling: Never throws on non-convergence; returns converged=false.
 * A singular Jacobian also ends the iteration with converged=false.
 *
 * @ticket 0002_newton_solver
 */
class NewtonSolver
{
public:
  using ErrorFunction = std::function<double(const Eigen::VectorXd&)>;

  /**
   * @brief Default error measure: max-abs norm (0 for an empty residual)
   */
  static double maxAbsError(const Eigen::VectorXd& residual);

  struct Settings
  {
    double atol{1e-8};
    int maxIterations{40};
    bool lineSearch{false};
    int lineSearchMaxHalvings{10};
    ErrorFunction errorFunction{&NewtonSolver::maxAbsError};
  };

  struct Result
  {
    Eigen::VectorXd x;         // Final iterate
    Eigen::VectorXd residual;  // Residual at x
    bool converged{false};
    int iterations{0};  // Newton updates performed
    double error{std::numeric_limits<double>::quiet_NaN()};

    Result() = default;
  };

  NewtonSolver() = default;
  explicit NewtonSolver(Settings settings);

  /**
   * @brief Solve system(x) = 0 starting from x0
   * @param system Residual with optional discrete state hooks
   * @param x0 Initial guess (warm start)
   * @param jacobian Jacobian provider
   * @return Result with convergence flag and statistics
   */
  [[nodiscard]] Result solve(NonlinearSystem& system,
                             const Eigen::VectorXd& x0,
                             const JacobianProvider& jacobian) const;

  [[nodiscard]] const Settings& settings() const
  {
    return settings_;
  }

private:
  Settings settings_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_NEWTON_SOLVER_HPP
