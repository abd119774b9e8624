// Ticket: 0002_newton_solver

#ifndef MBS_SIM_PHYSICS_JACOBIAN_PROVIDER_HPP
#define MBS_SIM_PHYSICS_JACOBIAN_PROVIDER_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <cstdint>
#include <functional>

#include "mbs-sim/src/Physics/Solver/NonlinearSystem.hpp"

namespace mbs_sim
{

/**
 * @brief Source of the iteration matrix dR/dx for NewtonSolver
 *
 * A fresh sparse matrix is produced on every call; providers keep no
 * factorization or pattern between iterations.
 *
 * @ticket 0002_newton_solver
 */
class JacobianProvider
{
public:
  virtual ~JacobianProvider() = default;

  /**
   * @brief Compute the Jacobian of system at x
   * @param system Residual function (only evaluate() is called)
   * @param x Current iterate
   * @param fx Residual already evaluated at x
   * @return Square sparse Jacobian
   */
  [[nodiscard]] virtual Eigen::SparseMatrix<double> jacobian(
    const NonlinearSystem& system,
    const Eigen::VectorXd& x,
    const Eigen::VectorXd& fx) const = 0;

protected:
  JacobianProvider() = default;
  JacobianProvider(const JacobianProvider&) = default;
  JacobianProvider& operator=(const JacobianProvider&) = default;
  JacobianProvider(JacobianProvider&&) noexcept = default;
  JacobianProvider& operator=(JacobianProvider&&) noexcept = default;
};

enum class DifferenceScheme : std::uint8_t
{
  Forward,  // "2-point": one extra residual per column
  Central   // two extra residuals per column, O(h^2) accurate
};

/**
 * @brief Column-wise finite difference approximation of dR/dx
 *
 * The perturbation for column j is h_j = step * max(1, |x_j|). When no step
 * is given, sqrt(eps) is used for forward and cbrt(eps) for central
 * differences.
 *
 * @ticket 0002_newton_solver
 */
class FiniteDifferenceJacobian final : public JacobianProvider
{
public:
  explicit FiniteDifferenceJacobian(
    DifferenceScheme scheme = DifferenceScheme::Forward,
    double relativeStep = 0.0);

  [[nodiscard]] Eigen::SparseMatrix<double> jacobian(
    const NonlinearSystem& system,
    const Eigen::VectorXd& x,
    const Eigen::VectorXd& fx) const override;

  [[nodiscard]] DifferenceScheme scheme() const
  {
    return scheme_;
  }

  [[nodiscard]] double relativeStep() const
  {
    return relative_step_;
  }

private:
  DifferenceScheme scheme_;
  double relative_step_;
};

/**
 * @brief Jacobian supplied by a user callable
 */
class AnalyticalJacobian final : public JacobianProvider
{
public:
  using Function =
    std::function<Eigen::SparseMatrix<double>(const Eigen::VectorXd&)>;

  explicit AnalyticalJacobian(Function function);

  [[nodiscard]] Eigen::SparseMatrix<double> jacobian(
    const NonlinearSystem& system,
    const Eigen::VectorXd& x,
    const Eigen::VectorXd& fx) const override;

private:
  Function function_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_JACOBIAN_PROVIDER_HPP
