// Ticket: 0002_newton_solver

#ifndef MBS_SIM_PHYSICS_NONLINEAR_SYSTEM_HPP
#define MBS_SIM_PHYSICS_NONLINEAR_SYSTEM_HPP

#include <Eigen/Dense>

#include <functional>
#include <utility>

namespace mbs_sim
{

/**
 * @brief Square nonlinear system R(x) = 0 solved by NewtonSolver
 *
 * evaluate() must be a pure function of x and of the discrete state held by
 * the implementation. Discrete state (e.g. a contact active set) may only
 * change inside updateDiscreteState() and confirmSolution(), which the solver
 * calls at well defined points of the iteration:
 *
 * - updateDiscreteState(x) once before the first residual evaluation and
 *   once after every accepted Newton update
 * - confirmSolution(x) when the residual error drops below tolerance;
 *   returning false rejects convergence and the iteration continues
 *
 * Line-search trial points and finite-difference perturbations only call
 * evaluate().
 *
 * @ticket 0002_newton_solver
 */
class NonlinearSystem
{
public:
  virtual ~NonlinearSystem() = default;

  /**
   * @brief Evaluate the residual at x
   * @param x Unknown vector
   * @return Residual with the same size as x
   */
  [[nodiscard]] virtual Eigen::VectorXd evaluate(
    const Eigen::VectorXd& x) const = 0;

  /**
   * @brief Hook to refresh discrete state at the current iterate
   */
  virtual void updateDiscreteState(const Eigen::VectorXd& /* x */)
  {
  }

  /**
   * @brief Hook to verify a converged iterate
   * @return true to accept convergence
   */
  [[nodiscard]] virtual bool confirmSolution(const Eigen::VectorXd& /* x */)
  {
    return true;
  }

protected:
  NonlinearSystem() = default;
  NonlinearSystem(const NonlinearSystem&) = default;
  NonlinearSystem& operator=(const NonlinearSystem&) = default;
  NonlinearSystem(NonlinearSystem&&) noexcept = default;
  NonlinearSystem& operator=(NonlinearSystem&&) noexcept = default;
};

/**
 * @brief NonlinearSystem backed by a callable without discrete state
 */
class FunctionSystem final : public NonlinearSystem
{
public:
  using Function = std::function<Eigen::VectorXd(const Eigen::VectorXd&)>;

  explicit FunctionSystem(Function function) : function_{std::move(function)}
  {
  }

  [[nodiscard]] Eigen::VectorXd evaluate(
    const Eigen::VectorXd& x) const override
  {
    return function_(x);
  }

private:
  Function function_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_NONLINEAR_SYSTEM_HPP
