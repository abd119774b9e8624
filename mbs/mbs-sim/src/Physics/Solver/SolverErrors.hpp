// Ticket: 0002_newton_solver

#ifndef MBS_SIM_PHYSICS_SOLVER_ERRORS_HPP
#define MBS_SIM_PHYSICS_SOLVER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mbs_sim
{

/**
 * @brief Thrown when the per-step Newton iteration exhausts its budget
 *
 * Carries the simulation time of the failed step, the number of Newton
 * iterations performed and the last residual error, so callers can report
 * where the integration broke down.
 *
 * @ticket 0002_newton_solver
 */
class ConvergenceFailure : public std::runtime_error
{
public:
  ConvergenceFailure(const std::string& message,
                     double time,
                     int iterations,
                     double error)
    : std::runtime_error{message},
      time_{time},
      iterations_{iterations},
      error_{error}
  {
  }

  [[nodiscard]] double time() const
  {
    return time_;
  }

  [[nodiscard]] int iterations() const
  {
    return iterations_;
  }

  [[nodiscard]] double error() const
  {
    return error_;
  }

private:
  double time_;
  int iterations_;
  double error_;
};

/**
 * @brief Convergence failure during which the contact active set never
 * settled
 *
 * @ticket 0006_contact_active_set
 */
class ActiveSetOscillation : public ConvergenceFailure
{
public:
  using ConvergenceFailure::ConvergenceFailure;
};

/**
 * @brief Thrown before stepping when the initial state violates the
 * constraints at some kinematic level
 *
 * @ticket 0007_consistent_initialization
 */
class InconsistentInitialConditions : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_SOLVER_ERRORS_HPP
