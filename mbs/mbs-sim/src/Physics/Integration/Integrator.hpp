// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_PHYSICS_INTEGRATOR_HPP
#define MBS_SIM_PHYSICS_INTEGRATOR_HPP

#include "mbs-sim/src/Physics/Integration/StepState.hpp"
#include "mbs-sim/src/Physics/Integration/Trajectory.hpp"

namespace mbs_sim
{

/**
 * @brief Abstract interface of a one-step integration scheme
 *
 * Decouples the time-stepping driver from the scheme:
 * - initialState() is fixed at construction
 * - step() maps an accepted state to the next one without modifying it
 * - snapshot() extracts the recorded quantities of a state
 *
 * Error handling: step() throws ConvergenceFailure (or a subclass) when the
 * step cannot be completed.
 *
 * @ticket 0001_generalized_alpha_dae
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  [[nodiscard]] virtual const StepState& initialState() const = 0;

  /**
   * @brief Advance by one time step
   * @param current Accepted state at t_k
   * @return Accepted state at t_k + dt
   */
  [[nodiscard]] virtual StepState step(const StepState& current) const = 0;

  [[nodiscard]] virtual Snapshot snapshot(const StepState& state) const = 0;

  /**
   * @brief Fixed step size dt [s]
   */
  [[nodiscard]] virtual double timeStep() const = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_INTEGRATOR_HPP
