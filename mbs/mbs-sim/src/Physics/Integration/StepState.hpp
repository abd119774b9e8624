// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_PHYSICS_STEP_STATE_HPP
#define MBS_SIM_PHYSICS_STEP_STATE_HPP

#include <Eigen/Dense>

#include <vector>

#include "mbs-sim/src/Physics/Integration/ActiveSet.hpp"
#include "mbs-sim/src/Physics/Integration/GeneralizedAlpha.hpp"

namespace mbs_sim
{

/**
 * @brief Everything carried from one accepted step to the next
 *
 * Produced by the integrator as a value; a step never modifies its input
 * state. The time-stepping driver owns the only mutable slot holding the
 * current StepState.
 *
 * @ticket 0001_generalized_alpha_dae
 */
struct StepState
{
  double t{0.0};
  Eigen::VectorXd q;
  Eigen::VectorXd u;
  Eigen::VectorXd qDot;
  Eigen::VectorXd uDot;

  AlphaHistory history;  // y = (q, u), ẏ, v

  Eigen::VectorXd laN;     // Contact forces λ_N of the step
  Eigen::VectorXd laNBar;  // Filtered contact forces λ̄_N

  Eigen::VectorXd x;  // Converged unknowns, warm start of the next step
  std::vector<ContactMode> contactModes;

  int iterations{0};  // Newton updates of the step
  double error{0.0};  // Final residual error
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_STEP_STATE_HPP
