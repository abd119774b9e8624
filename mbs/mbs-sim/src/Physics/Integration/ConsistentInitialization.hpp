// Ticket: 0007_consistent_initialization

#ifndef MBS_SIM_PHYSICS_CONSISTENT_INITIALIZATION_HPP
#define MBS_SIM_PHYSICS_CONSISTENT_INITIALIZATION_HPP

#include <Eigen/Dense>

#include "mbs-sim/src/Model/Model.hpp"
#include "mbs-sim/src/Physics/Integration/StepState.hpp"
#include "mbs-sim/src/Physics/Integration/UnknownLayout.hpp"

namespace mbs_sim
{

/**
 * @brief Initial accelerations and multipliers consistent with q0, u0
 *
 * Solves the saddle point system
 *
 *   [ M     -W_g  -W_γ ] [ u̇0    ]   [ h + W_N λ_N0 ]
 *   [ W_g^T  0     0   ] [ λ_g0  ] = [ -ζ_g          ]
 *   [ W_γ^T  0     0   ] [ λ_γ0  ]   [ -ζ_γ          ]
 *
 * with ζ_g = g̈(t0, q0, u0, 0) and ζ_γ = γ̇(t0, q0, u0, 0), then verifies g,
 * ġ, g̈, γ, γ̇ against tolerance and g_N >= -tolerance.
 *
 * The returned state starts the generalized-alpha recursion with
 * y0 = (q0, u0), ẏ0 = (q̇0, u̇0), v0 = ẏ0 and λ̄_N0 = λ_N0. Its x, the warm
 * start of the first step, holds q̇0, u̇0, λ_g0, λ_γ0 and λ_N0; all κ and Λ
 * entries are zero.
 *
 * @param model Assembled model
 * @param layout Unknown layout of the chosen formulation
 * @param tolerance Absolute tolerance of the consistency checks
 * @return Initial StepState
 * @throws InconsistentInitialConditions if the saddle point system is
 *         singular or a check fails
 *
 * @ticket 0007_consistent_initialization
 */
[[nodiscard]] StepState makeConsistentInitialState(const Model& model,
                                                   const UnknownLayout& layout,
                                                   double tolerance);

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_CONSISTENT_INITIALIZATION_HPP
