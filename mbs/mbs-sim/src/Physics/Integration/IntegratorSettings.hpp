// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_PHYSICS_INTEGRATOR_SETTINGS_HPP
#define MBS_SIM_PHYSICS_INTEGRATOR_SETTINGS_HPP

#include <cstdint>

namespace mbs_sim
{

/**
 * @brief Differentiation level at which bilateral constraints enter the
 * residual
 *
 * Three: g (position), Two: ġ (velocity), One: g̈ (acceleration).
 */
enum class DAEIndex : std::uint8_t
{
  One = 1,
  Two = 2,
  Three = 3
};

enum class JacobianScheme : std::uint8_t
{
  ForwardDifference,  // "2-point"
  CentralDifference,
  Custom  // provider installed with setJacobianProvider()
};

/**
 * @brief Configuration of GeneralizedAlphaIntegrator
 *
 * Defaults mirror a typical contact simulation: ρ∞ = 0.5, atol = 1e-8,
 * 40 Newton iterations, index 2 with GGL stabilization. Larger ρ∞ keeps
 * more high-frequency content and can make the contact active set chatter.
 *
 * @ticket 0001_generalized_alpha_dae
 */
struct IntegratorSettings
{
  double dt{1e-3};                       // Time step [s]
  double rhoInf{0.5};                    // Spectral radius at infinity
  double atol{1e-8};                     // Newton tolerance (max-abs)
  int maxIterations{40};                 // Newton iteration limit per step
  DAEIndex daeIndex{DAEIndex::Two};
  bool useGGL{true};                     // Stabilize with position level
  JacobianScheme jacobian{JacobianScheme::ForwardDifference};
  double finiteDifferenceStep{0.0};      // 0: scheme default
  bool lineSearch{false};
  double initialConsistencyTolerance{1e-8};

  /**
   * @brief Check all values
   * @throws std::invalid_argument for the first invalid value
   */
  void validate() const;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_INTEGRATOR_SETTINGS_HPP
