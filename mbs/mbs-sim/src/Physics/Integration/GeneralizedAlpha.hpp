// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_PHYSICS_GENERALIZED_ALPHA_HPP
#define MBS_SIM_PHYSICS_GENERALIZED_ALPHA_HPP

#include <Eigen/Dense>

namespace mbs_sim
{

/**
 * @brief Generalized-alpha coefficients derived from ρ∞
 *
 *   α_m = (2ρ∞ - 1)/(ρ∞ + 1)
 *   α_f = ρ∞/(ρ∞ + 1)
 *   γ   = 1/2 + α_f - α_m
 *   β   = 0.25 (γ + 0.5)²
 *
 * ρ∞ = 1 gives the undamped scheme, ρ∞ = 0 asymptotic annihilation of the
 * highest frequencies.
 */
struct GeneralizedAlphaParameters
{
  double rhoInf{1.0};
  double alphaM{0.5};
  double alphaF{0.5};
  double gamma{0.5};
  double beta{0.25};

  /**
   * @throws std::invalid_argument if rhoInf is outside [0, 1]
   */
  [[nodiscard]] static GeneralizedAlphaParameters fromSpectralRadius(
    double rhoInf);
};

/**
 * @brief First-order state y = (q, u), its derivative ẏ and the auxiliary
 * acceleration-like variable v carried between steps
 */
struct AlphaHistory
{
  Eigen::VectorXd y;
  Eigen::VectorXd yDot;
  Eigen::VectorXd v;
};

/**
 * @brief First-order generalized-alpha update rule
 *
 *   v_{k+1} = (α_f ẏ_k + (1-α_f) ẏ_{k+1} - α_m v_k) / (1-α_m)
 *   y_{k+1} = y_k + dt ((1-γ) v_k + γ v_{k+1})
 *
 * History values are never modified: evaluate() is the trial evaluation
 * used inside Newton, commit() builds the history of the accepted step.
 *
 * The same blend filters the contact forces:
 *   λ̄_{k+1} = (α_f λ_k + (1-α_f) λ_{k+1} - α_m λ̄_k) / (1-α_m)
 *   P_N      = Λ_N + dt ((1-γ) λ̄_k + γ λ̄_{k+1})
 *   κ̂_N      = κ_N + dt² ((0.5-β) λ̄_k + β λ̄_{k+1})
 *
 * @ticket 0001_generalized_alpha_dae
 */
class GeneralizedAlphaUpdate
{
public:
  struct Trial
  {
    Eigen::VectorXd y;
    Eigen::VectorXd v;
  };

  /**
   * @throws std::invalid_argument if dt <= 0
   */
  GeneralizedAlphaUpdate(const GeneralizedAlphaParameters& parameters,
                         double dt);

  [[nodiscard]] Trial evaluate(const AlphaHistory& history,
                               const Eigen::VectorXd& yDotNext) const;

  /**
   * @brief History of the accepted step (y_{k+1}, ẏ_{k+1}, v_{k+1})
   */
  [[nodiscard]] AlphaHistory commit(const AlphaHistory& history,
                                    const Eigen::VectorXd& yDotNext) const;

  /**
   * @brief Filtered multiplier λ̄_{k+1}
   */
  [[nodiscard]] Eigen::VectorXd filterMultiplier(
    const Eigen::VectorXd& laPrevious,
    const Eigen::VectorXd& laBarPrevious,
    const Eigen::VectorXd& laNext) const;

  /**
   * @brief Accumulated impulse P_N
   */
  [[nodiscard]] Eigen::VectorXd impulse(const Eigen::VectorXd& La,
                                        const Eigen::VectorXd& laBarPrevious,
                                        const Eigen::VectorXd& laBarNext) const;

  /**
   * @brief Position-level quantity κ̂_N
   */
  [[nodiscard]] Eigen::VectorXd positionImpulse(
    const Eigen::VectorXd& kappa,
    const Eigen::VectorXd& laBarPrevious,
    const Eigen::VectorXd& laBarNext) const;

  [[nodiscard]] const GeneralizedAlphaParameters& parameters() const
  {
    return parameters_;
  }

  [[nodiscard]] double dt() const
  {
    return dt_;
  }

private:
  GeneralizedAlphaParameters parameters_;
  double dt_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_GENERALIZED_ALPHA_HPP
