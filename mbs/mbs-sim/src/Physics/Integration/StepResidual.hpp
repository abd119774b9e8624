// Ticket: 0001_generalized_alpha_dae
// Ticket: 0006_contact_active_set

#ifndef MBS_SIM_PHYSICS_STEP_RESIDUAL_HPP
#define MBS_SIM_PHYSICS_STEP_RESIDUAL_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <Eigen/SparseCholesky>

#include <vector>

#include "mbs-sim/src/Model/Model.hpp"
#include "mbs-sim/src/Physics/Integration/ActiveSet.hpp"
#include "mbs-sim/src/Physics/Integration/GeneralizedAlpha.hpp"
#include "mbs-sim/src/Physics/Integration/StepState.hpp"
#include "mbs-sim/src/Physics/Integration/UnknownLayout.hpp"
#include "mbs-sim/src/Physics/Solver/NonlinearSystem.hpp"

namespace mbs_sim
{

/**
 * @brief Residual R(x) of one generalized-alpha step
 *
 * For a trial x = [q̇, u̇, κ_g, Λ_g, λ_g, Λ_γ, λ_γ, κ_N, Λ_N, λ_N] the state
 * at t_{k+1} is reconstructed with the update rule,
 *
 *   (q, u^α) = y_{k+1}(ẏ = (q̇, u̇))
 *   u        = u^α + M(q)^-1 (W_g Λ_g + W_γ Λ_γ + W_N Λ_N)
 *
 * The velocity jump acts on the state only; the history receives the rate
 * (q̇, u̇) unchanged. The residual blocks are (see UnknownLayout for which
 * are present)
 *
 *   q̇ - q̇(t, q, u^α) - B (W_g κ_g + W_N κ_N)
 *   M u̇ - h - W_g λ_g - W_γ λ_γ - W_N λ_N
 *   g, ġ, g̈          bilateral levels
 *   γ, γ̇             non-holonomic levels
 *   contact rows      g_N | κ̂_N,  ξ_N | P_N,  g̈_N | λ_N  by contact mode
 *
 * Active-set policy: before the first evaluation and after every Newton
 * update the contact modes are re-classified at the iterate, until two
 * consecutive classifications agree; from then on they are frozen for the
 * step. A converged iterate is accepted only if classifying it reproduces
 * the frozen modes, otherwise the modes are replaced and unfrozen.
 * Evaluation itself never changes the modes, so repeated evaluation at the
 * same x returns identical residuals.
 *
 * A contact whose modes keep alternating between two classifications (the
 * four most recent classifications read a, b, a, b) has no mode that
 * reproduces itself at the current step size. The modes are then pinned to
 * the per-contact wider of the two, and a converged iterate is accepted as
 * long as its classification stays within the pinned modes.
 *
 * M(q) and its factorization are kept for the most recent q. Finite
 * difference columns that leave q unchanged (every column but q̇) reuse
 * them.
 *
 * Lifetime: model, layout, update and previous must outlive the residual.
 *
 * @ticket 0001_generalized_alpha_dae
 * @ticket 0006_contact_active_set
 */
class StepResidual final : public NonlinearSystem
{
public:
  /**
   * @brief State at t_{k+1} reconstructed from a trial x
   */
  struct Evaluation
  {
    Unknowns unknowns;
    Eigen::VectorXd q;        // Including the position correction
    Eigen::VectorXd u;        // Including the velocity jump
    Eigen::VectorXd uSmooth;  // u^α
    Eigen::VectorXd yDot;     // (q̇, u̇), the rate committed to the history
    Eigen::SparseMatrix<double> M;
    Eigen::VectorXd laNBar;   // λ̄_N at t_{k+1}
    ContactQuantities contact;
  };

  StepResidual(const Model& model,
               const UnknownLayout& layout,
               const GeneralizedAlphaUpdate& update,
               const StepState& previous);

  [[nodiscard]] Eigen::VectorXd evaluate(
    const Eigen::VectorXd& x) const override;

  void updateDiscreteState(const Eigen::VectorXd& x) override;

  [[nodiscard]] bool confirmSolution(const Eigen::VectorXd& x) override;

  /**
   * @brief Reconstruct the state at t_{k+1}
   * @throws std::runtime_error if the mass matrix cannot be factorized
   */
  [[nodiscard]] Evaluation reconstruct(const Eigen::VectorXd& x) const;

  [[nodiscard]] double time() const
  {
    return t_;
  }

  [[nodiscard]] const std::vector<ContactMode>& contactModes() const
  {
    return modes_;
  }

  /**
   * @brief Impose contact modes and freeze them
   * @throws std::invalid_argument on size mismatch
   */
  void freezeContactModes(std::vector<ContactMode> modes);

  [[nodiscard]] bool activeSetFrozen() const
  {
    return frozen_;
  }

  /**
   * @brief True if the modes were pinned after alternating
   */
  [[nodiscard]] bool activeSetPinned() const
  {
    return pinned_;
  }

  /**
   * @brief Frozen on a classification that reproduced itself
   */
  [[nodiscard]] bool activeSetSettled() const
  {
    return frozen_ && !pinned_;
  }

  /**
   * @brief Number of contact classifications performed so far
   */
  [[nodiscard]] int classificationCount() const
  {
    return static_cast<int>(classifications_.size());
  }

  /**
   * @brief Number of mass matrix factorizations performed so far
   */
  [[nodiscard]] int massFactorizations() const
  {
    return mass_factorizations_;
  }

  /**
   * @brief Number of converged iterates rejected by confirmSolution()
   */
  [[nodiscard]] int rejectedSolutions() const
  {
    return rejected_solutions_;
  }

private:
  struct MassCache
  {
    Eigen::VectorXd q;
    Eigen::SparseMatrix<double> M;
    Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> ldlt;
    bool factorized{false};
  };

  // Classifies x and appends the result to the classification record
  std::vector<ContactMode> classify(const Eigen::VectorXd& x);

  [[nodiscard]] bool alternating() const;

  void pin(std::vector<ContactMode> modes);

  [[nodiscard]] const Eigen::SparseMatrix<double>& massMatrix(
    const Eigen::VectorXd& q) const;

  // M(q)^-1 rhs for the q of the last massMatrix() call
  [[nodiscard]] Eigen::VectorXd solveMass(const Eigen::VectorXd& rhs) const;

  const Model& model_;
  const UnknownLayout& layout_;
  const GeneralizedAlphaUpdate& update_;
  const StepState& previous_;
  double t_;

  std::vector<ContactMode> modes_;
  std::vector<std::vector<ContactMode>> classifications_;
  bool classified_{false};
  bool frozen_{false};
  bool pinned_{false};
  int rejected_solutions_{0};

  mutable MassCache mass_;
  mutable int mass_factorizations_{0};
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_STEP_RESIDUAL_HPP
