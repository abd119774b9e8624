// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_MODEL_MODEL_HPP
#define MBS_SIM_MODEL_MODEL_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <utility>

namespace mbs_sim
{

/**
 * @brief Physics provider consumed by the integrator
 *
 * A Model describes a constrained mechanical system
 *
 *   q̇ = q̇(t, q, u)
 *   M(t, q) u̇ = h(t, q, u) + W_g la_g + W_γ la_γ + W_N la_N
 *   g(t, q) = 0,  γ(t, q, u) = 0,  0 <= g_N(t, q) ⊥ la_N >= 0
 *
 * All methods are deterministic functions of their arguments. The integrator
 * holds the model by const reference and never mutates it; stepCallback()
 * returns a corrected state instead of modifying anything.
 *
 * Matrix conventions:
 * - M: nu x nu, symmetric positive definite
 * - B: nq x nu, maps velocity-space quantities to q̇-space (q̇ = B u for
 *   models without rheonomic terms)
 * - W_g, W_γ, W_N: nu x nla_*, generalized force directions
 *
 * @ticket 0001_generalized_alpha_dae
 */
class Model
{
public:
  virtual ~Model() = default;

  // ===== Dimensions =====

  [[nodiscard]] virtual int nq() const = 0;
  [[nodiscard]] virtual int nu() const = 0;
  [[nodiscard]] virtual int nlaG() const = 0;
  [[nodiscard]] virtual int nlaGamma() const = 0;
  [[nodiscard]] virtual int nlaN() const = 0;

  // ===== Initial values =====

  [[nodiscard]] virtual double t0() const = 0;
  [[nodiscard]] virtual Eigen::VectorXd q0() const = 0;
  [[nodiscard]] virtual Eigen::VectorXd u0() const = 0;
  [[nodiscard]] virtual Eigen::VectorXd laG0() const = 0;
  [[nodiscard]] virtual Eigen::VectorXd laGamma0() const = 0;
  [[nodiscard]] virtual Eigen::VectorXd laN0() const = 0;

  // ===== Equations of motion =====

  [[nodiscard]] virtual Eigen::SparseMatrix<double> M(
    double t,
    const Eigen::VectorXd& q) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd h(double t,
                                          const Eigen::VectorXd& q,
                                          const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd qDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::SparseMatrix<double> B(
    double t,
    const Eigen::VectorXd& q) const = 0;

  // ===== Bilateral holonomic constraints =====

  [[nodiscard]] virtual Eigen::VectorXd g(double t,
                                          const Eigen::VectorXd& q) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd gDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd gDDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const = 0;

  [[nodiscard]] virtual Eigen::SparseMatrix<double> Wg(
    double t,
    const Eigen::VectorXd& q) const = 0;

  // ===== Bilateral non-holonomic constraints =====

  [[nodiscard]] virtual Eigen::VectorXd gamma(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd gammaDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const = 0;

  [[nodiscard]] virtual Eigen::SparseMatrix<double> Wgamma(
    double t,
    const Eigen::VectorXd& q) const = 0;

  // ===== Unilateral normal contacts =====

  [[nodiscard]] virtual Eigen::VectorXd gN(double t,
                                           const Eigen::VectorXd& q) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd gNDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd gNDDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const = 0;

  /**
   * @brief Impact-law velocity measure ġ_N(u) + e_N ġ_N(u_previous)
   * @param uPrevious Velocity at the start of the step
   * @param u Velocity at the end of the step
   */
  [[nodiscard]] virtual Eigen::VectorXd xiN(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& uPrevious,
    const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::SparseMatrix<double> WN(
    double t,
    const Eigen::VectorXd& q) const = 0;

  /**
   * @brief Positive prox parameters r_N, one per contact
   */
  [[nodiscard]] virtual Eigen::VectorXd proxRN() const = 0;

  // ===== Hooks =====

  /**
   * @brief Post-step correction applied to every accepted state
   * @return Corrected (q, u)
   */
  [[nodiscard]] virtual std::pair<Eigen::VectorXd, Eigen::VectorXd>
  stepCallback(double /* t */,
               const Eigen::VectorXd& q,
               const Eigen::VectorXd& u) const
  {
    return {q, u};
  }

protected:
  Model() = default;
  Model(const Model&) = default;
  Model& operator=(const Model&) = default;
  Model(Model&&) noexcept = default;
  Model& operator=(Model&&) noexcept = default;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_MODEL_MODEL_HPP
