// Ticket: 0006_contact_active_set

#ifndef MBS_SIM_PHYSICS_UNILATERAL_CONSTRAINT_HPP
#define MBS_SIM_PHYSICS_UNILATERAL_CONSTRAINT_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <vector>

#include "mbs-sim/src/Physics/Constraints/Constraint.hpp"

namespace mbs_sim
{

/**
 * @brief Frictionless normal contact g_N(t, q) >= 0, la_N >= 0, g_N·la_N = 0
 *
 * Besides the gap and its derivatives a contact provides its Newton impact
 * law through restitution() and the positive prox parameter r_N used to
 * decide the active set.
 *
 * @ticket 0006_contact_active_set
 */
class UnilateralConstraint : public Constraint
{
public:
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
   * @brief Append the columns of W_N owned by this contact
   */
  virtual void addWN(double t,
                     const Eigen::VectorXd& q,
                     std::vector<Eigen::Triplet<double>>& triplets) const = 0;

  /**
   * @brief Impact-law measure ξ_N = ġ_N(u) + e_N ġ_N(uPrevious)
   */
  [[nodiscard]] Eigen::VectorXd xiN(double t,
                                    const Eigen::VectorXd& q,
                                    const Eigen::VectorXd& uPrevious,
                                    const Eigen::VectorXd& u) const
  {
    return gNDot(t, q, u) + restitution() * gNDot(t, q, uPrevious);
  }

  /**
   * @brief Newton restitution coefficient e_N in [0, 1]
   */
  [[nodiscard]] virtual double restitution() const = 0;

  /**
   * @brief Prox parameter r_N > 0
   */
  [[nodiscard]] virtual double proxR() const = 0;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_UNILATERAL_CONSTRAINT_HPP
