// Ticket: 0005_nonholonomic_constraints

#ifndef MBS_SIM_PHYSICS_NONHOLONOMIC_CONSTRAINT_HPP
#define MBS_SIM_PHYSICS_NONHOLONOMIC_CONSTRAINT_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <vector>

#include "mbs-sim/src/Physics/Constraints/Constraint.hpp"

namespace mbs_sim
{

/**
 * @brief Velocity-level constraint γ(t, q, u) = W_γ^T u + χ(t, q) = 0
 *
 * @ticket 0005_nonholonomic_constraints
 */
class NonholonomicConstraint : public Constraint
{
public:
  [[nodiscard]] virtual Eigen::VectorXd gamma(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::VectorXd gammaDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const = 0;

  /**
   * @brief Append the columns of W_γ owned by this constraint
   */
  virtual void addWgamma(
    double t,
    const Eigen::VectorXd& q,
    std::vector<Eigen::Triplet<double>>& triplets) const = 0;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_NONHOLONOMIC_CONSTRAINT_HPP
