// Ticket: 0003_system_assembly

#ifndef MBS_SIM_PHYSICS_BILATERAL_CONSTRAINT_HPP
#define MBS_SIM_PHYSICS_BILATERAL_CONSTRAINT_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <vector>

#include "mbs-sim/src/Physics/Constraints/Constraint.hpp"

namespace mbs_sim
{

/**
 * @brief Holonomic constraint g(t, q) = 0 with unbounded multipliers
 *
 * Provides the constraint at position, velocity and acceleration level:
 *   ġ = W_g^T u (+ ∂g/∂t),  g̈ = W_g^T u̇ + ζ_g(t, q, u)
 *
 * @ticket 0003_system_assembly
 */
class BilateralConstraint : public Constraint
{
public:
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

  /**
   * @brief Append the columns of W_g owned by this constraint
   */
  virtual void addWg(double t,
                     const Eigen::VectorXd& q,
                     std::vector<Eigen::Triplet<double>>& triplets) const = 0;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_BILATERAL_CONSTRAINT_HPP
