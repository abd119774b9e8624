// Ticket: 0005_nonholonomic_constraints

#ifndef MBS_SIM_PHYSICS_KNIFE_EDGE_CONSTRAINT_HPP
#define MBS_SIM_PHYSICS_KNIFE_EDGE_CONSTRAINT_HPP

#include <Eigen/Dense>

#include "mbs-sim/src/Physics/Constraints/NonholonomicConstraint.hpp"

namespace mbs_sim
{

class RigidBody2D;

/**
 * @brief Knife edge (skate) on a planar rigid body
 *
 * The contact point P may not slide sideways: with the body heading
 * e(φ) = (cos φ, sin φ, 0) and the lateral direction n(φ) = (-sin φ, cos φ, 0)
 *
 *   γ  = n·v_P
 *   γ̇ = n·a_P - ω e·v_P
 *   W_γ = J_P^T n
 *
 * @ticket 0005_nonholonomic_constraints
 */
class KnifeEdgeConstraint final : public NonholonomicConstraint
{
public:
  /**
   * @param body Planar body carrying the edge
   * @param localPoint Contact point in body coordinates
   */
  explicit KnifeEdgeConstraint(
    const RigidBody2D& body,
    const Eigen::Vector3d& localPoint = Eigen::Vector3d::Zero());

  [[nodiscard]] int dimension() const override
  {
    return 1;
  }

  [[nodiscard]] Eigen::VectorXd gamma(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const override;

  [[nodiscard]] Eigen::VectorXd gammaDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const override;

  void addWgamma(double t,
                 const Eigen::VectorXd& q,
                 std::vector<Eigen::Triplet<double>>& triplets) const override;

private:
  [[nodiscard]] double heading(const Eigen::VectorXd& q) const;
  [[nodiscard]] double angularVelocity(const Eigen::VectorXd& u) const;

  const RigidBody2D& body_;
  Eigen::Vector3d local_point_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_KNIFE_EDGE_CONSTRAINT_HPP
