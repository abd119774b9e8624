// Ticket: 0003_system_assembly

#ifndef MBS_SIM_PHYSICS_CONSTANT_FORCE_HPP
#define MBS_SIM_PHYSICS_CONSTANT_FORCE_HPP

#include <Eigen/Dense>

#include "mbs-sim/src/Model/BodyPoint.hpp"
#include "mbs-sim/src/Physics/Forces/Force.hpp"

namespace mbs_sim
{

class Body;

/**
 * @brief Constant force F applied at a body point
 *
 * h += J_P^T F, V = -F·r_P
 *
 * @ticket 0003_system_assembly
 */
class ConstantForce : public Force
{
public:
  /**
   * @param point Point of application (must lie on a body)
   * @param force Force in the inertial frame [N]
   * @throws std::invalid_argument if point is a fixed point
   */
  ConstantForce(const BodyPoint& point, const Eigen::Vector3d& force);

  void addGeneralizedForce(double t,
                           const Eigen::VectorXd& q,
                           const Eigen::VectorXd& u,
                           Eigen::VectorXd& h) const override;

  [[nodiscard]] double potentialEnergy(double t,
                                       const Eigen::VectorXd& q) const override;

  [[nodiscard]] const Eigen::Vector3d& force() const
  {
    return force_;
  }

private:
  BodyPoint point_;
  Eigen::Vector3d force_;
};

/**
 * @brief Uniform gravity field acting on a body's center of mass
 *
 * Equivalent to a ConstantForce of m·g at the body origin.
 *
 * @ticket 0003_system_assembly
 */
class GravityForce final : public ConstantForce
{
public:
  /**
   * @param body Body subject to gravity
   * @param gravity Gravitational acceleration [m/s²]
   */
  explicit GravityForce(const Body& body,
                        const Eigen::Vector3d& gravity =
                          Eigen::Vector3d{0.0, -9.81, 0.0});
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_CONSTANT_FORCE_HPP
