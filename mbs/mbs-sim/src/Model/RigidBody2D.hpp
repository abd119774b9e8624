// Ticket: 0004_planar_rigid_body

#ifndef MBS_SIM_MODEL_RIGID_BODY_2D_HPP
#define MBS_SIM_MODEL_RIGID_BODY_2D_HPP

#include <Eigen/Dense>

#include <utility>

#include "mbs-sim/src/Model/Body.hpp"

namespace mbs_sim
{

/**
 * @brief Rigid body moving in the x-y plane
 *
 * Coordinates q = (x, y, φ), velocities u = (v_x, v_y, ω) with q̇ = u.
 * A body-fixed point K_r = (a, b, c) sits at
 *
 *   r_P = (x, y, 0) + A(φ)·(a, b) + (0, 0, c)
 *
 * where A(φ) is the planar rotation. Every accepted step wraps φ into
 * (-π, π].
 *
 * @ticket 0004_planar_rigid_body
 */
class RigidBody2D final : public Body
{
public:
  /**
   * @brief Construct a planar rigid body
   * @param mass Mass [kg], must be positive
   * @param inertia Moment of inertia about the z axis at the center of
   *        mass [kg·m²], must be positive
   * @param q0 Initial (x, y, φ)
   * @param u0 Initial (v_x, v_y, ω)
   * @throws std::invalid_argument for non-positive mass or inertia
   */
  RigidBody2D(double mass,
              double inertia,
              const Eigen::Vector3d& q0 = Eigen::Vector3d::Zero(),
              const Eigen::Vector3d& u0 = Eigen::Vector3d::Zero());

  [[nodiscard]] int nq() const override
  {
    return 3;
  }

  [[nodiscard]] int nu() const override
  {
    return 3;
  }

  [[nodiscard]] double mass() const override
  {
    return mass_;
  }

  [[nodiscard]] double inertia() const
  {
    return inertia_;
  }

  [[nodiscard]] Eigen::VectorXd q0() const override;
  [[nodiscard]] Eigen::VectorXd u0() const override;

  [[nodiscard]] Eigen::MatrixXd massMatrix(
    double t,
    const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::VectorXd qDot(double t,
                                     const Eigen::VectorXd& q,
                                     const Eigen::VectorXd& u) const override;

  [[nodiscard]] Eigen::MatrixXd B(double t,
                                  const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::Vector3d position(
    const Eigen::VectorXd& q,
    const Eigen::Vector3d& localPoint) const override;

  [[nodiscard]] Eigen::MatrixXd pointJacobian(
    const Eigen::VectorXd& q,
    const Eigen::Vector3d& localPoint) const override;

  [[nodiscard]] Eigen::Vector3d accelerationBias(
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::Vector3d& localPoint) const override;

  [[nodiscard]] std::pair<Eigen::VectorXd, Eigen::VectorXd> stepCallback(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const override;

private:
  /**
   * @brief In-plane offset A(φ)·(a, b) of a body-fixed point
   */
  [[nodiscard]] static Eigen::Vector2d rotatedOffset(
    double phi,
    const Eigen::Vector3d& localPoint);

  double mass_;
  double inertia_;
  Eigen::Vector3d q0_;
  Eigen::Vector3d u0_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_MODEL_RIGID_BODY_2D_HPP
