// Ticket: 0004_planar_rigid_body

#include "mbs-sim/src/Model/RigidBody2D.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "mbs-sim/src/Utils/utils.hpp"

namespace mbs_sim
{

RigidBody2D::RigidBody2D(double mass,
                         double inertia,
                         const Eigen::Vector3d& q0,
                         const Eigen::Vector3d& u0)
  : mass_{mass}, inertia_{inertia}, q0_{q0}, u0_{u0}
{
  if (!(mass > 0.0))
  {
    throw std::invalid_argument("RigidBody2D: mass must be positive, got " +
                                std::to_string(mass));
  }
  if (!(inertia > 0.0))
  {
    throw std::invalid_argument(
      "RigidBody2D: inertia must be positive, got " + std::to_string(inertia));
  }
}

Eigen::VectorXd RigidBody2D::q0() const
{
  return q0_;
}

Eigen::VectorXd RigidBody2D::u0() const
{
  return u0_;
}

Eigen::MatrixXd RigidBody2D::massMatrix(double /* t */,
                                        const Eigen::VectorXd& /* q */) const
{
  Eigen::MatrixXd M = Eigen::MatrixXd::Zero(3, 3);
  M(0, 0) = mass_;
  M(1, 1) = mass_;
  M(2, 2) = inertia_;
  return M;
}

Eigen::VectorXd RigidBody2D::qDot(double /* t */,
                                  const Eigen::VectorXd& /* q */,
                                  const Eigen::VectorXd& u) const
{
  return u;
}

Eigen::MatrixXd RigidBody2D::B(double /* t */,
                               const Eigen::VectorXd& /* q */) const
{
  return Eigen::MatrixXd::Identity(3, 3);
}

Eigen::Vector2d RigidBody2D::rotatedOffset(double phi,
                                           const Eigen::Vector3d& localPoint)
{
  const double c = std::cos(phi);
  const double s = std::sin(phi);
  return Eigen::Vector2d{c * localPoint.x() - s * localPoint.y(),
                         s * localPoint.x() + c * localPoint.y()};
}

Eigen::Vector3d RigidBody2D::position(const Eigen::VectorXd& q,
                                      const Eigen::Vector3d& localPoint) const
{
  const Eigen::Vector2d offset = rotatedOffset(q(2), localPoint);
  return Eigen::Vector3d{q(0) + offset.x(), q(1) + offset.y(), localPoint.z()};
}

Eigen::MatrixXd RigidBody2D::pointJacobian(
  const Eigen::VectorXd& q,
  const Eigen::Vector3d& localPoint) const
{
  // d(A K_r)/dφ = e_z × (A K_r)
  const Eigen::Vector2d offset = rotatedOffset(q(2), localPoint);
  Eigen::MatrixXd J = Eigen::MatrixXd::Zero(3, 3);
  J(0, 0) = 1.0;
  J(1, 1) = 1.0;
  J(0, 2) = -offset.y();
  J(1, 2) = offset.x();
  return J;
}

Eigen::Vector3d RigidBody2D::accelerationBias(
  const Eigen::VectorXd& q,
  const Eigen::VectorXd& u,
  const Eigen::Vector3d& localPoint) const
{
  // Centripetal term -ω²·A K_r
  const Eigen::Vector2d offset = rotatedOffset(q(2), localPoint);
  const double omega2 = u(2) * u(2);
  return Eigen::Vector3d{-omega2 * offset.x(), -omega2 * offset.y(), 0.0};
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> RigidBody2D::stepCallback(
  double /* t */,
  const Eigen::VectorXd& q,
  const Eigen::VectorXd& u) const
{
  Eigen::VectorXd wrapped = q;
  wrapped(2) = wrapToPi(q(2));
  return {wrapped, u};
}

}  // namespace mbs_sim
