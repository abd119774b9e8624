// Ticket: 0003_system_assembly

#include "mbs-sim/src/Model/Particle.hpp"

#include <stdexcept>
#include <string>

namespace mbs_sim
{

Particle::Particle(double mass,
                   const Eigen::Vector3d& position,
                   const Eigen::Vector3d& velocity)
  : mass_{mass}, position0_{position}, velocity0_{velocity}
{
  if (!(mass > 0.0))
  {
    throw std::invalid_argument("Particle: mass must be positive, got " +
                                std::to_string(mass));
  }
}

Eigen::VectorXd Particle::q0() const
{
  return position0_;
}

Eigen::VectorXd Particle::u0() const
{
  return velocity0_;
}

Eigen::MatrixXd Particle::massMatrix(double /* t */,
                                     const Eigen::VectorXd& /* q */) const
{
  return mass_ * Eigen::MatrixXd::Identity(3, 3);
}

Eigen::VectorXd Particle::qDot(double /* t */,
                               const Eigen::VectorXd& /* q */,
                               const Eigen::VectorXd& u) const
{
  return u;
}

Eigen::MatrixXd Particle::B(double /* t */,
                            const Eigen::VectorXd& /* q */) const
{
  return Eigen::MatrixXd::Identity(3, 3);
}

Eigen::Vector3d Particle::position(
  const Eigen::VectorXd& q,
  const Eigen::Vector3d& /* localPoint */) const
{
  return q.head<3>();
}

Eigen::MatrixXd Particle::pointJacobian(
  const Eigen::VectorXd& /* q */,
  const Eigen::Vector3d& /* localPoint */) const
{
  return Eigen::MatrixXd::Identity(3, 3);
}

Eigen::Vector3d Particle::accelerationBias(
  const Eigen::VectorXd& /* q */,
  const Eigen::VectorXd& /* u */,
  const Eigen::Vector3d& /* localPoint */) const
{
  return Eigen::Vector3d::Zero();
}

}  // namespace mbs_sim
