// Ticket: 0003_system_assembly

#include "mbs-sim/src/Physics/Forces/ConstantForce.hpp"

#include <stdexcept>

#include "mbs-sim/src/Model/Body.hpp"

namespace mbs_sim
{

ConstantForce::ConstantForce(const BodyPoint& point,
                             const Eigen::Vector3d& force)
  : point_{point}, force_{force}
{
  if (point_.isFixed())
  {
    throw std::invalid_argument(
      "ConstantForce: point of application must lie on a body");
  }
}

void ConstantForce::addGeneralizedForce(double /* t */,
                                        const Eigen::VectorXd& q,
                                        const Eigen::VectorXd& /* u */,
                                        Eigen::VectorXd& h) const
{
  point_.addGeneralizedForce(q, force_, h);
}

double ConstantForce::potentialEnergy(double /* t */,
                                      const Eigen::VectorXd& q) const
{
  return -force_.dot(point_.position(q));
}

GravityForce::GravityForce(const Body& body, const Eigen::Vector3d& gravity)
  : ConstantForce{BodyPoint::on(body), body.mass() * gravity}
{
}

}  // namespace mbs_sim
