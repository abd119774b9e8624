// Ticket: 0003_system_assembly

#include "mbs-sim/src/Model/BodyPoint.hpp"

#include "mbs-sim/src/Model/Body.hpp"

namespace mbs_sim
{

BodyPoint BodyPoint::fixed(const Eigen::Vector3d& position)
{
  return BodyPoint{nullptr, position};
}

BodyPoint BodyPoint::on(const Body& body, const Eigen::Vector3d& localPoint)
{
  return BodyPoint{&body, localPoint};
}

Eigen::Vector3d BodyPoint::position(const Eigen::VectorXd& q) const
{
  if (isFixed())
  {
    return point;
  }
  return body->position(body->localQ(q), point);
}

Eigen::Vector3d BodyPoint::velocity(const Eigen::VectorXd& q,
                                    const Eigen::VectorXd& u) const
{
  if (isFixed())
  {
    return Eigen::Vector3d::Zero();
  }
  return body->velocity(body->localQ(q), body->localU(u), point);
}

Eigen::Vector3d BodyPoint::acceleration(const Eigen::VectorXd& q,
                                        const Eigen::VectorXd& u,
                                        const Eigen::VectorXd& uDot) const
{
  if (isFixed())
  {
    return Eigen::Vector3d::Zero();
  }
  return body->acceleration(
    body->localQ(q), body->localU(u), body->localU(uDot), point);
}

void BodyPoint::addJacobianTransposed(
  const Eigen::VectorXd& q,
  const Eigen::Vector3d& direction,
  int column,
  std::vector<Eigen::Triplet<double>>& triplets) const
{
  if (isFixed())
  {
    return;
  }
  const Eigen::VectorXd entries =
    body->pointJacobian(body->localQ(q), point).transpose() * direction;
  for (Eigen::Index i = 0; i < entries.size(); ++i)
  {
    if (entries(i) != 0.0)
    {
      triplets.emplace_back(
        body->uOffset() + static_cast<int>(i), column, entries(i));
    }
  }
}

void BodyPoint::addGeneralizedForce(const Eigen::VectorXd& q,
                                    const Eigen::Vector3d& force,
                                    Eigen::VectorXd& h) const
{
  if (isFixed())
  {
    return;
  }
  h.segment(body->uOffset(), body->nu()) +=
    body->pointJacobian(body->localQ(q), point).transpose() * force;
}

}  // namespace mbs_sim
