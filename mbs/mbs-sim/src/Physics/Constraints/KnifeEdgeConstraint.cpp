// Ticket: 0005_nonholonomic_constraints

#include "mbs-sim/src/Physics/Constraints/KnifeEdgeConstraint.hpp"

#include <cmath>

#include "mbs-sim/src/Model/RigidBody2D.hpp"

namespace mbs_sim
{

namespace
{

Eigen::Vector3d lateralDirection(double phi)
{
  return Eigen::Vector3d{-std::sin(phi), std::cos(phi), 0.0};
}

Eigen::Vector3d headingDirection(double phi)
{
  return Eigen::Vector3d{std::cos(phi), std::sin(phi), 0.0};
}

}  // namespace

KnifeEdgeConstraint::KnifeEdgeConstraint(const RigidBody2D& body,
                                         const Eigen::Vector3d& localPoint)
  : body_{body}, local_point_{localPoint}
{
}

double KnifeEdgeConstraint::heading(const Eigen::VectorXd& q) const
{
  return q(body_.qOffset() + 2);
}

double KnifeEdgeConstraint::angularVelocity(const Eigen::VectorXd& u) const
{
  return u(body_.uOffset() + 2);
}

Eigen::VectorXd KnifeEdgeConstraint::gamma(double /* t */,
                                           const Eigen::VectorXd& q,
                                           const Eigen::VectorXd& u) const
{
  const Eigen::Vector3d vP =
    body_.velocity(body_.localQ(q), body_.localU(u), local_point_);
  return Eigen::VectorXd::Constant(1, lateralDirection(heading(q)).dot(vP));
}

Eigen::VectorXd KnifeEdgeConstraint::gammaDot(
  double /* t */,
  const Eigen::VectorXd& q,
  const Eigen::VectorXd& u,
  const Eigen::VectorXd& uDot) const
{
  const Eigen::VectorXd qBody = body_.localQ(q);
  const Eigen::VectorXd uBody = body_.localU(u);
  const double phi = heading(q);

  const Eigen::Vector3d vP = body_.velocity(qBody, uBody, local_point_);
  const Eigen::Vector3d aP =
    body_.acceleration(qBody, uBody, body_.localU(uDot), local_point_);

  // ṅ = -ω e
  const double value = lateralDirection(phi).dot(aP) -
                       angularVelocity(u) * headingDirection(phi).dot(vP);
  return Eigen::VectorXd::Constant(1, value);
}

void KnifeEdgeConstraint::addWgamma(
  double /* t */,
  const Eigen::VectorXd& q,
  std::vector<Eigen::Triplet<double>>& triplets) const
{
  const Eigen::VectorXd column =
    body_.pointJacobian(body_.localQ(q), local_point_).transpose() *
    lateralDirection(heading(q));
  for (Eigen::Index i = 0; i < column.size(); ++i)
  {
    if (column(i) != 0.0)
    {
      triplets.emplace_back(
        body_.uOffset() + static_cast<int>(i), multiplierOffset(), column(i));
    }
  }
}

}  // namespace mbs_sim
