// Ticket: 0003_system_assembly

#include "mbs-sim/src/Physics/Constraints/RodConstraint.hpp"

#include <stdexcept>
#include <string>

namespace mbs_sim
{

RodConstraint::RodConstraint(const BodyPoint& first,
                             const BodyPoint& second,
                             std::optional<double> length)
  : first_{first}, second_{second}, length_{length}
{
  if (first_.isFixed() && second_.isFixed())
  {
    throw std::invalid_argument("RodConstraint: both ends are fixed");
  }
  if (length_ && !(*length_ > 0.0))
  {
    throw std::invalid_argument("RodConstraint: length must be positive, got " +
                                std::to_string(*length_));
  }
}

void RodConstraint::assemblerCallback(double /* t0 */,
                                      const Eigen::VectorXd& q0)
{
  if (length_)
  {
    return;
  }
  const double distance = (first_.position(q0) - second_.position(q0)).norm();
  if (!(distance > 0.0))
  {
    throw std::invalid_argument(
      "RodConstraint: initial distance between end points is zero");
  }
  length_ = distance;
}

double RodConstraint::length() const
{
  if (!length_)
  {
    throw std::logic_error(
      "RodConstraint: length unknown before System::assemble()");
  }
  return *length_;
}

Eigen::VectorXd RodConstraint::g(double /* t */,
                                 const Eigen::VectorXd& q) const
{
  const Eigen::Vector3d d = first_.position(q) - second_.position(q);
  const double L = length();
  return Eigen::VectorXd::Constant(1, d.dot(d) - L * L);
}

Eigen::VectorXd RodConstraint::gDot(double /* t */,
                                    const Eigen::VectorXd& q,
                                    const Eigen::VectorXd& u) const
{
  const Eigen::Vector3d d = first_.position(q) - second_.position(q);
  const Eigen::Vector3d v = first_.velocity(q, u) - second_.velocity(q, u);
  return Eigen::VectorXd::Constant(1, 2.0 * d.dot(v));
}

Eigen::VectorXd RodConstraint::gDDot(double /* t */,
                                     const Eigen::VectorXd& q,
                                     const Eigen::VectorXd& u,
                                     const Eigen::VectorXd& uDot) const
{
  const Eigen::Vector3d d = first_.position(q) - second_.position(q);
  const Eigen::Vector3d v = first_.velocity(q, u) - second_.velocity(q, u);
  const Eigen::Vector3d a =
    first_.acceleration(q, u, uDot) - second_.acceleration(q, u, uDot);
  return Eigen::VectorXd::Constant(1, 2.0 * (v.dot(v) + d.dot(a)));
}

void RodConstraint::addWg(double /* t */,
                          const Eigen::VectorXd& q,
                          std::vector<Eigen::Triplet<double>>& triplets) const
{
  const Eigen::Vector3d d = first_.position(q) - second_.position(q);
  first_.addJacobianTransposed(q, 2.0 * d, multiplierOffset(), triplets);
  second_.addJacobianTransposed(q, -2.0 * d, multiplierOffset(), triplets);
}

}  // namespace mbs_sim
