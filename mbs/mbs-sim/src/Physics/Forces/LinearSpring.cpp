// Ticket: 0008_energy_diagnostics

#include "mbs-sim/src/Physics/Forces/LinearSpring.hpp"

#include <stdexcept>
#include <string>

namespace mbs_sim
{

LinearSpring::LinearSpring(const BodyPoint& first,
                           const BodyPoint& second,
                           double stiffness,
                           double restLength)
  : first_{first},
    second_{second},
    stiffness_{stiffness},
    rest_length_{restLength}
{
  if (!(stiffness > 0.0))
  {
    throw std::invalid_argument(
      "LinearSpring: stiffness must be positive, got " +
      std::to_string(stiffness));
  }
  if (!(restLength >= 0.0))
  {
    throw std::invalid_argument(
      "LinearSpring: rest length must be non-negative, got " +
      std::to_string(restLength));
  }
  if (first_.isFixed() && second_.isFixed())
  {
    throw std::invalid_argument("LinearSpring: both ends are fixed");
  }
}

Eigen::Vector3d LinearSpring::forceOnFirst(const Eigen::VectorXd& q) const
{
  const Eigen::Vector3d d = first_.position(q) - second_.position(q);
  if (rest_length_ == 0.0)
  {
    return -stiffness_ * d;
  }
  const double length = d.norm();
  if (length == 0.0)
  {
    throw std::runtime_error(
      "LinearSpring: direction undefined for coincident end points");
  }
  return -stiffness_ * (length - rest_length_) * d / length;
}

void LinearSpring::addGeneralizedForce(double /* t */,
                                       const Eigen::VectorXd& q,
                                       const Eigen::VectorXd& /* u */,
                                       Eigen::VectorXd& h) const
{
  const Eigen::Vector3d f = forceOnFirst(q);
  first_.addGeneralizedForce(q, f, h);
  second_.addGeneralizedForce(q, -f, h);
}

double LinearSpring::potentialEnergy(double /* t */,
                                     const Eigen::VectorXd& q) const
{
  const double stretch =
    (first_.position(q) - second_.position(q)).norm() - rest_length_;
  return 0.5 * stiffness_ * stretch * stretch;
}

}  // namespace mbs_sim
