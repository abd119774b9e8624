// Ticket: 0006_contact_active_set

#include "mbs-sim/src/Physics/Constraints/PointPlaneContact.hpp"

#include <stdexcept>
#include <string>

namespace mbs_sim
{

PointPlaneContact::PointPlaneContact(const BodyPoint& point,
                                     const Eigen::Vector3d& planePoint,
                                     const Eigen::Vector3d& normal,
                                     Parameters parameters)
  : point_{point}, plane_point_{planePoint}, parameters_{parameters}
{
  if (point_.isFixed())
  {
    throw std::invalid_argument(
      "PointPlaneContact: contact point must lie on a body");
  }
  const double norm = normal.norm();
  if (!(norm > 0.0))
  {
    throw std::invalid_argument("PointPlaneContact: zero plane normal");
  }
  normal_ = normal / norm;

  if (!(parameters_.radius >= 0.0))
  {
    throw std::invalid_argument(
      "PointPlaneContact: radius must be non-negative, got " +
      std::to_string(parameters_.radius));
  }
  if (!(parameters_.restitution >= 0.0 && parameters_.restitution <= 1.0))
  {
    throw std::invalid_argument(
      "PointPlaneContact: restitution must be in [0, 1], got " +
      std::to_string(parameters_.restitution));
  }
  if (!(parameters_.proxR > 0.0))
  {
    throw std::invalid_argument(
      "PointPlaneContact: prox parameter must be positive, got " +
      std::to_string(parameters_.proxR));
  }
}

PointPlaneContact::PointPlaneContact(const BodyPoint& point,
                                     const Eigen::Vector3d& planePoint,
                                     const Eigen::Vector3d& normal)
  : PointPlaneContact{point, planePoint, normal, Parameters{}}
{
}

Eigen::VectorXd PointPlaneContact::gN(double /* t */,
                                      const Eigen::VectorXd& q) const
{
  const double gap =
    normal_.dot(point_.position(q) - plane_point_) - parameters_.radius;
  return Eigen::VectorXd::Constant(1, gap);
}

Eigen::VectorXd PointPlaneContact::gNDot(double /* t */,
                                         const Eigen::VectorXd& q,
                                         const Eigen::VectorXd& u) const
{
  return Eigen::VectorXd::Constant(1, normal_.dot(point_.velocity(q, u)));
}

Eigen::VectorXd PointPlaneContact::gNDDot(double /* t */,
                                          const Eigen::VectorXd& q,
                                          const Eigen::VectorXd& u,
                                          const Eigen::VectorXd& uDot) const
{
  return Eigen::VectorXd::Constant(
    1, normal_.dot(point_.acceleration(q, u, uDot)));
}

void PointPlaneContact::addWN(
  double /* t */,
  const Eigen::VectorXd& q,
  std::vector<Eigen::Triplet<double>>& triplets) const
{
  point_.addJacobianTransposed(q, normal_, multiplierOffset(), triplets);
}

}  // namespace mbs_sim
