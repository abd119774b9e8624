// Ticket: 0006_contact_active_set

#ifndef MBS_SIM_PHYSICS_POINT_PLANE_CONTACT_HPP
#define MBS_SIM_PHYSICS_POINT_PLANE_CONTACT_HPP

#include <Eigen/Dense>

#include "mbs-sim/src/Model/BodyPoint.hpp"
#include "mbs-sim/src/Physics/Constraints/UnilateralConstraint.hpp"

namespace mbs_sim
{

/**
 * @brief Sphere (or point, radius 0) against a fixed plane
 *
 * Plane through `planePoint` with unit normal n pointing into the free half
 * space:
 *   g_N   = n·(r_P - p_0) - radius
 *   ġ_N  = n·v_P
 *   g̈_N  = n·a_P
 *   W_N   = J_P^T n
 *
 * @ticket 0006_contact_active_set
 */
class PointPlaneContact final : public UnilateralConstraint
{
public:
  struct Parameters
  {
    double radius{0.0};       // Sphere radius [m]
    double restitution{0.0};  // Newton restitution e_N in [0, 1]
    double proxR{1e3};        // Prox parameter r_N > 0
  };

  /**
   * @param point Contact point (center of the sphere), on a body
   * @param planePoint Any point of the plane [m]
   * @param normal Plane normal (normalized internally)
   * @param parameters Radius, restitution and prox parameter
   * @throws std::invalid_argument for a fixed point, zero normal or
   *         out-of-range parameters
   */
  PointPlaneContact(const BodyPoint& point,
                    const Eigen::Vector3d& planePoint,
                    const Eigen::Vector3d& normal,
                    Parameters parameters);

  PointPlaneContact(const BodyPoint& point,
                    const Eigen::Vector3d& planePoint,
                    const Eigen::Vector3d& normal);

  [[nodiscard]] int dimension() const override
  {
    return 1;
  }

  [[nodiscard]] Eigen::VectorXd gN(double t,
                                   const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::VectorXd gNDot(double t,
                                      const Eigen::VectorXd& q,
                                      const Eigen::VectorXd& u) const override;

  [[nodiscard]] Eigen::VectorXd gNDDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const override;

  void addWN(double t,
             const Eigen::VectorXd& q,
             std::vector<Eigen::Triplet<double>>& triplets) const override;

  [[nodiscard]] double restitution() const override
  {
    return parameters_.restitution;
  }

  [[nodiscard]] double proxR() const override
  {
    return parameters_.proxR;
  }

  [[nodiscard]] const Eigen::Vector3d& normal() const
  {
    return normal_;
  }

private:
  BodyPoint point_;
  Eigen::Vector3d plane_point_;
  Eigen::Vector3d normal_;
  Parameters parameters_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_POINT_PLANE_CONTACT_HPP
