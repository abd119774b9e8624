// Ticket: 0008_energy_diagnostics

#ifndef MBS_SIM_PHYSICS_LINEAR_SPRING_HPP
#define MBS_SIM_PHYSICS_LINEAR_SPRING_HPP

#include <Eigen/Dense>

#include "mbs-sim/src/Model/BodyPoint.hpp"
#include "mbs-sim/src/Physics/Forces/Force.hpp"

namespace mbs_sim
{

/**
 * @brief Linear spring between two points
 *
 * With d = r_1 - r_2, the force on point 1 is
 *   F_1 = -k (|d| - l0) d/|d|      (l0 > 0)
 *   F_1 = -k d                     (l0 = 0)
 * and F_2 = -F_1. V = 0.5 k (|d| - l0)².
 *
 * A zero rest length keeps the force smooth through d = 0.
 *
 * @ticket 0008_energy_diagnostics
 */
class LinearSpring final : public Force
{
public:
  /**
   * @param first First end point
   * @param second Second end point
   * @param stiffness Spring constant k [N/m], must be positive
   * @param restLength Rest length l0 [m], must be non-negative
   * @throws std::invalid_argument for invalid parameters or two fixed ends
   */
  LinearSpring(const BodyPoint& first,
               const BodyPoint& second,
               double stiffness,
               double restLength = 0.0);

  void addGeneralizedForce(double t,
                           const Eigen::VectorXd& q,
                           const Eigen::VectorXd& u,
                           Eigen::VectorXd& h) const override;

  [[nodiscard]] double potentialEnergy(double t,
                                       const Eigen::VectorXd& q) const override;

private:
  [[nodiscard]] Eigen::Vector3d forceOnFirst(const Eigen::VectorXd& q) const;

  BodyPoint first_;
  BodyPoint second_;
  double stiffness_;
  double rest_length_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_LINEAR_SPRING_HPP
