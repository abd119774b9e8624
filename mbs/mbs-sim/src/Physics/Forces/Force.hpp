// Ticket: 0003_system_assembly

#ifndef MBS_SIM_PHYSICS_FORCE_HPP
#define MBS_SIM_PHYSICS_FORCE_HPP

#include <Eigen/Dense>

namespace mbs_sim
{

/**
 * @brief Applied force element contributing to the generalized force h
 *
 * Implementations add their generalized force into the global vector h of
 * the assembled System and report the potential energy they store, so that
 * EnergyTracker can monitor the total mechanical energy.
 *
 * Conservative forces: h = -∂V/∂q mapped through the point Jacobians.
 *
 * @ticket 0003_system_assembly
 */
class Force
{
public:
  virtual ~Force() = default;

  /**
   * @brief Add the generalized force of this element
   * @param t Time [s]
   * @param q Global coordinates
   * @param u Global velocities
   * @param h Global generalized force vector (size nu), accumulated into
   */
  virtual void addGeneralizedForce(double t,
                                   const Eigen::VectorXd& q,
                                   const Eigen::VectorXd& u,
                                   Eigen::VectorXd& h) const = 0;

  /**
   * @brief Potential energy V [J]
   */
  [[nodiscard]] virtual double potentialEnergy(
    double t,
    const Eigen::VectorXd& q) const = 0;

protected:
  Force() = default;
  Force(const Force&) = default;
  Force& operator=(const Force&) = default;
  Force(Force&&) noexcept = default;
  Force& operator=(Force&&) noexcept = default;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_FORCE_HPP
