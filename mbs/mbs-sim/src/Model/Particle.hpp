// Ticket: 0003_system_assembly

#ifndef MBS_SIM_MODEL_PARTICLE_HPP
#define MBS_SIM_MODEL_PARTICLE_HPP

#include <Eigen/Dense>

#include "mbs-sim/src/Model/Body.hpp"

namespace mbs_sim
{

/**
 * @brief Point mass in 3D, q = u = r (inertial position)
 *
 * All body-fixed points coincide with the particle position.
 *
 * @ticket 0003_system_assembly
 */
class Particle final : public Body
{
public:
  /**
   * @brief Construct a particle
   * @param mass Mass [kg], must be positive
   * @param position Initial position [m]
   * @param velocity Initial velocity [m/s]
   * @throws std::invalid_argument if mass <= 0
   */
  explicit Particle(double mass,
                    const Eigen::Vector3d& position = Eigen::Vector3d::Zero(),
                    const Eigen::Vector3d& velocity = Eigen::Vector3d::Zero());

  [[nodiscard]] int nq() const override
  {
    return 3;
  }

  [[nodiscard]] int nu() const override
  {
    return 3;
  }

  [[nodiscard]] double mass() const override
  {
    return mass_;
  }

  [[nodiscard]] Eigen::VectorXd q0() const override;
  [[nodiscard]] Eigen::VectorXd u0() const override;

  [[nodiscard]] Eigen::MatrixXd massMatrix(
    double t,
    const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::VectorXd qDot(double t,
                                     const Eigen::VectorXd& q,
                                     const Eigen::VectorXd& u) const override;

  [[nodiscard]] Eigen::MatrixXd B(double t,
                                  const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::Vector3d position(
    const Eigen::VectorXd& q,
    const Eigen::Vector3d& localPoint) const override;

  [[nodiscard]] Eigen::MatrixXd pointJacobian(
    const Eigen::VectorXd& q,
    const Eigen::Vector3d& localPoint) const override;

  [[nodiscard]] Eigen::Vector3d accelerationBias(
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::Vector3d& localPoint) const override;

private:
  double mass_;
  Eigen::Vector3d position0_;
  Eigen::Vector3d velocity0_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_MODEL_PARTICLE_HPP
