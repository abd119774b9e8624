// Ticket: 0003_system_assembly

#ifndef MBS_SIM_MODEL_BODY_POINT_HPP
#define MBS_SIM_MODEL_BODY_POINT_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <vector>

namespace mbs_sim
{

class Body;

/**
 * @brief A material point of a body, or a fixed point in the inertial frame
 *
 * Evaluated on the global q, u vectors of the assembled System. A BodyPoint
 * without body is fixed: its position is `point` and all velocities,
 * accelerations and Jacobians vanish.
 *
 * The referenced body is non-owning; the System that owns the body must
 * outlive the BodyPoint.
 *
 * @ticket 0003_system_assembly
 */
struct BodyPoint
{
  const Body* body{nullptr};
  Eigen::Vector3d point{Eigen::Vector3d::Zero()};

  [[nodiscard]] static BodyPoint fixed(const Eigen::Vector3d& position);
  [[nodiscard]] static BodyPoint on(
    const Body& body,
    const Eigen::Vector3d& localPoint = Eigen::Vector3d::Zero());

  [[nodiscard]] bool isFixed() const
  {
    return body == nullptr;
  }

  [[nodiscard]] Eigen::Vector3d position(const Eigen::VectorXd& q) const;

  [[nodiscard]] Eigen::Vector3d velocity(const Eigen::VectorXd& q,
                                         const Eigen::VectorXd& u) const;

  [[nodiscard]] Eigen::Vector3d acceleration(
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const;

  /**
   * @brief Append J_P^T·direction into one column of a global nu x n matrix
   * @param q Global coordinates
   * @param direction Vector in the inertial frame
   * @param column Target column
   * @param triplets Output triplets (no-op for fixed points)
   */
  void addJacobianTransposed(
    const Eigen::VectorXd& q,
    const Eigen::Vector3d& direction,
    int column,
    std::vector<Eigen::Triplet<double>>& triplets) const;

  /**
   * @brief Add J_P^T·force into a global generalized force vector
   */
  void addGeneralizedForce(const Eigen::VectorXd& q,
                           const Eigen::Vector3d& force,
                           Eigen::VectorXd& h) const;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_MODEL_BODY_POINT_HPP
