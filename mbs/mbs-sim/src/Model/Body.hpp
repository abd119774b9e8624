// Ticket: 0003_system_assembly

#ifndef MBS_SIM_MODEL_BODY_HPP
#define MBS_SIM_MODEL_BODY_HPP

#include <Eigen/Dense>

#include <utility>

namespace mbs_sim
{

/**
 * @brief Body contributing generalized coordinates to a System
 *
 * Bodies evaluate their kinematics on their own coordinate slices (size nq()
 * and nu()). The owning System assigns the global offsets of these slices in
 * System::assemble().
 *
 * Point kinematics use a body-fixed point given in body coordinates:
 *   r_P = position(q, K_r)
 *   v_P = J_P(q, K_r) u
 *   a_P = J_P(q, K_r) u̇ + accelerationBias(q, u, K_r)
 *
 * @ticket 0003_system_assembly
 */
class Body
{
public:
  virtual ~Body() = default;

  [[nodiscard]] virtual int nq() const = 0;
  [[nodiscard]] virtual int nu() const = 0;

  [[nodiscard]] virtual double mass() const = 0;

  [[nodiscard]] virtual Eigen::VectorXd q0() const = 0;
  [[nodiscard]] virtual Eigen::VectorXd u0() const = 0;

  [[nodiscard]] virtual Eigen::MatrixXd massMatrix(
    double t,
    const Eigen::VectorXd& q) const = 0;

  /**
   * @brief Gyroscopic and other velocity dependent forces (zero by default)
   */
  [[nodiscard]] virtual Eigen::VectorXd h(double /* t */,
                                          const Eigen::VectorXd& /* q */,
                                          const Eigen::VectorXd& /* u */) const
  {
    return Eigen::VectorXd::Zero(nu());
  }

  [[nodiscard]] virtual Eigen::VectorXd qDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const = 0;

  [[nodiscard]] virtual Eigen::MatrixXd B(double t,
                                          const Eigen::VectorXd& q) const = 0;

  [[nodiscard]] virtual Eigen::Vector3d position(
    const Eigen::VectorXd& q,
    const Eigen::Vector3d& localPoint) const = 0;

  /**
   * @brief Point Jacobian J_P, 3 x nu
   */
  [[nodiscard]] virtual Eigen::MatrixXd pointJacobian(
    const Eigen::VectorXd& q,
    const Eigen::Vector3d& localPoint) const = 0;

  [[nodiscard]] virtual Eigen::Vector3d accelerationBias(
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::Vector3d& localPoint) const = 0;

  [[nodiscard]] Eigen::Vector3d velocity(
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::Vector3d& localPoint) const
  {
    return pointJacobian(q, localPoint) * u;
  }

  [[nodiscard]] Eigen::Vector3d acceleration(
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot,
    const Eigen::Vector3d& localPoint) const
  {
    return pointJacobian(q, localPoint) * uDot +
           accelerationBias(q, u, localPoint);
  }

  /**
   * @brief Post-step correction of the body's own coordinates
   */
  [[nodiscard]] virtual std::pair<Eigen::VectorXd, Eigen::VectorXd>
  stepCallback(double /* t */,
               const Eigen::VectorXd& q,
               const Eigen::VectorXd& u) const
  {
    return {q, u};
  }

  // ===== Global placement (System::assemble) =====

  [[nodiscard]] int qOffset() const
  {
    return q_offset_;
  }

  [[nodiscard]] int uOffset() const
  {
    return u_offset_;
  }

  void setOffsets(int qOffset, int uOffset)
  {
    q_offset_ = qOffset;
    u_offset_ = uOffset;
  }

  [[nodiscard]] Eigen::VectorXd localQ(const Eigen::VectorXd& q) const
  {
    return q.segment(q_offset_, nq());
  }

  [[nodiscard]] Eigen::VectorXd localU(const Eigen::VectorXd& u) const
  {
    return u.segment(u_offset_, nu());
  }

protected:
  Body() = default;
  Body(const Body&) = default;
  Body& operator=(const Body&) = default;
  Body(Body&&) noexcept = default;
  Body& operator=(Body&&) noexcept = default;

private:
  int q_offset_{-1};
  int u_offset_{-1};
};

}  // namespace mbs_sim

#endif  // MBS_SIM_MODEL_BODY_HPP
