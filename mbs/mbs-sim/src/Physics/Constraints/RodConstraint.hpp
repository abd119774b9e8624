// Ticket: 0003_system_assembly

#ifndef MBS_SIM_PHYSICS_ROD_CONSTRAINT_HPP
#define MBS_SIM_PHYSICS_ROD_CONSTRAINT_HPP

#include <Eigen/Dense>

#include <optional>

#include "mbs-sim/src/Model/BodyPoint.hpp"
#include "mbs-sim/src/Physics/Constraints/BilateralConstraint.hpp"

namespace mbs_sim
{

/**
 * @brief Massless rigid rod keeping two points at fixed distance L
 *
 * Constraint function (squared form, smooth at any configuration):
 *   g = d·d - L²,  d = r_1 - r_2
 *   ġ = 2 d·(v_1 - v_2)
 *   g̈ = 2 ((v_1 - v_2)·(v_1 - v_2) + d·(a_1 - a_2))
 *   W_g = [2 J_1^T d ; -2 J_2^T d]
 *
 * Either end may be a fixed point (e.g. the pivot of a pendulum). Without an
 * explicit length, L is taken from the initial configuration when the System
 * is assembled.
 *
 * @ticket 0003_system_assembly
 */
class RodConstraint final : public BilateralConstraint
{
public:
  /**
   * @param first First end point
   * @param second Second end point
   * @param length Rod length [m]; std::nullopt to use the initial distance
   * @throws std::invalid_argument if both ends are fixed or length <= 0
   */
  RodConstraint(const BodyPoint& first,
                const BodyPoint& second,
                std::optional<double> length = std::nullopt);

  [[nodiscard]] int dimension() const override
  {
    return 1;
  }

  /**
   * @throws std::invalid_argument if the initial distance vanishes
   */
  void assemblerCallback(double t0, const Eigen::VectorXd& q0) override;

  [[nodiscard]] Eigen::VectorXd g(double t,
                                  const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::VectorXd gDot(double t,
                                     const Eigen::VectorXd& q,
                                     const Eigen::VectorXd& u) const override;

  [[nodiscard]] Eigen::VectorXd gDDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const override;

  void addWg(double t,
             const Eigen::VectorXd& q,
             std::vector<Eigen::Triplet<double>>& triplets) const override;

  /**
   * @brief Rod length [m]
   * @throws std::logic_error before the length is known
   */
  [[nodiscard]] double length() const;

private:
  BodyPoint first_;
  BodyPoint second_;
  std::optional<double> length_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_ROD_CONSTRAINT_HPP
