// Ticket: 0003_system_assembly

#ifndef MBS_SIM_MODEL_SYSTEM_HPP
#define MBS_SIM_MODEL_SYSTEM_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <memory>
#include <utility>
#include <vector>

#include "mbs-sim/src/Model/Body.hpp"
#include "mbs-sim/src/Model/Model.hpp"
#include "mbs-sim/src/Physics/Constraints/BilateralConstraint.hpp"
#include "mbs-sim/src/Physics/Constraints/NonholonomicConstraint.hpp"
#include "mbs-sim/src/Physics/Constraints/UnilateralConstraint.hpp"
#include "mbs-sim/src/Physics/Forces/Force.hpp"

namespace mbs_sim
{

/**
 * @brief Model assembled from bodies, forces, constraints and contacts
 *
 * Usage:
 * @code
 * System system;
 * auto& ball = system.add(std::make_unique<Particle>(1.0, r0));
 * system.add(std::make_unique<GravityForce>(ball));
 * system.add(std::make_unique<PointPlaneContact>(BodyPoint::on(ball), p0, n));
 * system.assemble();
 * @endcode
 *
 * assemble() assigns consecutive coordinate offsets to the bodies (in the
 * order they were added) and consecutive multiplier offsets to each kind of
 * constraint, then lets the constraints finalize their parameters on the
 * initial configuration. Components cannot be added afterwards.
 *
 * Ownership: the System owns all components. Components reference bodies by
 * address, which stays stable because bodies are held by unique_ptr.
 *
 * Error handling: Throws std::logic_error when a Model method is called
 * before assemble() or a component is added after it; throws
 * std::runtime_error when the mass matrix cannot be factorized.
 *
 * @ticket 0003_system_assembly
 */
class System final : public Model
{
public:
  explicit System(double t0 = 0.0);

  ~System() override = default;

  System(const System&) = delete;
  System& operator=(const System&) = delete;
  System(System&&) noexcept = default;
  System& operator=(System&&) noexcept = default;

  // ===== Construction =====

  template <typename T>
  T& add(std::unique_ptr<T> component)
  {
    T& ref = *component;
    addComponent(std::move(component));
    return ref;
  }

  void assemble();

  [[nodiscard]] bool isAssembled() const
  {
    return assembled_;
  }

  [[nodiscard]] const std::vector<std::unique_ptr<Body>>& bodies() const
  {
    return bodies_;
  }

  [[nodiscard]] const std::vector<std::unique_ptr<Force>>& forces() const
  {
    return forces_;
  }

  // ===== Model =====

  [[nodiscard]] int nq() const override;
  [[nodiscard]] int nu() const override;
  [[nodiscard]] int nlaG() const override;
  [[nodiscard]] int nlaGamma() const override;
  [[nodiscard]] int nlaN() const override;

  [[nodiscard]] double t0() const override
  {
    return t0_;
  }

  [[nodiscard]] Eigen::VectorXd q0() const override;
  [[nodiscard]] Eigen::VectorXd u0() const override;
  [[nodiscard]] Eigen::VectorXd laG0() const override;
  [[nodiscard]] Eigen::VectorXd laGamma0() const override;
  [[nodiscard]] Eigen::VectorXd laN0() const override;

  [[nodiscard]] Eigen::SparseMatrix<double> M(
    double t,
    const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::VectorXd h(double t,
                                  const Eigen::VectorXd& q,
                                  const Eigen::VectorXd& u) const override;

  [[nodiscard]] Eigen::VectorXd qDot(double t,
                                     const Eigen::VectorXd& q,
                                     const Eigen::VectorXd& u) const override;

  [[nodiscard]] Eigen::SparseMatrix<double> B(
    double t,
    const Eigen::VectorXd& q) const override;

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
  [[nodiscard]] Eigen::SparseMatrix<double> Wg(
    double t,
    const Eigen::VectorXd& q) const override;

  [[nodiscard]] Eigen::VectorXd gamma(double t,
                                      const Eigen::VectorXd& q,
                                      const Eigen::VectorXd& u) const override;
  [[nodiscard]] Eigen::VectorXd gammaDot(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u,
    const Eigen::VectorXd& uDot) const override;
  [[nodiscard]] Eigen::SparseMatrix<double> Wgamma(
    double t,
    const Eigen::VectorXd& q) const override;

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
  [[nodiscard]] Eigen::VectorXd xiN(double t,
                                    const Eigen::VectorXd& q,
                                    const Eigen::VectorXd& uPrevious,
                                    const Eigen::VectorXd& u) const override;
  [[nodiscard]] Eigen::SparseMatrix<double> WN(
    double t,
    const Eigen::VectorXd& q) const override;
  [[nodiscard]] Eigen::VectorXd proxRN() const override;

  [[nodiscard]] std::pair<Eigen::VectorXd, Eigen::VectorXd> stepCallback(
    double t,
    const Eigen::VectorXd& q,
    const Eigen::VectorXd& u) const override;

  // ===== Energy =====

  /**
   * @brief Kinetic energy T = 0.5 u^T M u [J]
   */
  [[nodiscard]] double kineticEnergy(double t,
                                     const Eigen::VectorXd& q,
                                     const Eigen::VectorXd& u) const;

  /**
   * @brief Sum of the potential energies of all force elements [J]
   */
  [[nodiscard]] double potentialEnergy(double t,
                                       const Eigen::VectorXd& q) const;

private:
  void addComponent(std::unique_ptr<Body> body);
  void addComponent(std::unique_ptr<Force> force);
  void addComponent(std::unique_ptr<BilateralConstraint> constraint);
  void addComponent(std::unique_ptr<NonholonomicConstraint> constraint);
  void addComponent(std::unique_ptr<UnilateralConstraint> contact);

  void requireAssembled(const char* caller) const;
  void requireNotAssembled() const;

  double t0_;
  bool assembled_{false};

  int nq_{0};
  int nu_{0};
  int nla_g_{0};
  int nla_gamma_{0};
  int nla_n_{0};

  std::vector<std::unique_ptr<Body>> bodies_;
  std::vector<std::unique_ptr<Force>> forces_;
  std::vector<std::unique_ptr<BilateralConstraint>> bilateral_;
  std::vector<std::unique_ptr<NonholonomicConstraint>> nonholonomic_;
  std::vector<std::unique_ptr<UnilateralConstraint>> contacts_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_MODEL_SYSTEM_HPP
