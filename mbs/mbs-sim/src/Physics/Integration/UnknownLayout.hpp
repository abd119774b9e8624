// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_PHYSICS_UNKNOWN_LAYOUT_HPP
#define MBS_SIM_PHYSICS_UNKNOWN_LAYOUT_HPP

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>

#include "mbs-sim/src/Physics/Integration/IntegratorSettings.hpp"

namespace mbs_sim
{

/**
 * @brief Contiguous range [offset, offset + size) of a vector
 */
struct Segment
{
  Eigen::Index offset{0};
  Eigen::Index size{0};

  [[nodiscard]] Eigen::Index end() const
  {
    return offset + size;
  }
};

/**
 * @brief Unpacked Newton unknowns of one time step
 *
 * Quantities a formulation does not use are empty vectors.
 */
struct Unknowns
{
  Eigen::VectorXd qDot;
  Eigen::VectorXd uDot;
  Eigen::VectorXd kappaG;    // κ_g, position-level bilateral multiplier
  Eigen::VectorXd LaG;       // Λ_g, velocity-level bilateral multiplier
  Eigen::VectorXd laG;       // λ_g
  Eigen::VectorXd LaGamma;   // Λ_γ
  Eigen::VectorXd laGamma;   // λ_γ
  Eigen::VectorXd kappaN;    // κ_N
  Eigen::VectorXd LaN;       // Λ_N, contact impulse
  Eigen::VectorXd laN;       // λ_N, contact force
};

/**
 * @brief Packing of the step unknowns and ordering of the residual blocks
 *
 * Unknown vector
 *   x = [q̇, u̇, κ_g, Λ_g, λ_g, Λ_γ, λ_γ, κ_N, Λ_N, λ_N]
 *
 * Residual blocks
 *   [kinematic, dynamics, g, ġ, g̈, γ, γ̇, contact position, contact velocity,
 *    contact acceleration]
 *
 * Which blocks are non-empty depends on the DAE index and GGL flag:
 *
 *   formulation     | bilateral rows | γ rows  | bilateral unknowns
 *   ----------------+----------------+---------+-------------------
 *   index 3         | g              | γ       | λ_g
 *   index 2         | ġ              | γ       | λ_g
 *   index 1         | g̈              | γ̇       | λ_g
 *   index 2 + GGL   | g, ġ           | γ       | κ_g, λ_g
 *   index 1 + GGL   | g, ġ, g̈        | γ, γ̇    | κ_g, Λ_g, λ_g (Λ_γ, λ_γ)
 *
 * Contacts always contribute the triad (κ_N, Λ_N, λ_N). The residual has as
 * many rows as x has entries.
 *
 * @ticket 0001_generalized_alpha_dae
 */
class UnknownLayout
{
public:
  enum class Block : std::uint8_t
  {
    QDot,
    UDot,
    KappaG,
    CapitalLambdaG,
    LambdaG,
    CapitalLambdaGamma,
    LambdaGamma,
    KappaN,
    CapitalLambdaN,
    LambdaN,
    Count
  };

  enum class Equation : std::uint8_t
  {
    Kinematic,
    Dynamics,
    GPosition,
    GVelocity,
    GAcceleration,
    GammaVelocity,
    GammaAcceleration,
    ContactPosition,
    ContactVelocity,
    ContactAcceleration,
    Count
  };

  /**
   * @throws std::invalid_argument for negative dimensions, nq or nu zero, or
   *         GGL combined with index 3
   */
  UnknownLayout(int nq,
                int nu,
                int nlaG,
                int nlaGamma,
                int nlaN,
                DAEIndex index,
                bool useGGL);

  [[nodiscard]] Segment segment(Block block) const;
  [[nodiscard]] Segment rows(Equation equation) const;

  [[nodiscard]] Eigen::Index size() const
  {
    return size_;
  }

  [[nodiscard]] int nq() const
  {
    return nq_;
  }

  [[nodiscard]] int nu() const
  {
    return nu_;
  }

  [[nodiscard]] int nlaG() const
  {
    return nla_g_;
  }

  [[nodiscard]] int nlaGamma() const
  {
    return nla_gamma_;
  }

  [[nodiscard]] int nlaN() const
  {
    return nla_n_;
  }

  [[nodiscard]] DAEIndex daeIndex() const
  {
    return index_;
  }

  [[nodiscard]] bool usesGGL() const
  {
    return use_ggl_;
  }

  /**
   * @brief True if any velocity-level multiplier (Λ_g, Λ_γ, Λ_N) exists
   */
  [[nodiscard]] bool hasVelocityJump() const;

  /**
   * @brief Pack unknowns into x
   * @throws std::invalid_argument if a vector has the wrong size
   */
  [[nodiscard]] Eigen::VectorXd pack(const Unknowns& unknowns) const;

  /**
   * @brief Split x into its named unknowns
   * @throws std::invalid_argument if x.size() != size()
   */
  [[nodiscard]] Unknowns unpack(const Eigen::VectorXd& x) const;

private:
  static constexpr auto kBlockCount = static_cast<std::size_t>(Block::Count);
  static constexpr auto kEquationCount =
    static_cast<std::size_t>(Equation::Count);

  int nq_;
  int nu_;
  int nla_g_;
  int nla_gamma_;
  int nla_n_;
  DAEIndex index_;
  bool use_ggl_;

  std::array<Segment, kBlockCount> blocks_{};
  std::array<Segment, kEquationCount> equations_{};
  Eigen::Index size_{0};
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_UNKNOWN_LAYOUT_HPP
