// Ticket: 0003_system_assembly

#ifndef MBS_SIM_PHYSICS_CONSTRAINT_HPP
#define MBS_SIM_PHYSICS_CONSTRAINT_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <vector>

namespace mbs_sim
{

/**
 * @brief Common base of all constraint elements of a System
 *
 * Each constraint owns `dimension()` consecutive multipliers. Their position
 * in the global multiplier vector (la_g, la_γ or la_N, depending on the
 * derived kind) is assigned by System::assemble() through
 * setMultiplierOffset().
 *
 * Generalized force directions are returned as triplets into a global
 * nu x n_multiplier matrix, using the multiplier offset as column base.
 *
 * Error handling: Implementations throw std::invalid_argument for invalid
 * parameters at construction or in assemblerCallback().
 *
 * @ticket 0003_system_assembly
 */
class Constraint
{
public:
  virtual ~Constraint() = default;

  /**
   * @brief Number of scalar constraint equations
   */
  [[nodiscard]] virtual int dimension() const = 0;

  /**
   * @brief Finalize parameters that depend on the initial configuration
   * @param t0 Initial time [s]
   * @param q0 Global initial coordinates
   */
  virtual void assemblerCallback(double /* t0 */,
                                 const Eigen::VectorXd& /* q0 */)
  {
  }

  [[nodiscard]] int multiplierOffset() const
  {
    return multiplier_offset_;
  }

  void setMultiplierOffset(int offset)
  {
    multiplier_offset_ = offset;
  }

protected:
  Constraint() = default;
  Constraint(const Constraint&) = default;
  Constraint& operator=(const Constraint&) = default;
  Constraint(Constraint&&) noexcept = default;
  Constraint& operator=(Constraint&&) noexcept = default;

private:
  int multiplier_offset_{-1};
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_CONSTRAINT_HPP
