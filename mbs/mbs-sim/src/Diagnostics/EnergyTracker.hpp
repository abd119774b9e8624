// Ticket: 0008_energy_diagnostics

#ifndef MBS_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP
#define MBS_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace mbs_sim
{

// Forward declaration
class System;
class Trajectory;
struct Snapshot;

/**
 * @brief Mechanical energy bookkeeping for assembled systems
 *
 * Kinetic energy T = 0.5 u^T M(q) u, potential energy from the force
 * elements of the System. Used by tests and benchmarks to check that
 * numerically damped integration (ρ∞ < 1) never injects energy.
 *
 * @ticket 0008_energy_diagnostics
 */
class EnergyTracker
{
public:
  /**
   * @brief System-level energy summary
   */
  struct SystemEnergy
  {
    double kinetic{0.0};    // Kinetic energy [J]
    double potential{0.0};  // Potential energy [J]

    /**
     * @brief Total mechanical energy
     * @return kinetic + potential [J]
     */
    [[nodiscard]] double total() const
    {
      return kinetic + potential;
    }
  };

  static SystemEnergy computeSystemEnergy(const System& system,
                                          double t,
                                          const Eigen::VectorXd& q,
                                          const Eigen::VectorXd& u);

  static SystemEnergy computeSystemEnergy(const System& system,
                                          const Snapshot& snapshot);

  /**
   * @brief Energy of every snapshot, in trajectory order
   */
  static std::vector<SystemEnergy> computeTrajectoryEnergy(
    const System& system,
    const Trajectory& trajectory);

  /**
   * @brief Check if energy change exceeds tolerance (anomaly detection)
   *
   * Uses the larger of relative and absolute tolerance:
   * - Relative: relativeTolerance * |currentEnergy|
   * - Absolute: absoluteTolerance
   *
   * Energy decrease is allowed (dissipation).
   *
   * @param currentEnergy Current total energy [J]
   * @param previousEnergy Previous total energy [J]
   * @param relativeTolerance Relative tolerance (default 1e-6)
   * @param absoluteTolerance Absolute tolerance [J] (default 1e-9)
   * @return true if energy increased beyond tolerance
   */
  static bool isEnergyInjection(double currentEnergy,
                                double previousEnergy,
                                double relativeTolerance = 1e-6,
                                double absoluteTolerance = 1e-9);

  /**
   * @brief First index i with an energy injection from i-1 to i
   * @return std::nullopt if the sequence never injects energy
   */
  static std::optional<std::size_t> findEnergyInjection(
    std::span<const SystemEnergy> energies,
    double relativeTolerance = 1e-6,
    double absoluteTolerance = 1e-9);
};

}  // namespace mbs_sim

#endif  // MBS_SIM_DIAGNOSTICS_ENERGY_TRACKER_HPP
