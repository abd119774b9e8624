// Ticket: 0008_energy_diagnostics

#include "mbs-sim/src/Diagnostics/EnergyTracker.hpp"

#include <algorithm>
#include <cmath>

#include "mbs-sim/src/Model/System.hpp"
#include "mbs-sim/src/Physics/Integration/Trajectory.hpp"

namespace mbs_sim
{

EnergyTracker::SystemEnergy EnergyTracker::computeSystemEnergy(
  const System& system,
  double t,
  const Eigen::VectorXd& q,
  const Eigen::VectorXd& u)
{
  SystemEnergy result{};
  result.kinetic = system.kineticEnergy(t, q, u);
  result.potential = system.potentialEnergy(t, q);
  return result;
}

EnergyTracker::SystemEnergy EnergyTracker::computeSystemEnergy(
  const System& system,
  const Snapshot& snapshot)
{
  return computeSystemEnergy(system, snapshot.t, snapshot.q, snapshot.u);
}

std::vector<EnergyTracker::SystemEnergy> EnergyTracker::computeTrajectoryEnergy(
  const System& system,
  const Trajectory& trajectory)
{
  std::vector<SystemEnergy> energies;
  energies.reserve(trajectory.size());
  for (const auto& snapshot : trajectory)
  {
    energies.push_back(computeSystemEnergy(system, snapshot));
  }
  return energies;
}

bool EnergyTracker::isEnergyInjection(double currentEnergy,
                                      double previousEnergy,
                                      double relativeTolerance,
                                      double absoluteTolerance)
{
  double const deltaE = currentEnergy - previousEnergy;

  if (deltaE <= 0.0)
  {
    return false;
  }

  double const threshold =
    std::max(relativeTolerance * std::abs(currentEnergy), absoluteTolerance);

  return deltaE > threshold;
}

std::optional<std::size_t> EnergyTracker::findEnergyInjection(
  std::span<const SystemEnergy> energies,
  double relativeTolerance,
  double absoluteTolerance)
{
  for (std::size_t i = 1; i < energies.size(); ++i)
  {
    if (isEnergyInjection(energies[i].total(),
                          energies[i - 1].total(),
                          relativeTolerance,
                          absoluteTolerance))
    {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace mbs_sim
