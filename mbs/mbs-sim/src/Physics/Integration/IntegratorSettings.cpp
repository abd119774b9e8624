// Ticket: 0001_generalized_alpha_dae

#include "mbs-sim/src/Physics/Integration/IntegratorSettings.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace mbs_sim
{

void IntegratorSettings::validate() const
{
  if (!(dt > 0.0) || !std::isfinite(dt))
  {
    throw std::invalid_argument(
      "IntegratorSettings: dt must be positive and finite, got " +
      std::to_string(dt));
  }
  if (!(rhoInf >= 0.0 && rhoInf <= 1.0))
  {
    throw std::invalid_argument(
      "IntegratorSettings: rhoInf must be in [0, 1], got " +
      std::to_string(rhoInf));
  }
  if (!(atol > 0.0))
  {
    throw std::invalid_argument(
      "IntegratorSettings: atol must be positive, got " +
      std::to_string(atol));
  }
  if (maxIterations < 1)
  {
    throw std::invalid_argument(
      "IntegratorSettings: maxIterations must be at least 1, got " +
      std::to_string(maxIterations));
  }
  if (daeIndex != DAEIndex::One && daeIndex != DAEIndex::Two &&
      daeIndex != DAEIndex::Three)
  {
    throw std::invalid_argument("IntegratorSettings: unknown DAE index " +
                                std::to_string(static_cast<int>(daeIndex)));
  }
  if (useGGL && daeIndex == DAEIndex::Three)
  {
    throw std::invalid_argument(
      "IntegratorSettings: GGL stabilization requires DAE index 1 or 2");
  }
  if (!(finiteDifferenceStep >= 0.0))
  {
    throw std::invalid_argument(
      "IntegratorSettings: finiteDifferenceStep must be non-negative, got " +
      std::to_string(finiteDifferenceStep));
  }
  if (!(initialConsistencyTolerance > 0.0))
  {
    throw std::invalid_argument(
      "IntegratorSettings: initialConsistencyTolerance must be positive, "
      "got " +
      std::to_string(initialConsistencyTolerance));
  }
}

}  // namespace mbs_sim
