// Ticket: 0004_planar_rigid_body

#ifndef MBS_SIM_UTILS_HPP
#define MBS_SIM_UTILS_HPP

#include <cmath>
#include <concepts>
#include <numbers>

namespace mbs_sim
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

/**
 * @brief Wrap an angle into the half-open interval (-pi, pi]
 *
 * Angles already inside the interval are returned unchanged, so repeated
 * wrapping is a no-op.
 *
 * @param angle Angle [rad]
 * @return Equivalent angle in (-pi, pi] [rad]
 */
template <std::floating_point T>
T wrapToPi(T angle)
{
  constexpr T pi = std::numbers::pi_v<T>;
  if (angle > -pi && angle <= pi)
  {
    return angle;
  }
  T wrapped = std::fmod(angle + pi, 2 * pi);
  if (wrapped <= 0)
  {
    wrapped += 2 * pi;
  }
  return wrapped - pi;
}

}  // namespace mbs_sim

#endif  // MBS_SIM_UTILS_HPP
