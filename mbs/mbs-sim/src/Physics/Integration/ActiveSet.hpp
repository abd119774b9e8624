// Ticket: 0006_contact_active_set

#ifndef MBS_SIM_PHYSICS_ACTIVE_SET_HPP
#define MBS_SIM_PHYSICS_ACTIVE_SET_HPP

#include <Eigen/Dense>

#include <cstdint>
#include <string_view>
#include <vector>

namespace mbs_sim
{

/**
 * @brief Nested contact state
 *
 * The three index sets of a contact are nested (C ⊆ B ⊆ A), so a single
 * ordered value describes them:
 *
 *   Inactive       not in A
 *   CandidateOnly  in A        (position level closed)
 *   Persistent     in A and B  (velocity level closed)
 *   Smooth         in A, B, C  (acceleration level closed)
 *
 * @ticket 0006_contact_active_set
 */
enum class ContactMode : std::uint8_t
{
  Inactive = 0,
  CandidateOnly = 1,
  Persistent = 2,
  Smooth = 3
};

[[nodiscard]] constexpr bool inPositionSet(ContactMode mode)
{
  return mode >= ContactMode::CandidateOnly;
}

[[nodiscard]] constexpr bool inVelocitySet(ContactMode mode)
{
  return mode >= ContactMode::Persistent;
}

[[nodiscard]] constexpr bool inAccelerationSet(ContactMode mode)
{
  return mode == ContactMode::Smooth;
}

[[nodiscard]] std::string_view toString(ContactMode mode);

/**
 * @brief Kinematic and multiplier quantities a classification looks at,
 * one entry per contact
 */
struct ContactQuantities
{
  Eigen::VectorXd gN;         // Gap
  Eigen::VectorXd kappaHatN;  // κ̂_N
  Eigen::VectorXd xiN;        // Impact-law velocity ξ_N
  Eigen::VectorXd PN;         // Accumulated impulse P_N
  Eigen::VectorXd gNDDot;     // Gap acceleration
  Eigen::VectorXd laN;        // Contact force
};

/**
 * @brief Classify every contact with the prox rules
 *
 *   A: r·g_N  - κ̂_N ≤ 0
 *   B: A and r·ξ_N  - P_N  ≤ 0
 *   C: B and r·g̈_N - λ_N  ≤ 0
 *
 * Pure function; the result is monotone by construction. A comparison that
 * involves NaN does not hold, so such a contact stops at the level before.
 *
 * @param proxR Positive prox parameters r_N
 * @param quantities Values at the current iterate
 * @return One mode per contact
 * @throws std::invalid_argument on size mismatch
 */
[[nodiscard]] std::vector<ContactMode> classifyContacts(
  const Eigen::VectorXd& proxR,
  const ContactQuantities& quantities);

/**
 * @brief Per-contact maximum of two classifications
 * @throws std::invalid_argument on size mismatch
 */
[[nodiscard]] std::vector<ContactMode> widerModes(
  const std::vector<ContactMode>& a,
  const std::vector<ContactMode>& b);

/**
 * @brief True if every contact of inner is at or below its level in outer
 * @throws std::invalid_argument on size mismatch
 */
[[nodiscard]] bool withinModes(const std::vector<ContactMode>& inner,
                               const std::vector<ContactMode>& outer);

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_ACTIVE_SET_HPP
