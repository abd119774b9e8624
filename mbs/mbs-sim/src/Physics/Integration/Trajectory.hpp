// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_PHYSICS_TRAJECTORY_HPP
#define MBS_SIM_PHYSICS_TRAJECTORY_HPP

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

#include "mbs-sim/src/Physics/Integration/ActiveSet.hpp"

namespace mbs_sim
{

/**
 * @brief Accepted state of one time instant with all multipliers
 */
struct Snapshot
{
  double t{0.0};
  Eigen::VectorXd q;
  Eigen::VectorXd u;
  Eigen::VectorXd qDot;
  Eigen::VectorXd uDot;
  Eigen::VectorXd kappaG;
  Eigen::VectorXd LaG;
  Eigen::VectorXd laG;
  Eigen::VectorXd LaGamma;
  Eigen::VectorXd laGamma;
  Eigen::VectorXd kappaN;
  Eigen::VectorXd LaN;
  Eigen::VectorXd laN;
  std::vector<ContactMode> contactModes;
  int iterations{0};
  double error{0.0};
};

/**
 * @brief Immutable, time-ordered sequence of snapshots
 *
 * Built once by TimeStepper at the end of a successful run. Iterable with
 * range-for; stacked accessors return one row per snapshot.
 *
 * @ticket 0001_generalized_alpha_dae
 */
class Trajectory
{
public:
  using const_iterator = std::vector<Snapshot>::const_iterator;

  Trajectory() = default;

  /**
   * @throws std::invalid_argument if times are not strictly increasing
   */
  explicit Trajectory(std::vector<Snapshot> snapshots);

  [[nodiscard]] std::size_t size() const
  {
    return snapshots_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return snapshots_.empty();
  }

  [[nodiscard]] const Snapshot& operator[](std::size_t index) const
  {
    return snapshots_[index];
  }

  [[nodiscard]] const Snapshot& at(std::size_t index) const
  {
    return snapshots_.at(index);
  }

  [[nodiscard]] const Snapshot& front() const
  {
    return snapshots_.front();
  }

  [[nodiscard]] const Snapshot& back() const
  {
    return snapshots_.back();
  }

  [[nodiscard]] const_iterator begin() const
  {
    return snapshots_.begin();
  }

  [[nodiscard]] const_iterator end() const
  {
    return snapshots_.end();
  }

  [[nodiscard]] Eigen::VectorXd times() const;
  [[nodiscard]] Eigen::MatrixXd q() const;
  [[nodiscard]] Eigen::MatrixXd u() const;
  [[nodiscard]] Eigen::MatrixXd laG() const;
  [[nodiscard]] Eigen::MatrixXd laN() const;
  [[nodiscard]] Eigen::MatrixXd LaN() const;

  /**
   * @brief Sum of Newton iterations over all steps
   */
  [[nodiscard]] long totalIterations() const;

private:
  [[nodiscard]] Eigen::MatrixXd stack(Eigen::VectorXd Snapshot::* member) const;

  std::vector<Snapshot> snapshots_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_TRAJECTORY_HPP
