// Ticket: 0001_generalized_alpha_dae

#include "mbs-sim/src/Physics/Integration/Trajectory.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mbs_sim
{

Trajectory::Trajectory(std::vector<Snapshot> snapshots)
  : snapshots_{std::move(snapshots)}
{
  for (std::size_t i = 1; i < snapshots_.size(); ++i)
  {
    if (!(snapshots_[i].t > snapshots_[i - 1].t))
    {
      throw std::invalid_argument(
        "Trajectory: snapshot times must be strictly increasing at index " +
        std::to_string(i));
    }
  }
}

Eigen::VectorXd Trajectory::times() const
{
  Eigen::VectorXd t(static_cast<Eigen::Index>(snapshots_.size()));
  for (std::size_t i = 0; i < snapshots_.size(); ++i)
  {
    t(static_cast<Eigen::Index>(i)) = snapshots_[i].t;
  }
  return t;
}

Eigen::MatrixXd Trajectory::stack(Eigen::VectorXd Snapshot::* member) const
{
  if (snapshots_.empty())
  {
    return Eigen::MatrixXd{};
  }
  const auto cols = (snapshots_.front().*member).size();
  Eigen::MatrixXd result(static_cast<Eigen::Index>(snapshots_.size()), cols);
  for (std::size_t i = 0; i < snapshots_.size(); ++i)
  {
    result.row(static_cast<Eigen::Index>(i)) =
      (snapshots_[i].*member).transpose();
  }
  return result;
}

Eigen::MatrixXd Trajectory::q() const
{
  return stack(&Snapshot::q);
}

Eigen::MatrixXd Trajectory::u() const
{
  return stack(&Snapshot::u);
}

Eigen::MatrixXd Trajectory::laG() const
{
  return stack(&Snapshot::laG);
}

Eigen::MatrixXd Trajectory::laN() const
{
  return stack(&Snapshot::laN);
}

Eigen::MatrixXd Trajectory::LaN() const
{
  return stack(&Snapshot::LaN);
}

long Trajectory::totalIterations() const
{
  long total = 0;
  for (const auto& snapshot : snapshots_)
  {
    total += snapshot.iterations;
  }
  return total;
}

}  // namespace mbs_sim
