// Ticket: 0001_generalized_alpha_dae

#include "mbs-sim/src/Physics/Integration/TimeStepper.hpp"

#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mbs_sim
{

namespace
{

// Guards against (t1 - t0)/dt landing just above an integer
constexpr double kStepCountSlack = 1e-9;

}  // namespace

std::string_view toString(DriverState state)
{
  switch (state)
  {
    case DriverState::Idle:
      return "Idle";
    case DriverState::Stepping:
      return "Stepping";
    case DriverState::Committed:
      return "Committed";
    case DriverState::Failed:
      return "Failed";
  }
  return "Unknown";
}

TimeStepper::TimeStepper(const Integrator& integrator,
                         double t1,
                         std::shared_ptr<spdlog::logger> logger)
  : integrator_{integrator},
    t1_{t1},
    logger_{logger ? std::move(logger) : spdlog::default_logger()},
    step_count_{0},
    current_{integrator.initialState()}
{
  const double t0 = current_.t;
  if (!(t1 > t0))
  {
    throw std::invalid_argument("TimeStepper: t1 = " + std::to_string(t1) +
                                " must exceed t0 = " + std::to_string(t0));
  }
  const double steps =
    std::ceil((t1 - t0) / integrator.timeStep() - kStepCountSlack);
  if (!(steps <= static_cast<double>(std::numeric_limits<int>::max())))
  {
    throw std::invalid_argument(
      "TimeStepper: (t1 - t0) / dt = " + std::to_string(steps) +
      " exceeds the representable step count");
  }
  step_count_ = static_cast<int>(steps);
}

Trajectory TimeStepper::run()
{
  if (state_ != DriverState::Idle)
  {
    throw std::logic_error(std::string{"TimeStepper::run: driver is "} +
                           std::string{toString(state_)});
  }

  logger_->info("Integrating t = {} .. {} with {} steps of dt = {}",
                current_.t,
                t1_,
                step_count_,
                integrator_.timeStep());

  state_ = DriverState::Stepping;

  std::vector<Snapshot> snapshots;
  snapshots.reserve(static_cast<std::size_t>(step_count_) + 1);
  snapshots.push_back(integrator_.snapshot(current_));

  for (int k = 0; k < step_count_; ++k)
  {
    try
    {
      current_ = integrator_.step(current_);
    }
    catch (const std::exception& failure)
    {
      state_ = DriverState::Failed;
      logger_->error("Integration aborted in step {}/{}: {}",
                     k + 1,
                     step_count_,
                     failure.what());
      throw;
    }
    snapshots.push_back(integrator_.snapshot(current_));
  }

  state_ = DriverState::Committed;
  Trajectory trajectory{std::move(snapshots)};
  logger_->info("Finished at t = {} after {} Newton iterations",
                current_.t,
                trajectory.totalIterations());
  return trajectory;
}

}  // namespace mbs_sim
