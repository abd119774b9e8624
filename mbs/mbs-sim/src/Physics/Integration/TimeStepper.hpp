// Ticket: 0001_generalized_alpha_dae

#ifndef MBS_SIM_PHYSICS_TIME_STEPPER_HPP
#define MBS_SIM_PHYSICS_TIME_STEPPER_HPP

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <string_view>

#include "mbs-sim/src/Physics/Integration/Integrator.hpp"
#include "mbs-sim/src/Physics/Integration/StepState.hpp"
#include "mbs-sim/src/Physics/Integration/Trajectory.hpp"

namespace mbs_sim
{

enum class DriverState : std::uint8_t
{
  Idle,
  Stepping,
  Committed,  // Reached t1
  Failed      // A step threw; the trajectory is discarded
};

[[nodiscard]] std::string_view toString(DriverState state);

/**
 * @brief Fixed-step driver from t0 to t1
 *
 * Runs ceil((t1 - t0)/dt) steps of the integrator and collects one snapshot
 * per accepted state (initial state included). There is no step-size
 * control and no retry: the first failing step aborts the run, leaves the
 * driver in DriverState::Failed and propagates the exception. current()
 * then holds the last accepted state.
 *
 * @ticket 0001_generalized_alpha_dae
 */
class TimeStepper
{
public:
  /**
   * @param integrator Integration scheme, must outlive the stepper
   * @param t1 Final time [s], must exceed the initial time
   * @param logger Logger; spdlog's default logger when null
   * @throws std::invalid_argument if t1 <= t0 or the step count exceeds
   *         the range of int
   */
  TimeStepper(const Integrator& integrator,
              double t1,
              std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Integrate to t1
   * @return Trajectory of all accepted states
   * @throws ConvergenceFailure (or subclass) from a failing step
   * @throws std::logic_error if the stepper already ran
   */
  [[nodiscard]] Trajectory run();

  [[nodiscard]] DriverState state() const
  {
    return state_;
  }

  [[nodiscard]] const StepState& current() const
  {
    return current_;
  }

  [[nodiscard]] int stepCount() const
  {
    return step_count_;
  }

private:
  const Integrator& integrator_;
  double t1_;
  std::shared_ptr<spdlog::logger> logger_;
  int step_count_;
  DriverState state_{DriverState::Idle};
  StepState current_;
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_TIME_STEPPER_HPP
