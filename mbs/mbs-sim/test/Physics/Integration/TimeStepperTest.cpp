// Ticket: 0001_generalized_alpha_dae
// Test: TimeStepper driver states and GeneralizedAlphaIntegrator plumbing

#include <gtest/gtest.h>

#include <Eigen/Sparse>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

#include "mbs-sim/src/Physics/Integration/ActiveSet.hpp"
#include "mbs-sim/src/Physics/Integration/GeneralizedAlphaIntegrator.hpp"
#include "mbs-sim/src/Physics/Integration/Integrator.hpp"
#include "mbs-sim/src/Physics/Integration/TimeStepper.hpp"
#include "mbs-sim/src/Physics/Solver/JacobianProvider.hpp"
#include "mbs-sim/src/Physics/Solver/SolverErrors.hpp"
#include "mbs-sim/test/Helpers/TestSystems.hpp"

namespace mbs_sim
{
namespace test
{

namespace
{

IntegratorSettings pendulumSettings()
{
  IntegratorSettings settings;
  settings.dt = 1e-3;
  return settings;
}

// Jacobian that is identically zero, so every Newton solve fails
std::unique_ptr<JacobianProvider> singularJacobian(Eigen::Index size)
{
  return std::make_unique<AnalyticalJacobian>(
    [size](const Eigen::VectorXd& /* x */)
    { return Eigen::SparseMatrix<double>(size, size); });
}

// Ball half a meter up whose warm start claims q̇_y = -1000, so the first
// Newton iterates jump below the ground and back
StepState fastDescentStart(const GeneralizedAlphaIntegrator& integrator)
{
  StepState start = integrator.initialState();
  const Segment qDot =
    integrator.layout().segment(UnknownLayout::Block::QDot);
  start.x(qDot.offset + 1) = -1000.0;
  return start;
}

// Runs a wrapped integrator from a replacement initial state
class RestartedIntegrator : public Integrator
{
public:
  RestartedIntegrator(const Integrator& inner, StepState initial)
    : inner_{inner}, initial_{std::move(initial)}
  {
  }

  [[nodiscard]] const StepState& initialState() const override
  {
    return initial_;
  }

  [[nodiscard]] StepState step(const StepState& current) const override
  {
    return inner_.step(current);
  }

  [[nodiscard]] Snapshot snapshot(const StepState& state) const override
  {
    return inner_.snapshot(state);
  }

  [[nodiscard]] double timeStep() const override
  {
    return inner_.timeStep();
  }

private:
  const Integrator& inner_;
  StepState initial_;
};

}  // namespace

// ========== Driver ==========

TEST(TimeStepper, StepCount_CeilOfIntervalOverStep)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};

  EXPECT_EQ(TimeStepper(integrator, 0.01, quietLogger()).stepCount(), 10);
  EXPECT_EQ(TimeStepper(integrator, 0.0105, quietLogger()).stepCount(), 11);
  EXPECT_EQ(TimeStepper(integrator, 0.0005, quietLogger()).stepCount(), 1);
}

TEST(TimeStepper, FinalTimeNotAfterStart_Throws)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};

  EXPECT_THROW(TimeStepper(integrator, 0.0, quietLogger()),
               std::invalid_argument);
  EXPECT_THROW(TimeStepper(integrator, -1.0, quietLogger()),
               std::invalid_argument);
}

TEST(TimeStepper, StepCountBeyondIntRange_Throws)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};

  EXPECT_THROW(TimeStepper(integrator, 1e12, quietLogger()),
               std::invalid_argument);
  EXPECT_THROW(TimeStepper(integrator,
                           std::numeric_limits<double>::infinity(),
                           quietLogger()),
               std::invalid_argument);
}

TEST(TimeStepper, Run_CommitsOneSnapshotPerStep)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};
  TimeStepper stepper{integrator, 0.02, quietLogger()};
  EXPECT_EQ(stepper.state(), DriverState::Idle);

  const Trajectory trajectory = stepper.run();

  EXPECT_EQ(stepper.state(), DriverState::Committed);
  ASSERT_EQ(trajectory.size(), 21U);
  EXPECT_DOUBLE_EQ(trajectory.front().t, 0.0);
  EXPECT_NEAR(trajectory.back().t, 0.02, 1e-12);
  EXPECT_NEAR(stepper.current().t, 0.02, 1e-12);

  const Eigen::VectorXd times = trajectory.times();
  for (Eigen::Index i = 1; i < times.size(); ++i)
  {
    EXPECT_NEAR(times(i) - times(i - 1), 1e-3, 1e-12);
  }
  EXPECT_GT(trajectory.totalIterations(), 0);
}

TEST(TimeStepper, RunTwice_Throws)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};
  TimeStepper stepper{integrator, 0.005, quietLogger()};

  (void)stepper.run();
  EXPECT_THROW((void)stepper.run(), std::logic_error);
  EXPECT_EQ(stepper.state(), DriverState::Committed);
}

TEST(TimeStepper, FailingStep_LeavesFailedStateAndPropagates)
{
  auto system = makePendulum();
  IntegratorSettings settings = pendulumSettings();
  settings.jacobian = JacobianScheme::Custom;
  GeneralizedAlphaIntegrator integrator{*system, settings, quietLogger()};
  integrator.setJacobianProvider(singularJacobian(integrator.layout().size()));
  TimeStepper stepper{integrator, 0.01, quietLogger()};

  EXPECT_THROW((void)stepper.run(), ConvergenceFailure);
  EXPECT_EQ(stepper.state(), DriverState::Failed);
  // Last accepted state is the initial one
  EXPECT_DOUBLE_EQ(stepper.current().t, 0.0);
  EXPECT_THROW((void)stepper.run(), std::logic_error);
}

TEST(TimeStepper, UnsettledContactModes_LeavesFailedState)
{
  auto system = makeBallOnGround(0.5);
  IntegratorSettings settings = pendulumSettings();
  settings.maxIterations = 1;
  GeneralizedAlphaIntegrator const integrator{*system, settings, quietLogger()};
  RestartedIntegrator const restarted{integrator,
                                      fastDescentStart(integrator)};
  TimeStepper stepper{restarted, 0.01, quietLogger()};

  EXPECT_THROW((void)stepper.run(), ActiveSetOscillation);
  EXPECT_EQ(stepper.state(), DriverState::Failed);
  EXPECT_DOUBLE_EQ(stepper.current().t, 0.0);
}

TEST(TimeStepper, ToString_NamesEveryState)
{
  EXPECT_EQ(toString(DriverState::Idle), "Idle");
  EXPECT_EQ(toString(DriverState::Stepping), "Stepping");
  EXPECT_EQ(toString(DriverState::Committed), "Committed");
  EXPECT_EQ(toString(DriverState::Failed), "Failed");
}

// ========== Integrator ==========

TEST(GeneralizedAlphaIntegrator, CustomSchemeWithoutProvider_StepThrows)
{
  auto system = makePendulum();
  IntegratorSettings settings = pendulumSettings();
  settings.jacobian = JacobianScheme::Custom;
  GeneralizedAlphaIntegrator const integrator{*system, settings, quietLogger()};

  EXPECT_THROW((void)integrator.step(integrator.initialState()),
               std::logic_error);
}

TEST(GeneralizedAlphaIntegrator, NullProvider_Throws)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator integrator{
    *system, pendulumSettings(), quietLogger()};

  EXPECT_THROW(integrator.setJacobianProvider(nullptr), std::invalid_argument);
}

TEST(GeneralizedAlphaIntegrator, InvalidSettings_Throw)
{
  auto system = makePendulum();
  IntegratorSettings settings = pendulumSettings();
  settings.rhoInf = 2.0;

  EXPECT_THROW(
    GeneralizedAlphaIntegrator(*system, settings, quietLogger()),
    std::invalid_argument);
}

TEST(GeneralizedAlphaIntegrator, Step_LeavesInputStateUntouched)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};
  const StepState initial = integrator.initialState();

  const StepState first = integrator.step(initial);
  const StepState second = integrator.step(initial);

  EXPECT_EQ(initial.q, integrator.initialState().q);
  EXPECT_EQ(initial.x, integrator.initialState().x);
  EXPECT_DOUBLE_EQ(first.t, 1e-3);
  EXPECT_EQ(first.q, second.q);
  EXPECT_EQ(first.u, second.u);
}

TEST(GeneralizedAlphaIntegrator, CentralDifferences_AgreeWithForward)
{
  auto system = makePendulum();
  IntegratorSettings forward = pendulumSettings();
  IntegratorSettings central = pendulumSettings();
  central.jacobian = JacobianScheme::CentralDifference;

  GeneralizedAlphaIntegrator const a{*system, forward, quietLogger()};
  GeneralizedAlphaIntegrator const b{*system, central, quietLogger()};
  TimeStepper stepperA{a, 0.1, quietLogger()};
  TimeStepper stepperB{b, 0.1, quietLogger()};

  const Trajectory ta = stepperA.run();
  const Trajectory tb = stepperB.run();
  ASSERT_EQ(ta.size(), tb.size());
  EXPECT_LT((ta.q() - tb.q()).lpNorm<Eigen::Infinity>(), 1e-7);
}

TEST(GeneralizedAlphaIntegrator, UnsettledContactModes_ThrowOscillation)
{
  auto system = makeBallOnGround(0.5);
  IntegratorSettings settings = pendulumSettings();
  settings.maxIterations = 1;
  GeneralizedAlphaIntegrator const integrator{*system, settings, quietLogger()};

  EXPECT_THROW((void)integrator.step(fastDescentStart(integrator)),
               ActiveSetOscillation);
}

TEST(GeneralizedAlphaIntegrator, FastDescentWarmStart_SettlesToFreeFlight)
{
  auto system = makeBallOnGround(0.5);
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};

  const StepState next = integrator.step(fastDescentStart(integrator));

  EXPECT_NEAR(next.q(1), 0.5, 1e-5);
  EXPECT_NEAR(next.u(1), -9.81e-3, 1e-4);
  ASSERT_EQ(next.contactModes.size(), 1U);
  EXPECT_EQ(next.contactModes[0], ContactMode::Inactive);
  EXPECT_LE(next.iterations, integrator.settings().maxIterations);
}

TEST(GeneralizedAlphaIntegrator, Snapshot_UnpacksMultipliers)
{
  auto system = makeBallOnGround();
  GeneralizedAlphaIntegrator const integrator{
    *system, pendulumSettings(), quietLogger()};

  const Snapshot s = integrator.snapshot(integrator.initialState());

  EXPECT_DOUBLE_EQ(s.t, 0.0);
  EXPECT_EQ(s.kappaN.size(), 1);
  EXPECT_EQ(s.LaN.size(), 1);
  EXPECT_EQ(s.laN.size(), 1);
  EXPECT_EQ(s.laG.size(), 0);
  EXPECT_EQ(s.contactModes.size(), 1U);
  EXPECT_EQ(s.iterations, 0);
}

}  // namespace test
}  // namespace mbs_sim
