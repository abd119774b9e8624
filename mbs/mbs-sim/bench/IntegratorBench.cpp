// Ticket: 0010_integrator_benchmarks
//
// Generalized-alpha integrator benchmarks: cost of a single Newton-solved step
// for each DAE formulation, and full runs through impact and resting contact.

#include <benchmark/benchmark.h>

#include <cmath>
#include <memory>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "mbs-sim/src/Model/BodyPoint.hpp"
#include "mbs-sim/src/Model/Particle.hpp"
#include "mbs-sim/src/Model/System.hpp"
#include "mbs-sim/src/Physics/Constraints/PointPlaneContact.hpp"
#include "mbs-sim/src/Physics/Constraints/RodConstraint.hpp"
#include "mbs-sim/src/Physics/Forces/ConstantForce.hpp"
#include "mbs-sim/src/Physics/Integration/GeneralizedAlphaIntegrator.hpp"
#include "mbs-sim/src/Physics/Integration/TimeStepper.hpp"

using namespace mbs_sim;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr double kTimeStep = 1e-3;    // Step size [s]
constexpr double kAmplitude = 0.5;    // Pendulum release angle [rad]
constexpr double kDropHeight = 1.0;   // Ball release height [m]
constexpr double kRunDuration = 0.6;  // Ball simulated time [s]

std::shared_ptr<spdlog::logger> benchLogger()
{
  static auto logger = std::make_shared<spdlog::logger>(
    "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
  return logger;
}

std::unique_ptr<System> makePendulum()
{
  auto system = std::make_unique<System>();
  auto& bob = system->add(std::make_unique<Particle>(
    1.0,
    Eigen::Vector3d{std::sin(kAmplitude), -std::cos(kAmplitude), 0.0}));
  system->add(std::make_unique<GravityForce>(bob));
  system->add(std::make_unique<RodConstraint>(
    BodyPoint::fixed(Eigen::Vector3d::Zero()), BodyPoint::on(bob)));
  system->assemble();
  return system;
}

std::unique_ptr<System> makeBouncingBall(double restitution)
{
  auto system = std::make_unique<System>();
  auto& ball = system->add(std::make_unique<Particle>(
    1.0, Eigen::Vector3d{0.0, kDropHeight, 0.0}));
  system->add(std::make_unique<GravityForce>(ball));

  PointPlaneContact::Parameters parameters;
  parameters.restitution = restitution;
  system->add(std::make_unique<PointPlaneContact>(BodyPoint::on(ball),
                                                  Eigen::Vector3d::Zero(),
                                                  Eigen::Vector3d::UnitY(),
                                                  parameters));
  system->assemble();
  return system;
}

IntegratorSettings formulationSettings(int index)
{
  IntegratorSettings settings;
  settings.dt = kTimeStep;
  switch (index)
  {
    case 1:
      settings.daeIndex = DAEIndex::One;
      break;
    case 2:
      settings.daeIndex = DAEIndex::Two;
      break;
    default:
      settings.daeIndex = DAEIndex::Three;
      settings.useGGL = false;
      break;
  }
  return settings;
}

}  // namespace

// ============================================================================
// Benchmark: PendulumStep
// ============================================================================

// One step of the pendulum from its release state. Arg: DAE index (the index
// 1 and 2 variants carry GGL stabilization).
static void BM_PendulumStep(benchmark::State& state)
{
  auto system = makePendulum();
  GeneralizedAlphaIntegrator const integrator{
    *system, formulationSettings(static_cast<int>(state.range(0))),
    benchLogger()};
  const StepState initial = integrator.initialState();

  for (auto _ : state)
  {
    StepState next = integrator.step(initial);
    benchmark::DoNotOptimize(next.x.data());
  }

  state.counters["unknowns"] =
    static_cast<double>(integrator.layout().size());
}
BENCHMARK(BM_PendulumStep)->Arg(1)->Arg(2)->Arg(3);

// ============================================================================
// Benchmark: JacobianScheme
// ============================================================================

// Pendulum step with forward (0) or central (1) difference Jacobians
static void BM_PendulumStep_JacobianScheme(benchmark::State& state)
{
  auto system = makePendulum();
  IntegratorSettings settings = formulationSettings(2);
  settings.jacobian = state.range(0) == 0 ? JacobianScheme::ForwardDifference
                                          : JacobianScheme::CentralDifference;
  GeneralizedAlphaIntegrator const integrator{
    *system, settings, benchLogger()};
  const StepState initial = integrator.initialState();

  for (auto _ : state)
  {
    StepState next = integrator.step(initial);
    benchmark::DoNotOptimize(next.x.data());
  }
}
BENCHMARK(BM_PendulumStep_JacobianScheme)->Arg(0)->Arg(1);

// ============================================================================
// Benchmark: BouncingBall
// ============================================================================

// Full run through free fall, impact and resting contact. Arg: restitution
// in percent.
static void BM_BouncingBall_Run(benchmark::State& state)
{
  const double restitution = static_cast<double>(state.range(0)) / 100.0;
  auto system = makeBouncingBall(restitution);
  IntegratorSettings settings;
  settings.dt = kTimeStep;
  GeneralizedAlphaIntegrator const integrator{
    *system, settings, benchLogger()};

  int steps = 0;
  for (auto _ : state)
  {
    TimeStepper stepper{integrator, kRunDuration, benchLogger()};
    steps = stepper.stepCount();
    Trajectory trajectory = stepper.run();
    benchmark::DoNotOptimize(trajectory.size());
  }

  state.SetItemsProcessed(state.iterations() * steps);
}
BENCHMARK(BM_BouncingBall_Run)->Arg(0)->Arg(50)->Unit(benchmark::kMillisecond);
