// Ticket: 0001_generalized_alpha_dae

#include "mbs-sim/src/Physics/Integration/GeneralizedAlphaIntegrator.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "mbs-sim/src/Physics/Integration/ConsistentInitialization.hpp"
#include "mbs-sim/src/Physics/Integration/StepResidual.hpp"
#include "mbs-sim/src/Physics/Solver/SolverErrors.hpp"

namespace mbs_sim
{

namespace
{

const IntegratorSettings& validated(const IntegratorSettings& settings)
{
  settings.validate();
  return settings;
}

NewtonSolver::Settings newtonSettings(const IntegratorSettings& settings)
{
  NewtonSolver::Settings newton;
  newton.atol = settings.atol;
  newton.maxIterations = settings.maxIterations;
  newton.lineSearch = settings.lineSearch;
  return newton;
}

std::unique_ptr<JacobianProvider> makeJacobian(
  const IntegratorSettings& settings)
{
  switch (settings.jacobian)
  {
    case JacobianScheme::ForwardDifference:
      return std::make_unique<FiniteDifferenceJacobian>(
        DifferenceScheme::Forward, settings.finiteDifferenceStep);
    case JacobianScheme::CentralDifference:
      return std::make_unique<FiniteDifferenceJacobian>(
        DifferenceScheme::Central, settings.finiteDifferenceStep);
    case JacobianScheme::Custom:
      return nullptr;
  }
  return nullptr;
}

}  // namespace

GeneralizedAlphaIntegrator::GeneralizedAlphaIntegrator(
  const Model& model,
  const IntegratorSettings& settings,
  std::shared_ptr<spdlog::logger> logger)
  : model_{model},
    settings_{validated(settings)},
    logger_{logger ? std::move(logger) : spdlog::default_logger()},
    layout_{model.nq(),
            model.nu(),
            model.nlaG(),
            model.nlaGamma(),
            model.nlaN(),
            settings_.daeIndex,
            settings_.useGGL},
    update_{GeneralizedAlphaParameters::fromSpectralRadius(settings_.rhoInf),
            settings_.dt},
    newton_{newtonSettings(settings_)},
    jacobian_{makeJacobian(settings_)},
    initial_{makeConsistentInitialState(
      model_, layout_, settings_.initialConsistencyTolerance)}
{
  const auto& p = update_.parameters();
  logger_->debug(
    "GeneralizedAlphaIntegrator: {} unknowns (nq={}, nu={}, nla_g={}, "
    "nla_gamma={}, nla_N={}), index {}{}, rho_inf={} (alpha_m={:.4f}, "
    "alpha_f={:.4f}, gamma={:.4f}, beta={:.4f})",
    layout_.size(),
    layout_.nq(),
    layout_.nu(),
    layout_.nlaG(),
    layout_.nlaGamma(),
    layout_.nlaN(),
    static_cast<int>(settings_.daeIndex),
    settings_.useGGL ? " + GGL" : "",
    p.rhoInf,
    p.alphaM,
    p.alphaF,
    p.gamma,
    p.beta);
}

void GeneralizedAlphaIntegrator::setJacobianProvider(
  std::unique_ptr<JacobianProvider> provider)
{
  if (!provider)
  {
    throw std::invalid_argument(
      "GeneralizedAlphaIntegrator: Jacobian provider must not be null");
  }
  jacobian_ = std::move(provider);
}

StepState GeneralizedAlphaIntegrator::step(const StepState& current) const
{
  if (!jacobian_)
  {
    throw std::logic_error(
      "GeneralizedAlphaIntegrator: JacobianScheme::Custom requires "
      "setJacobianProvider()");
  }

  StepResidual residual{model_, layout_, update_, current};
  const double t = residual.time();

  const NewtonSolver::Result result =
    newton_.solve(residual, current.x, *jacobian_);

  if (residual.activeSetPinned())
  {
    logger_->debug("t = {:.6f}: alternating contact modes pinned", t);
  }
  if (residual.rejectedSolutions() > 0)
  {
    logger_->warn(
      "t = {:.6f}: contact active set changed at {} converged iterate(s)",
      t,
      residual.rejectedSolutions());
  }

  if (!result.converged)
  {
    const std::string message =
      fmt::format("Newton not converged at t = {:.6f} after {} iterations "
                  "with error {:.3e}",
                  t,
                  result.iterations,
                  result.error);
    logger_->error(message);

    if (layout_.nlaN() > 0 && !residual.activeSetSettled())
    {
      throw ActiveSetOscillation(message + " (contact active set unsettled)",
                                 t,
                                 result.iterations,
                                 result.error);
    }
    throw ConvergenceFailure(message, t, result.iterations, result.error);
  }

  logger_->debug("t = {:.6f}: Newton {}/{} iterations, error {:.3e}",
                 t,
                 result.iterations,
                 settings_.maxIterations,
                 result.error);

  StepResidual::Evaluation e = residual.reconstruct(result.x);
  AlphaHistory history = update_.commit(current.history, e.yDot);
  auto [q, u] = model_.stepCallback(t, e.q, e.u);
  history.y << q, u;

  StepState next;
  next.t = t;
  next.q = std::move(q);
  next.u = std::move(u);
  next.qDot = e.unknowns.qDot;
  next.uDot = e.unknowns.uDot;
  next.history = std::move(history);
  next.laN = e.unknowns.laN;
  next.laNBar = std::move(e.laNBar);
  next.x = result.x;
  next.contactModes = residual.contactModes();
  next.iterations = result.iterations;
  next.error = result.error;
  return next;
}

Snapshot GeneralizedAlphaIntegrator::snapshot(const StepState& state) const
{
  Unknowns unknowns = layout_.unpack(state.x);

  Snapshot s;
  s.t = state.t;
  s.q = state.q;
  s.u = state.u;
  s.qDot = state.qDot;
  s.uDot = state.uDot;
  s.kappaG = std::move(unknowns.kappaG);
  s.LaG = std::move(unknowns.LaG);
  s.laG = std::move(unknowns.laG);
  s.LaGamma = std::move(unknowns.LaGamma);
  s.laGamma = std::move(unknowns.laGamma);
  s.kappaN = std::move(unknowns.kappaN);
  s.LaN = std::move(unknowns.LaN);
  s.laN = std::move(unknowns.laN);
  s.contactModes = state.contactModes;
  s.iterations = state.iterations;
  s.error = state.error;
  return s;
}

}  // namespace mbs_sim
