// Ticket: 0001_generalized_alpha_dae

#include "mbs-sim/src/Physics/Integration/GeneralizedAlpha.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mbs_sim
{

GeneralizedAlphaParameters GeneralizedAlphaParameters::fromSpectralRadius(
  double rhoInf)
{
  if (!(rhoInf >= 0.0 && rhoInf <= 1.0))
  {
    throw std::invalid_argument(
      "GeneralizedAlphaParameters: rhoInf must be in [0, 1], got " +
      std::to_string(rhoInf));
  }

  GeneralizedAlphaParameters p;
  p.rhoInf = rhoInf;
  p.alphaM = (2.0 * rhoInf - 1.0) / (rhoInf + 1.0);
  p.alphaF = rhoInf / (rhoInf + 1.0);
  p.gamma = 0.5 + p.alphaF - p.alphaM;
  p.beta = 0.25 * (p.gamma + 0.5) * (p.gamma + 0.5);
  return p;
}

GeneralizedAlphaUpdate::GeneralizedAlphaUpdate(
  const GeneralizedAlphaParameters& parameters,
  double dt)
  : parameters_{parameters}, dt_{dt}
{
  if (!(dt > 0.0))
  {
    throw std::invalid_argument(
      "GeneralizedAlphaUpdate: dt must be positive, got " + std::to_string(dt));
  }
}

GeneralizedAlphaUpdate::Trial GeneralizedAlphaUpdate::evaluate(
  const AlphaHistory& history,
  const Eigen::VectorXd& yDotNext) const
{
  const auto& p = parameters_;
  Trial trial;
  trial.v = (p.alphaF * history.yDot + (1.0 - p.alphaF) * yDotNext -
             p.alphaM * history.v) /
            (1.0 - p.alphaM);
  trial.y =
    history.y + dt_ * ((1.0 - p.gamma) * history.v + p.gamma * trial.v);
  return trial;
}

AlphaHistory GeneralizedAlphaUpdate::commit(
  const AlphaHistory& history,
  const Eigen::VectorXd& yDotNext) const
{
  Trial trial = evaluate(history, yDotNext);
  return AlphaHistory{std::move(trial.y), yDotNext, std::move(trial.v)};
}

Eigen::VectorXd GeneralizedAlphaUpdate::filterMultiplier(
  const Eigen::VectorXd& laPrevious,
  const Eigen::VectorXd& laBarPrevious,
  const Eigen::VectorXd& laNext) const
{
  const auto& p = parameters_;
  return (p.alphaF * laPrevious + (1.0 - p.alphaF) * laNext -
          p.alphaM * laBarPrevious) /
         (1.0 - p.alphaM);
}

Eigen::VectorXd GeneralizedAlphaUpdate::impulse(
  const Eigen::VectorXd& La,
  const Eigen::VectorXd& laBarPrevious,
  const Eigen::VectorXd& laBarNext) const
{
  const auto& p = parameters_;
  return La +
         dt_ * ((1.0 - p.gamma) * laBarPrevious + p.gamma * laBarNext);
}

Eigen::VectorXd GeneralizedAlphaUpdate::positionImpulse(
  const Eigen::VectorXd& kappa,
  const Eigen::VectorXd& laBarPrevious,
  const Eigen::VectorXd& laBarNext) const
{
  const auto& p = parameters_;
  return kappa + dt_ * dt_ *
                   ((0.5 - p.beta) * laBarPrevious + p.beta * laBarNext);
}

}  // namespace mbs_sim
