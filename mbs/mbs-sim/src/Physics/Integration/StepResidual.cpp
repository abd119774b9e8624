// Ticket: 0001_generalized_alpha_dae
// Ticket: 0006_contact_active_set

#include "mbs-sim/src/Physics/Integration/StepResidual.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace mbs_sim
{

StepResidual::StepResidual(const Model& model,
                           const UnknownLayout& layout,
                           const GeneralizedAlphaUpdate& update,
                           const StepState& previous)
  : model_{model},
    layout_{layout},
    update_{update},
    previous_{previous},
    t_{previous.t + update.dt()},
    modes_{previous.contactModes}
{
  modes_.resize(static_cast<std::size_t>(layout_.nlaN()),
                ContactMode::Inactive);
}

StepResidual::Evaluation StepResidual::reconstruct(
  const Eigen::VectorXd& x) const
{
  const int nq = layout_.nq();
  const int nu = layout_.nu();

  Evaluation e;
  e.unknowns = layout_.unpack(x);
  const Unknowns& unk = e.unknowns;

  e.yDot.resize(nq + nu);
  e.yDot << unk.qDot, unk.uDot;

  const GeneralizedAlphaUpdate::Trial trial =
    update_.evaluate(previous_.history, e.yDot);
  e.q = trial.y.head(nq);
  e.uSmooth = trial.y.tail(nu);
  e.u = e.uSmooth;
  e.M = massMatrix(e.q);

  if (layout_.hasVelocityJump())
  {
    Eigen::VectorXd impulse = Eigen::VectorXd::Zero(nu);
    if (unk.LaG.size() > 0)
    {
      impulse += model_.Wg(t_, e.q) * unk.LaG;
    }
    if (unk.LaGamma.size() > 0)
    {
      impulse += model_.Wgamma(t_, e.q) * unk.LaGamma;
    }
    if (unk.LaN.size() > 0)
    {
      impulse += model_.WN(t_, e.q) * unk.LaN;
    }

    e.u += solveMass(impulse);
  }

  if (layout_.nlaN() > 0)
  {
    e.laNBar =
      update_.filterMultiplier(previous_.laN, previous_.laNBar, unk.laN);

    ContactQuantities& c = e.contact;
    c.gN = model_.gN(t_, e.q);
    c.kappaHatN =
      update_.positionImpulse(unk.kappaN, previous_.laNBar, e.laNBar);
    c.xiN = model_.xiN(t_, e.q, previous_.u, e.u);
    c.PN = update_.impulse(unk.LaN, previous_.laNBar, e.laNBar);
    c.gNDDot = model_.gNDDot(t_, e.q, e.u, unk.uDot);
    c.laN = unk.laN;
  }

  return e;
}

Eigen::VectorXd StepResidual::evaluate(const Eigen::VectorXd& x) const
{
  using Equation = UnknownLayout::Equation;

  const Evaluation e = reconstruct(x);
  const Unknowns& unk = e.unknowns;
  const Eigen::VectorXd& q = e.q;
  const Eigen::VectorXd& u = e.u;

  Eigen::VectorXd R(layout_.size());
  auto rows = [&](Equation equation)
  {
    const Segment s = layout_.rows(equation);
    return R.segment(s.offset, s.size);
  };
  auto present = [&](Equation equation)
  { return layout_.rows(equation).size > 0; };

  const bool hasBilateral = layout_.nlaG() > 0;
  const bool hasNonholonomic = layout_.nlaGamma() > 0;
  const bool hasContacts = layout_.nlaN() > 0;

  Eigen::SparseMatrix<double> Wg;
  Eigen::SparseMatrix<double> WN;
  if (hasBilateral)
  {
    Wg = model_.Wg(t_, q);
  }
  if (hasContacts)
  {
    WN = model_.WN(t_, q);
  }

  // Kinematic equation with position-level projection, driven by the
  // smooth velocity
  Eigen::VectorXd projection = Eigen::VectorXd::Zero(layout_.nu());
  if (unk.kappaG.size() > 0)
  {
    projection += Wg * unk.kappaG;
  }
  if (hasContacts)
  {
    projection += WN * unk.kappaN;
  }
  rows(Equation::Kinematic) = unk.qDot - model_.qDot(t_, q, e.uSmooth) -
                              model_.B(t_, q) * projection;

  // Equations of motion
  Eigen::VectorXd dynamics = e.M * unk.uDot - model_.h(t_, q, u);
  if (hasBilateral)
  {
    dynamics -= Wg * unk.laG;
  }
  if (hasNonholonomic)
  {
    dynamics -= model_.Wgamma(t_, q) * unk.laGamma;
  }
  if (hasContacts)
  {
    dynamics -= WN * unk.laN;
  }
  rows(Equation::Dynamics) = dynamics;

  // Bilateral constraints
  if (present(Equation::GPosition))
  {
    rows(Equation::GPosition) = model_.g(t_, q);
  }
  if (present(Equation::GVelocity))
  {
    rows(Equation::GVelocity) = model_.gDot(t_, q, u);
  }
  if (present(Equation::GAcceleration))
  {
    rows(Equation::GAcceleration) = model_.gDDot(t_, q, u, unk.uDot);
  }
  if (present(Equation::GammaVelocity))
  {
    rows(Equation::GammaVelocity) = model_.gamma(t_, q, u);
  }
  if (present(Equation::GammaAcceleration))
  {
    rows(Equation::GammaAcceleration) = model_.gammaDot(t_, q, u, unk.uDot);
  }

  // Contacts: kinematic condition where closed, multiplier otherwise
  if (hasContacts)
  {
    const ContactQuantities& c = e.contact;
    auto position = rows(Equation::ContactPosition);
    auto velocity = rows(Equation::ContactVelocity);
    auto acceleration = rows(Equation::ContactAcceleration);
    for (Eigen::Index i = 0; i < layout_.nlaN(); ++i)
    {
      const ContactMode mode = modes_[static_cast<std::size_t>(i)];
      position(i) = inPositionSet(mode) ? c.gN(i) : c.kappaHatN(i);
      velocity(i) = inVelocitySet(mode) ? c.xiN(i) : c.PN(i);
      acceleration(i) = inAccelerationSet(mode) ? c.gNDDot(i) : c.laN(i);
    }
  }

  return R;
}

const Eigen::SparseMatrix<double>& StepResidual::massMatrix(
  const Eigen::VectorXd& q) const
{
  if (mass_.q.size() != q.size() || mass_.q != q)
  {
    mass_.q = q;
    mass_.M = model_.M(t_, q);
    mass_.factorized = false;
  }
  return mass_.M;
}

Eigen::VectorXd StepResidual::solveMass(const Eigen::VectorXd& rhs) const
{
  if (!mass_.factorized)
  {
    mass_.ldlt.compute(mass_.M);
    ++mass_factorizations_;
    if (mass_.ldlt.info() != Eigen::Success)
    {
      throw std::runtime_error(
        "StepResidual: mass matrix factorization failed at t = " +
        std::to_string(t_));
    }
    mass_.factorized = true;
  }

  Eigen::VectorXd solution = mass_.ldlt.solve(rhs);
  if (!solution.allFinite())
  {
    throw std::runtime_error(
      "StepResidual: mass matrix solve failed at t = " + std::to_string(t_));
  }
  return solution;
}

std::vector<ContactMode> StepResidual::classify(const Eigen::VectorXd& x)
{
  std::vector<ContactMode> modes =
    classifyContacts(model_.proxRN(), reconstruct(x).contact);
  classifications_.push_back(modes);
  return modes;
}

bool StepResidual::alternating() const
{
  const std::size_t n = classifications_.size();
  if (n < 4)
  {
    return false;
  }
  const auto& last = classifications_[n - 1];
  const auto& before = classifications_[n - 2];
  return last != before && last == classifications_[n - 3] &&
         before == classifications_[n - 4];
}

void StepResidual::pin(std::vector<ContactMode> modes)
{
  modes_ = std::move(modes);
  classified_ = true;
  frozen_ = true;
  pinned_ = true;
}

void StepResidual::updateDiscreteState(const Eigen::VectorXd& x)
{
  if (layout_.nlaN() == 0 || frozen_)
  {
    return;
  }

  std::vector<ContactMode> modes = classify(x);
  if (alternating())
  {
    pin(widerModes(modes, classifications_[classifications_.size() - 2]));
    return;
  }

  frozen_ = classified_ && modes == modes_;
  classified_ = true;
  modes_ = std::move(modes);
}

bool StepResidual::confirmSolution(const Eigen::VectorXd& x)
{
  if (layout_.nlaN() == 0)
  {
    return true;
  }

  std::vector<ContactMode> modes = classify(x);

  if (modes == modes_)
  {
    frozen_ = true;
    return true;
  }
  if (pinned_ && withinModes(modes, modes_))
  {
    return true;
  }

  if (alternating())
  {
    std::vector<ContactMode> wider =
      widerModes(modes, classifications_[classifications_.size() - 2]);
    const bool unchanged = wider == modes_;
    pin(std::move(wider));
    if (unchanged)
    {
      return true;
    }
    ++rejected_solutions_;
    return false;
  }

  ++rejected_solutions_;
  modes_ = std::move(modes);
  classified_ = true;
  frozen_ = false;
  pinned_ = false;
  return false;
}

void StepResidual::freezeContactModes(std::vector<ContactMode> modes)
{
  if (modes.size() != static_cast<std::size_t>(layout_.nlaN()))
  {
    throw std::invalid_argument(
      "StepResidual::freezeContactModes: expected " +
      std::to_string(layout_.nlaN()) + " modes, got " +
      std::to_string(modes.size()));
  }
  modes_ = std::move(modes);
  classified_ = true;
  frozen_ = true;
  pinned_ = false;
}

}  // namespace mbs_sim
