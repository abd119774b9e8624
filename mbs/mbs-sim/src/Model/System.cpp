// Ticket: 0003_system_assembly

#include "mbs-sim/src/Model/System.hpp"

#include <stdexcept>
#include <string>

namespace mbs_sim
{

namespace
{

void appendDenseBlock(const Eigen::MatrixXd& block,
                      int rowOffset,
                      int colOffset,
                      std::vector<Eigen::Triplet<double>>& triplets)
{
  for (Eigen::Index j = 0; j < block.cols(); ++j)
  {
    for (Eigen::Index i = 0; i < block.rows(); ++i)
    {
      if (block(i, j) != 0.0)
      {
        triplets.emplace_back(rowOffset + static_cast<int>(i),
                              colOffset + static_cast<int>(j),
                              block(i, j));
      }
    }
  }
}

Eigen::SparseMatrix<double> fromTriplets(
  int rows,
  int cols,
  const std::vector<Eigen::Triplet<double>>& triplets)
{
  Eigen::SparseMatrix<double> matrix(rows, cols);
  matrix.setFromTriplets(triplets.begin(), triplets.end());
  return matrix;
}

// Stacks the per-constraint vectors returned by `evaluate` at the
// constraints' multiplier offsets.
template <typename Container, typename Evaluate>
Eigen::VectorXd stack(const Container& constraints, int size, Evaluate evaluate)
{
  Eigen::VectorXd result = Eigen::VectorXd::Zero(size);
  for (const auto& constraint : constraints)
  {
    result.segment(constraint->multiplierOffset(), constraint->dimension()) =
      evaluate(*constraint);
  }
  return result;
}

}  // namespace

System::System(double t0) : t0_{t0}
{
}

// ===== Construction =====

void System::requireNotAssembled() const
{
  if (assembled_)
  {
    throw std::logic_error(
      "System: components cannot be added after assemble()");
  }
}

void System::requireAssembled(const char* caller) const
{
  if (!assembled_)
  {
    throw std::logic_error(std::string{"System::"} + caller +
                           ": called before assemble()");
  }
}

void System::addComponent(std::unique_ptr<Body> body)
{
  requireNotAssembled();
  bodies_.push_back(std::move(body));
}

void System::addComponent(std::unique_ptr<Force> force)
{
  requireNotAssembled();
  forces_.push_back(std::move(force));
}

void System::addComponent(std::unique_ptr<BilateralConstraint> constraint)
{
  requireNotAssembled();
  bilateral_.push_back(std::move(constraint));
}

void System::addComponent(std::unique_ptr<NonholonomicConstraint> constraint)
{
  requireNotAssembled();
  nonholonomic_.push_back(std::move(constraint));
}

void System::addComponent(std::unique_ptr<UnilateralConstraint> contact)
{
  requireNotAssembled();
  contacts_.push_back(std::move(contact));
}

void System::assemble()
{
  requireNotAssembled();

  nq_ = 0;
  nu_ = 0;
  for (const auto& body : bodies_)
  {
    body->setOffsets(nq_, nu_);
    nq_ += body->nq();
    nu_ += body->nu();
  }

  auto assignOffsets = [](const auto& constraints)
  {
    int offset = 0;
    for (const auto& constraint : constraints)
    {
      constraint->setMultiplierOffset(offset);
      offset += constraint->dimension();
    }
    return offset;
  };
  nla_g_ = assignOffsets(bilateral_);
  nla_gamma_ = assignOffsets(nonholonomic_);
  nla_n_ = assignOffsets(contacts_);

  // Offsets must be in place before constraints evaluate the configuration
  assembled_ = true;
  const Eigen::VectorXd initial = q0();
  for (const auto& constraint : bilateral_)
  {
    constraint->assemblerCallback(t0_, initial);
  }
  for (const auto& constraint : nonholonomic_)
  {
    constraint->assemblerCallback(t0_, initial);
  }
  for (const auto& contact : contacts_)
  {
    contact->assemblerCallback(t0_, initial);
  }
}

// ===== Dimensions and initial values =====

int System::nq() const
{
  requireAssembled("nq");
  return nq_;
}

int System::nu() const
{
  requireAssembled("nu");
  return nu_;
}

int System::nlaG() const
{
  requireAssembled("nlaG");
  return nla_g_;
}

int System::nlaGamma() const
{
  requireAssembled("nlaGamma");
  return nla_gamma_;
}

int System::nlaN() const
{
  requireAssembled("nlaN");
  return nla_n_;
}

Eigen::VectorXd System::q0() const
{
  requireAssembled("q0");
  Eigen::VectorXd q(nq_);
  for (const auto& body : bodies_)
  {
    q.segment(body->qOffset(), body->nq()) = body->q0();
  }
  return q;
}

Eigen::VectorXd System::u0() const
{
  requireAssembled("u0");
  Eigen::VectorXd u(nu_);
  for (const auto& body : bodies_)
  {
    u.segment(body->uOffset(), body->nu()) = body->u0();
  }
  return u;
}

Eigen::VectorXd System::laG0() const
{
  requireAssembled("laG0");
  return Eigen::VectorXd::Zero(nla_g_);
}

Eigen::VectorXd System::laGamma0() const
{
  requireAssembled("laGamma0");
  return Eigen::VectorXd::Zero(nla_gamma_);
}

Eigen::VectorXd System::laN0() const
{
  requireAssembled("laN0");
  return Eigen::VectorXd::Zero(nla_n_);
}

// ===== Equations of motion =====

Eigen::SparseMatrix<double> System::M(double t, const Eigen::VectorXd& q) const
{
  requireAssembled("M");
  std::vector<Eigen::Triplet<double>> triplets;
  for (const auto& body : bodies_)
  {
    appendDenseBlock(body->massMatrix(t, body->localQ(q)),
                     body->uOffset(),
                     body->uOffset(),
                     triplets);
  }
  return fromTriplets(nu_, nu_, triplets);
}

Eigen::VectorXd System::h(double t,
                          const Eigen::VectorXd& q,
                          const Eigen::VectorXd& u) const
{
  requireAssembled("h");
  Eigen::VectorXd result = Eigen::VectorXd::Zero(nu_);
  for (const auto& body : bodies_)
  {
    result.segment(body->uOffset(), body->nu()) +=
      body->h(t, body->localQ(q), body->localU(u));
  }
  for (const auto& force : forces_)
  {
    force->addGeneralizedForce(t, q, u, result);
  }
  return result;
}

Eigen::VectorXd System::qDot(double t,
                             const Eigen::VectorXd& q,
                             const Eigen::VectorXd& u) const
{
  requireAssembled("qDot");
  Eigen::VectorXd result(nq_);
  for (const auto& body : bodies_)
  {
    result.segment(body->qOffset(), body->nq()) =
      body->qDot(t, body->localQ(q), body->localU(u));
  }
  return result;
}

Eigen::SparseMatrix<double> System::B(double t, const Eigen::VectorXd& q) const
{
  requireAssembled("B");
  std::vector<Eigen::Triplet<double>> triplets;
  for (const auto& body : bodies_)
  {
    appendDenseBlock(
      body->B(t, body->localQ(q)), body->qOffset(), body->uOffset(), triplets);
  }
  return fromTriplets(nq_, nu_, triplets);
}

// ===== Bilateral constraints =====

Eigen::VectorXd System::g(double t, const Eigen::VectorXd& q) const
{
  requireAssembled("g");
  return stack(bilateral_,
               nla_g_,
               [&](const BilateralConstraint& c) { return c.g(t, q); });
}

Eigen::VectorXd System::gDot(double t,
                             const Eigen::VectorXd& q,
                             const Eigen::VectorXd& u) const
{
  requireAssembled("gDot");
  return stack(bilateral_,
               nla_g_,
               [&](const BilateralConstraint& c) { return c.gDot(t, q, u); });
}

Eigen::VectorXd System::gDDot(double t,
                              const Eigen::VectorXd& q,
                              const Eigen::VectorXd& u,
                              const Eigen::VectorXd& uDot) const
{
  requireAssembled("gDDot");
  return stack(bilateral_,
               nla_g_,
               [&](const BilateralConstraint& c)
               { return c.gDDot(t, q, u, uDot); });
}

Eigen::SparseMatrix<double> System::Wg(double t, const Eigen::VectorXd& q) const
{
  requireAssembled("Wg");
  std::vector<Eigen::Triplet<double>> triplets;
  for (const auto& constraint : bilateral_)
  {
    constraint->addWg(t, q, triplets);
  }
  return fromTriplets(nu_, nla_g_, triplets);
}

Eigen::VectorXd System::gamma(double t,
                              const Eigen::VectorXd& q,
                              const Eigen::VectorXd& u) const
{
  requireAssembled("gamma");
  return stack(nonholonomic_,
               nla_gamma_,
               [&](const NonholonomicConstraint& c)
               { return c.gamma(t, q, u); });
}

Eigen::VectorXd System::gammaDot(double t,
                                 const Eigen::VectorXd& q,
                                 const Eigen::VectorXd& u,
                                 const Eigen::VectorXd& uDot) const
{
  requireAssembled("gammaDot");
  return stack(nonholonomic_,
               nla_gamma_,
               [&](const NonholonomicConstraint& c)
               { return c.gammaDot(t, q, u, uDot); });
}

Eigen::SparseMatrix<double> System::Wgamma(double t,
                                           const Eigen::VectorXd& q) const
{
  requireAssembled("Wgamma");
  std::vector<Eigen::Triplet<double>> triplets;
  for (const auto& constraint : nonholonomic_)
  {
    constraint->addWgamma(t, q, triplets);
  }
  return fromTriplets(nu_, nla_gamma_, triplets);
}

// ===== Contacts =====

Eigen::VectorXd System::gN(double t, const Eigen::VectorXd& q) const
{
  requireAssembled("gN");
  return stack(contacts_,
               nla_n_,
               [&](const UnilateralConstraint& c) { return c.gN(t, q); });
}

Eigen::VectorXd System::gNDot(double t,
                              const Eigen::VectorXd& q,
                              const Eigen::VectorXd& u) const
{
  requireAssembled("gNDot");
  return stack(contacts_,
               nla_n_,
               [&](const UnilateralConstraint& c) { return c.gNDot(t, q, u); });
}

Eigen::VectorXd System::gNDDot(double t,
                               const Eigen::VectorXd& q,
                               const Eigen::VectorXd& u,
                               const Eigen::VectorXd& uDot) const
{
  requireAssembled("gNDDot");
  return stack(contacts_,
               nla_n_,
               [&](const UnilateralConstraint& c)
               { return c.gNDDot(t, q, u, uDot); });
}

Eigen::VectorXd System::xiN(double t,
                            const Eigen::VectorXd& q,
                            const Eigen::VectorXd& uPrevious,
                            const Eigen::VectorXd& u) const
{
  requireAssembled("xiN");
  return stack(contacts_,
               nla_n_,
               [&](const UnilateralConstraint& c)
               { return c.xiN(t, q, uPrevious, u); });
}

Eigen::SparseMatrix<double> System::WN(double t, const Eigen::VectorXd& q) const
{
  requireAssembled("WN");
  std::vector<Eigen::Triplet<double>> triplets;
  for (const auto& contact : contacts_)
  {
    contact->addWN(t, q, triplets);
  }
  return fromTriplets(nu_, nla_n_, triplets);
}

Eigen::VectorXd System::proxRN() const
{
  requireAssembled("proxRN");
  Eigen::VectorXd r(nla_n_);
  for (const auto& contact : contacts_)
  {
    r.segment(contact->multiplierOffset(), contact->dimension()).setConstant(
      contact->proxR());
  }
  return r;
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> System::stepCallback(
  double t,
  const Eigen::VectorXd& q,
  const Eigen::VectorXd& u) const
{
  requireAssembled("stepCallback");
  Eigen::VectorXd qOut = q;
  Eigen::VectorXd uOut = u;
  for (const auto& body : bodies_)
  {
    auto [qBody, uBody] =
      body->stepCallback(t, body->localQ(q), body->localU(u));
    qOut.segment(body->qOffset(), body->nq()) = qBody;
    uOut.segment(body->uOffset(), body->nu()) = uBody;
  }
  return {qOut, uOut};
}

// ===== Energy =====

double System::kineticEnergy(double t,
                             const Eigen::VectorXd& q,
                             const Eigen::VectorXd& u) const
{
  return 0.5 * u.dot(M(t, q) * u);
}

double System::potentialEnergy(double t, const Eigen::VectorXd& q) const
{
  requireAssembled("potentialEnergy");
  double energy = 0.0;
  for (const auto& force : forces_)
  {
    energy += force->potentialEnergy(t, q);
  }
  return energy;
}

}  // namespace mbs_sim
