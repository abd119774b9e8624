// Ticket: 0007_consistent_initialization

#include "mbs-sim/src/Physics/Integration/ConsistentInitialization.hpp"

#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "mbs-sim/src/Physics/Solver/SolverErrors.hpp"
#include "mbs-sim/src/Physics/Solver/SparseLinearSolver.hpp"

namespace mbs_sim
{

namespace
{

void appendSparse(const Eigen::SparseMatrix<double>& block,
                  int rowOffset,
                  int colOffset,
                  double scale,
                  std::vector<Eigen::Triplet<double>>& triplets)
{
  for (int k = 0; k < block.outerSize(); ++k)
  {
    for (Eigen::SparseMatrix<double>::InnerIterator it(block, k); it; ++it)
    {
      triplets.emplace_back(rowOffset + static_cast<int>(it.row()),
                            colOffset + static_cast<int>(it.col()),
                            scale * it.value());
    }
  }
}

void requireSmall(const Eigen::VectorXd& value,
                  double tolerance,
                  const char* name,
                  double t0)
{
  if (value.size() == 0)
  {
    return;
  }
  const double violation = value.lpNorm<Eigen::Infinity>();
  if (violation > tolerance)
  {
    throw InconsistentInitialConditions(
      fmt::format("Initial conditions are not consistent at t0 = {}: "
                  "max |{}| = {:.3e} exceeds {:.3e}",
                  t0,
                  name,
                  violation,
                  tolerance));
  }
}

}  // namespace

StepState makeConsistentInitialState(const Model& model,
                                     const UnknownLayout& layout,
                                     double tolerance)
{
  const int nq = layout.nq();
  const int nu = layout.nu();
  const int nlaG = layout.nlaG();
  const int nlaGamma = layout.nlaGamma();
  const int nlaN = layout.nlaN();

  const double t0 = model.t0();
  const Eigen::VectorXd q0 = model.q0();
  const Eigen::VectorXd u0 = model.u0();
  const Eigen::VectorXd laN0 = model.laN0();

  if (q0.size() != nq || u0.size() != nu || laN0.size() != nlaN)
  {
    throw InconsistentInitialConditions(
      "Initial state dimensions do not match the model dimensions");
  }

  const Eigen::SparseMatrix<double> M = model.M(t0, q0);
  const Eigen::SparseMatrix<double> Wg = model.Wg(t0, q0);
  const Eigen::SparseMatrix<double> Wgamma = model.Wgamma(t0, q0);

  const Eigen::VectorXd zeroAcceleration = Eigen::VectorXd::Zero(nu);
  const Eigen::VectorXd zetaG = model.gDDot(t0, q0, u0, zeroAcceleration);
  const Eigen::VectorXd zetaGamma =
    model.gammaDot(t0, q0, u0, zeroAcceleration);

  const int n = nu + nlaG + nlaGamma;
  std::vector<Eigen::Triplet<double>> triplets;
  appendSparse(M, 0, 0, 1.0, triplets);
  appendSparse(Wg, 0, nu, -1.0, triplets);
  appendSparse(Wgamma, 0, nu + nlaG, -1.0, triplets);
  appendSparse(
    Eigen::SparseMatrix<double>(Wg.transpose()), nu, 0, 1.0, triplets);
  appendSparse(Eigen::SparseMatrix<double>(Wgamma.transpose()),
               nu + nlaG,
               0,
               1.0,
               triplets);
  Eigen::SparseMatrix<double> A(n, n);
  A.setFromTriplets(triplets.begin(), triplets.end());

  Eigen::VectorXd rhs(n);
  rhs.head(nu) = model.h(t0, q0, u0);
  if (nlaN > 0)
  {
    rhs.head(nu) += model.WN(t0, q0) * laN0;
  }
  rhs.segment(nu, nlaG) = -zetaG;
  rhs.tail(nlaGamma) = -zetaGamma;

  const auto solution = SparseLinearSolver::solve(A, rhs);
  if (!solution)
  {
    throw InconsistentInitialConditions(fmt::format(
      "Initial accelerations at t0 = {}: singular saddle point system "
      "(redundant constraints?)",
      t0));
  }

  const Eigen::VectorXd uDot0 = solution->head(nu);
  const Eigen::VectorXd laG0 = solution->segment(nu, nlaG);
  const Eigen::VectorXd laGamma0 = solution->tail(nlaGamma);

  requireSmall(model.g(t0, q0), tolerance, "g", t0);
  requireSmall(model.gDot(t0, q0, u0), tolerance, "g_dot", t0);
  requireSmall(model.gDDot(t0, q0, u0, uDot0), tolerance, "g_ddot", t0);
  requireSmall(model.gamma(t0, q0, u0), tolerance, "gamma", t0);
  requireSmall(model.gammaDot(t0, q0, u0, uDot0), tolerance, "gamma_dot", t0);

  if (nlaN > 0)
  {
    const Eigen::VectorXd gN0 = model.gN(t0, q0);
    if (gN0.minCoeff() < -tolerance)
    {
      throw InconsistentInitialConditions(
        fmt::format("Initial configuration at t0 = {} penetrates a contact: "
                    "min g_N = {:.3e}",
                    t0,
                    gN0.minCoeff()));
    }
  }

  StepState state;
  state.t = t0;
  state.q = q0;
  state.u = u0;
  state.qDot = model.qDot(t0, q0, u0);
  state.uDot = uDot0;

  state.history.y.resize(nq + nu);
  state.history.y << q0, u0;
  state.history.yDot.resize(nq + nu);
  state.history.yDot << state.qDot, state.uDot;
  state.history.v = state.history.yDot;

  state.laN = laN0;
  state.laNBar = laN0;
  state.contactModes.assign(static_cast<std::size_t>(nlaN),
                            ContactMode::Inactive);

  using Block = UnknownLayout::Block;
  Unknowns unknowns;
  auto zeros = [&](Block block) -> Eigen::VectorXd
  { return Eigen::VectorXd::Zero(layout.segment(block).size); };
  unknowns.qDot = state.qDot;
  unknowns.uDot = state.uDot;
  unknowns.kappaG = zeros(Block::KappaG);
  unknowns.LaG = zeros(Block::CapitalLambdaG);
  unknowns.laG = laG0;
  unknowns.LaGamma = zeros(Block::CapitalLambdaGamma);
  unknowns.laGamma = laGamma0;
  unknowns.kappaN = zeros(Block::KappaN);
  unknowns.LaN = zeros(Block::CapitalLambdaN);
  unknowns.laN = laN0;
  state.x = layout.pack(unknowns);

  return state;
}

}  // namespace mbs_sim
