// Ticket: 0002_newton_solver

#include "mbs-sim/src/Physics/Solver/SparseLinearSolver.hpp"

#include <Eigen/SparseLU>

namespace mbs_sim
{

std::optional<Eigen::VectorXd> SparseLinearSolver::solve(
  const Eigen::SparseMatrix<double>& A,
  const Eigen::VectorXd& b)
{
  if (A.rows() != A.cols() || A.rows() != b.size())
  {
    return std::nullopt;
  }
  if (A.rows() == 0)
  {
    return Eigen::VectorXd{};
  }

  Eigen::SparseMatrix<double> compressed = A;
  compressed.makeCompressed();

  Eigen::SparseLU<Eigen::SparseMatrix<double>, Eigen::COLAMDOrdering<int>> lu;
  lu.analyzePattern(compressed);
  lu.factorize(compressed);
  if (lu.info() != Eigen::Success)
  {
    return std::nullopt;
  }

  Eigen::VectorXd x = lu.solve(b);
  if (lu.info() != Eigen::Success || !x.allFinite())
  {
    return std::nullopt;
  }
  return x;
}

}  // namespace mbs_sim
