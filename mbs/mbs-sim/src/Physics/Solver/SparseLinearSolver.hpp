// Ticket: 0002_newton_solver

#ifndef MBS_SIM_PHYSICS_SPARSE_LINEAR_SOLVER_HPP
#define MBS_SIM_PHYSICS_SPARSE_LINEAR_SOLVER_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <optional>

namespace mbs_sim
{

/**
 * @brief Thin wrapper around Eigen's sparse LU solver
 *
 * Every call factorizes from scratch; nothing is cached between solves.
 *
 * Error handling: Returns std::nullopt for singular or non-finite systems
 * (no exceptions), leaving the decision to the caller.
 *
 * @ticket 0002_newton_solver
 */
class SparseLinearSolver
{
public:
  /**
   * @brief Solve a general square system A·x = b with SparseLU
   * @param A Square sparse matrix
   * @param b Right-hand side (size must equal A.rows())
   * @return Solution, or std::nullopt when the factorization fails
   */
  [[nodiscard]] static std::optional<Eigen::VectorXd> solve(
    const Eigen::SparseMatrix<double>& A,
    const Eigen::VectorXd& b);
};

}  // namespace mbs_sim

#endif  // MBS_SIM_PHYSICS_SPARSE_LINEAR_SOLVER_HPP
