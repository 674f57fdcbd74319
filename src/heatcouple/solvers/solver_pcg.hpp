/**
 * @file solvers/solver_pcg.hpp
 * @brief Gauss-Seidel preconditioned conjugate gradient solver
 */

#ifndef HEATCOUPLE_SOLVERS_SOLVER_PCG_HPP
#define HEATCOUPLE_SOLVERS_SOLVER_PCG_HPP

#include "heatcouple/core/solver_interface.hpp"
#include "mfem.hpp"

namespace heatcouple
{

/**
 * @class PcgSolver
 * @brief CG with a symmetric Gauss-Seidel smoother
 *
 * Throws SolverDivergence when the iteration stops without reaching the
 * requested tolerance.
 */
class PcgSolver : public SolverInterface
{
public:
    PcgSolver(double relTol = 1.0e-12, double absTol = 1.0e-14, int maxIter = 2000, int printLevel = 0);
    ~PcgSolver() override = default;

    void solve(const mfem::SparseMatrix& A, const mfem::Vector& b, mfem::Vector& x) override;

    int getNumIterations() const { return numIterations_; }
    double getFinalNorm() const { return finalNorm_; }

private:
    double relTol_;
    double absTol_;
    int maxIter_;
    int printLevel_;
    int numIterations_;
    double finalNorm_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_SOLVERS_SOLVER_PCG_HPP
