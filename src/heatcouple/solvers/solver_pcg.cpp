/**
 * @file solvers/solver_pcg.cpp
 * @brief Implementation of the preconditioned CG solver
 */

#include "heatcouple/solvers/solver_pcg.hpp"
#include "heatcouple/core/errors.hpp"
#include <sstream>

namespace heatcouple
{

PcgSolver::PcgSolver(double relTol, double absTol, int maxIter, int printLevel)
    : relTol_(relTol), absTol_(absTol), maxIter_(maxIter), printLevel_(printLevel),
      numIterations_(0), finalNorm_(0.0)
{
}

void PcgSolver::solve(const mfem::SparseMatrix& A,
                      const mfem::Vector& b,
                      mfem::Vector& x)
{
    mfem::SparseMatrix* A_copy = const_cast<mfem::SparseMatrix*>(&A);
    mfem::GSSmoother prec(*A_copy);

    mfem::CGSolver cg;
    cg.SetRelTol(relTol_);
    cg.SetAbsTol(absTol_);
    cg.SetMaxIter(maxIter_);
    cg.SetPrintLevel(printLevel_);
    cg.SetPreconditioner(prec);
    cg.SetOperator(*A_copy);
    cg.iterative_mode = true;

    cg.Mult(b, x);

    numIterations_ = cg.GetNumIterations();
    finalNorm_ = cg.GetFinalNorm();

    if (!cg.GetConverged())
    {
        std::ostringstream msg;
        msg << "CG did not converge after " << numIterations_
            << " iterations (final residual norm " << finalNorm_ << ")";
        throw SolverDivergence(msg.str());
    }
}

} // namespace heatcouple
