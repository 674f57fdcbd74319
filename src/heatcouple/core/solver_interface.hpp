/**
 * @file core/solver_interface.hpp
 * @brief Abstract base class for the linear solvers used by the local field solver
 */

#ifndef HEATCOUPLE_CORE_SOLVER_INTERFACE_HPP
#define HEATCOUPLE_CORE_SOLVER_INTERFACE_HPP

#include "mfem.hpp"

namespace heatcouple
{

class SolverInterface
{
public:
    virtual ~SolverInterface() = default;

    /// Solves A x = b; x holds the initial guess on entry
    virtual void solve(const mfem::SparseMatrix& A, const mfem::Vector& b, mfem::Vector& x) = 0;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_SOLVER_INTERFACE_HPP
