/**
 * @file core/field_solver_interface.hpp
 * @brief Abstract interface of the local PDE solver of one participant
 */

#ifndef HEATCOUPLE_CORE_FIELD_SOLVER_INTERFACE_HPP
#define HEATCOUPLE_CORE_FIELD_SOLVER_INTERFACE_HPP

#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/interface_sample.hpp"
#include "mfem.hpp"

namespace heatcouple
{

/**
 * @class LocalFieldSolver
 * @brief Black-box time step of one participant's discretized PDE
 *
 * The solver owns the discretization, not the state: solution vectors and
 * boundary data are passed in by the coupling controller, which keeps the
 * current and checkpointed states.
 */
class LocalFieldSolver
{
public:
    virtual ~LocalFieldSolver() = default;

    /// Number of degrees of freedom of a solution state
    virtual int getSize() const = 0;

    virtual void getInitialState(mfem::Vector& state) const = 0;

    /// Constraints imposed independently of the coupling (NaN elsewhere)
    virtual void getBaseConstraints(mfem::Vector& constraints) const = 0;

    virtual const InterfaceSample& getInterfaceSample(SampleKind kind) const = 0;

    /**
     * @brief Advances previous by dt under the given boundary data
     *
     * Constrained entries of next equal the prescribed values. Throws
     * SolverDivergence if the linear solve fails.
     */
    virtual void solve(const mfem::Vector& previous,
                       double dt,
                       const BoundaryData& boundary,
                       mfem::Vector& next) = 0;

    /// Weak-form residual, i.e. the nodal flux, of the step previous -> next
    virtual void computeResidual(const mfem::Vector& previous,
                                 const mfem::Vector& next,
                                 double dt,
                                 const BoundaryData& boundary,
                                 mfem::Vector& residual) const = 0;

    /// Field with coefficients dofs evaluated at the sample points
    virtual void evaluate(const mfem::Vector& dofs, SampleKind kind, mfem::Vector& values) const = 0;

    /**
     * @brief Constraints fitting the interface trace to the target values
     *
     * targetValues holds one value per consumption point. Base constraints
     * are kept; dofs whose fit has no support above dropTolerance stay
     * unconstrained.
     */
    virtual void buildConstraints(const mfem::Vector& targetValues,
                                  double dropTolerance,
                                  mfem::Vector& constraints) = 0;

    /// Interface load of the flux values given at the consumption points
    virtual void buildSource(const mfem::Vector& fluxValues, mfem::Vector& source) const = 0;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_FIELD_SOLVER_INTERFACE_HPP
