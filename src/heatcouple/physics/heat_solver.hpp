/**
 * @file physics/heat_solver.hpp
 * @brief Backward Euler heat conduction solver for one coupling participant
 */

#ifndef HEATCOUPLE_PHYSICS_HEAT_SOLVER_HPP
#define HEATCOUPLE_PHYSICS_HEAT_SOLVER_HPP

#include "heatcouple/core/field_solver_interface.hpp"
#include "heatcouple/core/interface_mass_system.hpp"
#include "heatcouple/core/interface_sampler.hpp"
#include "heatcouple/core/solver_interface.hpp"
#include "mfem.hpp"
#include <map>
#include <memory>

namespace heatcouple
{

/**
 * @class HeatSolver
 * @brief du/dt - div(k grad u) = 0 discretized with H1 elements
 *
 * Weak form per step: (M/dt + K) u = M u0/dt - s + f, where s is the
 * interface load of the Neumann role and f the load of exterior flux
 * boundaries. Every boundary attribute except the interface attribute
 * carries the Dirichlet data of boundaryCoeff unless setBoundaryFlux()
 * turned it into a flux boundary; the interface is left to the coupling.
 */
class HeatSolver : public LocalFieldSolver
{
public:
    HeatSolver(mfem::Mesh* mesh,
               int polynomialOrder,
               int interfaceAttribute,
               mfem::Coefficient* diffusivity,
               mfem::Coefficient* boundaryCoeff,
               SolverInterface* linearSolver,
               int subsamples = InterfaceSampler::DEFAULT_SUBSAMPLES);

    ~HeatSolver() override;

    int getSize() const override;
    void getInitialState(mfem::Vector& state) const override;
    void getBaseConstraints(mfem::Vector& constraints) const override;
    const InterfaceSample& getInterfaceSample(SampleKind kind) const override;

    void solve(const mfem::Vector& previous,
               double dt,
               const BoundaryData& boundary,
               mfem::Vector& next) override;

    void computeResidual(const mfem::Vector& previous,
                         const mfem::Vector& next,
                         double dt,
                         const BoundaryData& boundary,
                         mfem::Vector& residual) const override;

    void evaluate(const mfem::Vector& dofs, SampleKind kind, mfem::Vector& values) const override;

    void buildConstraints(const mfem::Vector& targetValues,
                          double dropTolerance,
                          mfem::Vector& constraints) override;

    void buildSource(const mfem::Vector& fluxValues, mfem::Vector& source) const override;

    /**
     * @brief Replaces the Dirichlet data of an exterior attribute by the
     * prescribed normal flux k du/dn; the coefficient is not owned
     */
    void setBoundaryFlux(int attribute, mfem::Coefficient* flux);

    mfem::FiniteElementSpace* getFiniteElementSpace() { return fespace_; }
    const InterfaceSampler& getSampler() const { return *sampler_; }

    double computeL2Error(const mfem::Vector& state, mfem::Coefficient& exact) const;

private:
    void updateSystemMatrix(double dt);
    void updateBoundaryConditions();
    void checkSize(const mfem::Vector& v, const char* what) const;

    mfem::H1_FECollection* fec_;
    mfem::FiniteElementSpace* fespace_;
    mfem::BilinearForm* massForm_;
    mfem::BilinearForm* diffusionForm_;
    mfem::SparseMatrix* systemMatrix_;
    double cachedDt_;

    mfem::Coefficient* diffusivity_;
    mfem::Coefficient* boundaryCoeff_;
    SolverInterface* linearSolver_;

    int interfaceAttribute_;
    mfem::Array<int> essentialBdr_;
    std::map<int, mfem::Coefficient*> boundaryFlux_; // Not owned
    mfem::Vector baseConstraints_;
    mfem::Vector exteriorLoad_;
    std::unique_ptr<InterfaceSampler> sampler_;
    std::unique_ptr<mfem::SparseMatrix> interfaceMass_;
    std::unique_ptr<InterfaceMassSystem> fitSystem_;
    double fitTolerance_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_PHYSICS_HEAT_SOLVER_HPP
