/**
 * @file projection/constrained_projection.hpp
 * @brief Mass-consistent flux projection on the interface dofs
 */

#ifndef HEATCOUPLE_PROJECTION_CONSTRAINED_PROJECTION_HPP
#define HEATCOUPLE_PROJECTION_CONSTRAINED_PROJECTION_HPP

#include "heatcouple/core/flux_projector.hpp"
#include "heatcouple/core/interface_mass_system.hpp"
#include "heatcouple/core/interface_sampler.hpp"
#include "mfem.hpp"
#include <memory>

namespace heatcouple
{

/**
 * @class ConstrainedProjection
 * @brief Solves M_G d = r for the interface flux dofs d
 *
 * M_G is the mass matrix of the basis on the consumption sample. Dofs
 * whose row has no support above the tolerance are constrained to zero.
 * The integral of the projected field equals the sum of the nodal flux.
 */
class ConstrainedProjection : public FluxProjector
{
public:
    ConstrainedProjection(const InterfaceSampler& sampler,
                          double supportTolerance = InterfaceMassSystem::DEFAULT_SUPPORT_TOLERANCE);
    ~ConstrainedProjection() override;

    void project(const mfem::Vector& nodalFlux, mfem::Vector& values) const override;

    ProjectionKind getKind() const override { return ProjectionKind::ConstrainedProjection; }

    /// Interface flux dofs, zero away from the interface
    void computeFluxDofs(const mfem::Vector& nodalFlux, mfem::Vector& fluxDofs) const;

    int getNumInterfaceDofs() const { return system_->getNumFree(); }

private:
    const InterfaceSampler& sampler_;
    std::unique_ptr<InterfaceMassSystem> system_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_PROJECTION_CONSTRAINED_PROJECTION_HPP
