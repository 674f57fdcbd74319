/**
 * @file projection/area_weighted_average.hpp
 * @brief Flux dofs obtained by dividing by the interface area of each basis function
 */

#ifndef HEATCOUPLE_PROJECTION_AREA_WEIGHTED_AVERAGE_HPP
#define HEATCOUPLE_PROJECTION_AREA_WEIGHTED_AVERAGE_HPP

#include "heatcouple/core/flux_projector.hpp"
#include "heatcouple/core/interface_sampler.hpp"
#include "mfem.hpp"

namespace heatcouple
{

/**
 * @class AreaWeightedAverage
 * @brief d_n = r_n / area_n, with area_n the interface integral of phi_n
 *
 * Dofs with zero interface area map to zero. Exact for constant fields,
 * approximate otherwise.
 */
class AreaWeightedAverage : public FluxProjector
{
public:
    explicit AreaWeightedAverage(const InterfaceSampler& sampler);

    void project(const mfem::Vector& nodalFlux, mfem::Vector& values) const override;

    ProjectionKind getKind() const override { return ProjectionKind::AreaWeightedAverage; }

    void computeFluxDofs(const mfem::Vector& nodalFlux, mfem::Vector& fluxDofs) const;

    const mfem::Vector& getInterfaceAreas() const { return areas_; }

private:
    const InterfaceSampler& sampler_;
    mfem::Vector areas_;
    mfem::Vector normalize_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_PROJECTION_AREA_WEIGHTED_AVERAGE_HPP
