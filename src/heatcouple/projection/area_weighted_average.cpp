/**
 * @file projection/area_weighted_average.cpp
 * @brief Implementation of AreaWeightedAverage
 */

#include "heatcouple/projection/area_weighted_average.hpp"
#include "heatcouple/core/errors.hpp"
#include <string>

namespace heatcouple
{

AreaWeightedAverage::AreaWeightedAverage(const InterfaceSampler& sampler)
    : sampler_(sampler)
{
    sampler_.integrateBasis(SampleKind::Consumption, areas_);

    normalize_.SetSize(areas_.Size());
    for (int i = 0; i < areas_.Size(); i++)
    {
        normalize_(i) = areas_(i) > 0.0 ? 1.0 / areas_(i) : 0.0;
    }
}

void AreaWeightedAverage::computeFluxDofs(const mfem::Vector& nodalFlux, mfem::Vector& fluxDofs) const
{
    if (nodalFlux.Size() != normalize_.Size())
    {
        throw ConfigurationError("AreaWeightedAverage: nodal flux of size "
                                 + std::to_string(nodalFlux.Size()) + ", expected "
                                 + std::to_string(normalize_.Size()));
    }

    fluxDofs.SetSize(nodalFlux.Size());
    for (int i = 0; i < nodalFlux.Size(); i++)
    {
        fluxDofs(i) = nodalFlux(i) * normalize_(i);
    }
}

void AreaWeightedAverage::project(const mfem::Vector& nodalFlux, mfem::Vector& values) const
{
    mfem::Vector fluxDofs;
    computeFluxDofs(nodalFlux, fluxDofs);
    sampler_.evaluate(fluxDofs, SampleKind::Production, values);
}

} // namespace heatcouple
