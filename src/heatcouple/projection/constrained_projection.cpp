/**
 * @file projection/constrained_projection.cpp
 * @brief Implementation of ConstrainedProjection
 */

#include "heatcouple/projection/constrained_projection.hpp"
#include "heatcouple/core/errors.hpp"
#include <limits>
#include <string>

namespace heatcouple
{

ConstrainedProjection::ConstrainedProjection(const InterfaceSampler& sampler, double supportTolerance)
    : sampler_(sampler)
{
    std::unique_ptr<mfem::SparseMatrix> mass(sampler_.assembleMass(SampleKind::Consumption));

    // Supported rows are free, everything else is pinned to zero
    mfem::Array<int> support;
    InterfaceMassSystem::rowSupport(*mass, supportTolerance, support);
    mfem::Vector constraints(sampler_.getNumDofs());
    constraints = 0.0;
    for (int k = 0; k < support.Size(); k++)
    {
        constraints(support[k]) = std::numeric_limits<double>::quiet_NaN();
    }

    system_.reset(new InterfaceMassSystem(*mass, constraints, supportTolerance));
}

ConstrainedProjection::~ConstrainedProjection() = default;

void ConstrainedProjection::computeFluxDofs(const mfem::Vector& nodalFlux, mfem::Vector& fluxDofs) const
{
    if (nodalFlux.Size() != sampler_.getNumDofs())
    {
        throw ConfigurationError("ConstrainedProjection: nodal flux of size "
                                 + std::to_string(nodalFlux.Size()) + ", expected "
                                 + std::to_string(sampler_.getNumDofs()));
    }
    system_->solve(nodalFlux, fluxDofs);
}

void ConstrainedProjection::project(const mfem::Vector& nodalFlux, mfem::Vector& values) const
{
    mfem::Vector fluxDofs;
    computeFluxDofs(nodalFlux, fluxDofs);
    sampler_.evaluate(fluxDofs, SampleKind::Production, values);
}

} // namespace heatcouple
