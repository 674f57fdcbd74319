/**
 * @file core/flux_projector.hpp
 * @brief Abstract mapping of a nodal flux onto the production sample
 */

#ifndef HEATCOUPLE_CORE_FLUX_PROJECTOR_HPP
#define HEATCOUPLE_CORE_FLUX_PROJECTOR_HPP

#include "mfem.hpp"
#include <string>

namespace heatcouple
{

/// Strategy used to turn the nodal flux into interface dofs
enum class ProjectionKind { ConstrainedProjection, AreaWeightedAverage };

ProjectionKind parseProjectionKind(const std::string& name);
const char* projectionKindName(ProjectionKind kind);

/**
 * @class FluxProjector
 * @brief Converts a nodal flux vector into flux values at the production points
 *
 * The input is a dual (integrated) vector with one entry per dof, as
 * produced by the weak-form residual. The output holds one value per
 * point of the production sample.
 */
class FluxProjector
{
public:
    virtual ~FluxProjector() = default;

    virtual void project(const mfem::Vector& nodalFlux, mfem::Vector& values) const = 0;

    virtual ProjectionKind getKind() const = 0;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_FLUX_PROJECTOR_HPP
