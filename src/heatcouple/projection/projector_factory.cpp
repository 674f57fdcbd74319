/**
 * @file projection/projector_factory.cpp
 * @brief Flux projector construction and name conversions
 */

#include "heatcouple/projection/projector_factory.hpp"
#include "heatcouple/core/errors.hpp"
#include "heatcouple/projection/area_weighted_average.hpp"
#include "heatcouple/projection/constrained_projection.hpp"

namespace heatcouple
{

ProjectionKind parseProjectionKind(const std::string& name)
{
    if (name == "projection" || name == "ConstrainedProjection")
    {
        return ProjectionKind::ConstrainedProjection;
    }
    if (name == "average" || name == "AreaWeightedAverage")
    {
        return ProjectionKind::AreaWeightedAverage;
    }
    throw ConfigurationError("unknown flux projection '" + name + "' (expected projection or average)");
}

const char* projectionKindName(ProjectionKind kind)
{
    switch (kind)
    {
    case ProjectionKind::ConstrainedProjection:
        return "projection";
    case ProjectionKind::AreaWeightedAverage:
        return "average";
    }
    return "unknown";
}

std::unique_ptr<FluxProjector> makeFluxProjector(ProjectionKind kind,
                                                 const InterfaceSampler& sampler,
                                                 double supportTolerance)
{
    switch (kind)
    {
    case ProjectionKind::ConstrainedProjection:
        return std::unique_ptr<FluxProjector>(new ConstrainedProjection(sampler, supportTolerance));
    case ProjectionKind::AreaWeightedAverage:
        return std::unique_ptr<FluxProjector>(new AreaWeightedAverage(sampler));
    }
    throw ConfigurationError("makeFluxProjector: unsupported projection kind");
}

} // namespace heatcouple
