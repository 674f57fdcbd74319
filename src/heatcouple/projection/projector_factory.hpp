/**
 * @file projection/projector_factory.hpp
 * @brief Selection of the flux projection strategy at configuration time
 */

#ifndef HEATCOUPLE_PROJECTION_PROJECTOR_FACTORY_HPP
#define HEATCOUPLE_PROJECTION_PROJECTOR_FACTORY_HPP

#include "heatcouple/core/flux_projector.hpp"
#include "heatcouple/core/interface_sampler.hpp"
#include <memory>

namespace heatcouple
{

std::unique_ptr<FluxProjector> makeFluxProjector(ProjectionKind kind,
                                                 const InterfaceSampler& sampler,
                                                 double supportTolerance);

} // namespace heatcouple

#endif // HEATCOUPLE_PROJECTION_PROJECTOR_FACTORY_HPP
