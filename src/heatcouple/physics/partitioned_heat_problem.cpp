/**
 * @file physics/partitioned_heat_problem.cpp
 * @brief Setup of the two halves of the partitioned heat problem
 */

#include "heatcouple/physics/partitioned_heat_problem.hpp"
#include "heatcouple/core/errors.hpp"
#include "heatcouple/projection/projector_factory.hpp"
#include <cmath>

namespace heatcouple
{

namespace
{

constexpr int BOTTOM_ATTRIBUTE = 1;
constexpr int TOP_ATTRIBUTE = 3;

void shiftToUpperHalf(const mfem::Vector& x, mfem::Vector& y)
{
    y = x;
    y(1) += INTERFACE_HEIGHT;
}

} // namespace

double exactTemperature(const mfem::Vector& x)
{
    return std::sin(x(0)) * std::cosh(x(1));
}

double exactTemperatureGradientX(const mfem::Vector& x)
{
    return std::cos(x(0)) * std::cosh(x(1));
}

mfem::Mesh* makeSubdomainMesh(Role role, int nelems)
{
    if (nelems < 2 || nelems % 2 != 0)
    {
        throw ConfigurationError("nelems must be an even number of at least 2");
    }

    mfem::Mesh* mesh = new mfem::Mesh(mfem::Mesh::MakeCartesian2D(
        nelems, nelems / 2, mfem::Element::QUADRILATERAL, true, 1.0, INTERFACE_HEIGHT));

    if (role == Role::Dirichlet)
    {
        mesh->Transform(shiftToUpperHalf);
    }
    return mesh;
}

int getInterfaceAttribute(Role role)
{
    return role == Role::Neumann ? TOP_ATTRIBUTE : BOTTOM_ATTRIBUTE;
}

PartitionedHeatProblem::PartitionedHeatProblem(const RunConfig& config)
    : config_(config),
      diffusivity_(config.diffusivity),
      exact_(exactTemperature),
      gradientX_(exactTemperatureGradientX),
      rightFlux_(diffusivity_, gradientX_)
{
    config_.validate();

    mesh_.reset(makeSubdomainMesh(config_.role, config_.nelems));
    solver_.reset(new HeatSolver(mesh_.get(), config_.order, getInterfaceAttribute(config_.role), &diffusivity_,
                                 &exact_, &linearSolver_, config_.subsamples));
    if (config_.exteriorFlux)
    {
        solver_->setBoundaryFlux(RIGHT_ATTRIBUTE, &rightFlux_);
    }

    if (config_.role == Role::Dirichlet)
    {
        projector_ = makeFluxProjector(config_.projection, solver_->getSampler(), config_.dropTolerance);
    }
}

double PartitionedHeatProblem::computeL2Error(const mfem::Vector& state)
{
    return solver_->computeL2Error(state, exact_);
}

} // namespace heatcouple
