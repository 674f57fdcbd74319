/**
 * @file physics/partitioned_heat_problem.hpp
 * @brief Unit square heat problem split at y = 0.5 into two participants
 */

#ifndef HEATCOUPLE_PHYSICS_PARTITIONED_HEAT_PROBLEM_HPP
#define HEATCOUPLE_PHYSICS_PARTITIONED_HEAT_PROBLEM_HPP

#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/flux_projector.hpp"
#include "heatcouple/core/run_config.hpp"
#include "heatcouple/physics/heat_solver.hpp"
#include "heatcouple/solvers/solver_pcg.hpp"
#include "mfem.hpp"
#include <memory>

namespace heatcouple
{

/// Height of the interface line between the two halves
constexpr double INTERFACE_HEIGHT = 0.5;

/// u = sin(x) cosh(y), harmonic and therefore a steady state
double exactTemperature(const mfem::Vector& x);

/// du/dx = cos(x) cosh(y), the outward normal derivative on the right edge
double exactTemperatureGradientX(const mfem::Vector& x);

/// Boundary attribute of the right edge on both halves
constexpr int RIGHT_ATTRIBUTE = 2;

/**
 * @brief Mesh of one half of the unit square; the caller owns the result
 *
 * Boundary attributes follow MakeCartesian2D: 1 bottom, 2 right, 3 top,
 * 4 left. The Neumann half is [0,1]x[0,0.5], the Dirichlet half
 * [0,1]x[0.5,1].
 */
mfem::Mesh* makeSubdomainMesh(Role role, int nelems);

/// Boundary attribute of the coupling interface on each half
int getInterfaceAttribute(Role role);

/**
 * @class PartitionedHeatProblem
 * @brief Mesh, coefficients, solver and projector of one participant
 */
class PartitionedHeatProblem
{
public:
    explicit PartitionedHeatProblem(const RunConfig& config);

    PartitionedHeatProblem(const PartitionedHeatProblem&) = delete;
    PartitionedHeatProblem& operator=(const PartitionedHeatProblem&) = delete;

    HeatSolver& getSolver() { return *solver_; }
    /// Null on the Neumann side
    const FluxProjector* getProjector() const { return projector_.get(); }

    mfem::Mesh* getMesh() { return mesh_.get(); }
    mfem::Coefficient& getExactSolution() { return exact_; }
    const RunConfig& getConfig() const { return config_; }

    double getMeshSize() const { return 1.0 / config_.nelems; }
    double computeL2Error(const mfem::Vector& state);

private:
    RunConfig config_;
    std::unique_ptr<mfem::Mesh> mesh_;
    mfem::ConstantCoefficient diffusivity_;
    mfem::FunctionCoefficient exact_;
    mfem::FunctionCoefficient gradientX_;
    mfem::ProductCoefficient rightFlux_;
    PcgSolver linearSolver_;
    std::unique_ptr<HeatSolver> solver_;
    std::unique_ptr<FluxProjector> projector_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_PHYSICS_PARTITIONED_HEAT_PROBLEM_HPP
