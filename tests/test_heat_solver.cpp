/**
 * @file test_heat_solver.cpp
 * @brief Backward Euler heat solver on the lower half of the unit square
 *
 * Exterior data: T = sin(x) cosh(y), which is harmonic, so a long time
 * step with the exact trace imposed on the interface lands on the
 * interpolant of the exact solution up to discretization error.
 */

#include "heatcouple/core/errors.hpp"
#include "heatcouple/physics/heat_solver.hpp"
#include "heatcouple/physics/partitioned_heat_problem.hpp"
#include "heatcouple/solvers/solver_pcg.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <memory>

using namespace heatcouple;

namespace
{

constexpr int NELEMS = 8;
constexpr int POLYNOMIAL_ORDER = 1;
constexpr double TIME_STEP = 0.1;
constexpr double STEADY_TIME_STEP = 1.0e6;
constexpr double L2_TOLERANCE = 1.0e-2;

class HeatSolverTest : public ::testing::Test
{
protected:
    HeatSolverTest()
        : mesh(makeSubdomainMesh(Role::Neumann, NELEMS)),
          diffusivity(1.0),
          exact(exactTemperature),
          solver(mesh.get(), POLYNOMIAL_ORDER, getInterfaceAttribute(Role::Neumann), &diffusivity, &exact,
                 &linearSolver)
    {
    }

    void baseData(BoundaryData& boundary) const
    {
        solver.getBaseConstraints(boundary.constraints);
        boundary.source.SetSize(solver.getSize());
        boundary.source = 0.0;
    }

    std::unique_ptr<mfem::Mesh> mesh;
    mfem::ConstantCoefficient diffusivity;
    mfem::FunctionCoefficient exact;
    PcgSolver linearSolver;
    HeatSolver solver;
};

} // namespace

TEST_F(HeatSolverTest, ConstrainedDofsHoldPrescribedValues)
{
    BoundaryData boundary;
    baseData(boundary);

    mfem::Vector previous, next;
    solver.getInitialState(previous);
    solver.solve(previous, TIME_STEP, boundary, next);

    int constrained = 0;
    for (int i = 0; i < solver.getSize(); i++)
    {
        if (isConstrained(boundary.constraints, i))
        {
            EXPECT_EQ(next(i), boundary.constraints(i)) << "dof " << i;
            ++constrained;
        }
    }
    // Left, bottom and right edges of an 8 x 4 grid
    EXPECT_EQ(constrained, (NELEMS + 1) + 2 * (NELEMS / 2));
}

TEST_F(HeatSolverTest, RepeatedSolveIsBitIdentical)
{
    BoundaryData boundary;
    baseData(boundary);

    mfem::Vector previous, first, second;
    solver.getInitialState(previous);
    solver.solve(previous, TIME_STEP, boundary, first);
    solver.solve(previous, TIME_STEP, boundary, second);

    ASSERT_EQ(first.Size(), second.Size());
    for (int i = 0; i < first.Size(); i++)
    {
        EXPECT_EQ(first(i), second(i)) << "dof " << i;
    }
}

TEST_F(HeatSolverTest, ResidualVanishesOnFreeDofs)
{
    BoundaryData boundary;
    baseData(boundary);

    mfem::Vector previous, next, residual;
    solver.getInitialState(previous);
    solver.solve(previous, TIME_STEP, boundary, next);
    solver.computeResidual(previous, next, TIME_STEP, boundary, residual);

    ASSERT_EQ(residual.Size(), solver.getSize());
    double constrainedFlux = 0.0;
    for (int i = 0; i < solver.getSize(); i++)
    {
        if (isConstrained(boundary.constraints, i))
        {
            constrainedFlux += std::abs(residual(i));
        }
        else
        {
            EXPECT_NEAR(residual(i), 0.0, 1.0e-8) << "dof " << i;
        }
    }
    EXPECT_GT(constrainedFlux, 0.0);
}

TEST_F(HeatSolverTest, FittedInterfaceReachesSteadyState)
{
    BoundaryData boundary;
    baseData(boundary);

    const InterfaceSample& sample = solver.getInterfaceSample(SampleKind::Consumption);
    mfem::Vector target(sample.size());
    mfem::Vector x;
    for (int i = 0; i < sample.size(); i++)
    {
        sample.getPoint(i, x);
        target(i) = exactTemperature(x);
    }
    solver.buildConstraints(target, 1.0e-15, boundary.constraints);

    mfem::Vector previous, next;
    solver.getInitialState(previous);
    solver.solve(previous, STEADY_TIME_STEP, boundary, next);

    EXPECT_LT(solver.computeL2Error(next, exact), L2_TOLERANCE);

    // The interface trace follows the fitted values
    mfem::Vector values;
    solver.evaluate(next, SampleKind::Consumption, values);
    for (int i = 0; i < sample.size(); i++)
    {
        EXPECT_NEAR(values(i), target(i), 1.0e-2);
    }
}

TEST_F(HeatSolverTest, RightEdgeFluxReachesSteadyState)
{
    mfem::FunctionCoefficient gradientX(exactTemperatureGradientX);
    HeatSolver fluxSolver(mesh.get(), POLYNOMIAL_ORDER, getInterfaceAttribute(Role::Neumann), &diffusivity,
                          &exact, &linearSolver);

    BoundaryData boundary;
    fluxSolver.getBaseConstraints(boundary.constraints);
    int before = 0;
    for (int i = 0; i < boundary.constraints.Size(); i++)
    {
        before += isConstrained(boundary.constraints, i) ? 1 : 0;
    }

    fluxSolver.setBoundaryFlux(RIGHT_ATTRIBUTE, &gradientX);
    fluxSolver.getBaseConstraints(boundary.constraints);
    int after = 0;
    for (int i = 0; i < boundary.constraints.Size(); i++)
    {
        after += isConstrained(boundary.constraints, i) ? 1 : 0;
    }
    // The four right-edge nodes above the bottom corner are released
    EXPECT_EQ(before - after, NELEMS / 2);

    boundary.source.SetSize(fluxSolver.getSize());
    boundary.source = 0.0;
    const InterfaceSample& sample = fluxSolver.getInterfaceSample(SampleKind::Consumption);
    mfem::Vector target(sample.size());
    mfem::Vector x;
    for (int i = 0; i < sample.size(); i++)
    {
        sample.getPoint(i, x);
        target(i) = exactTemperature(x);
    }
    fluxSolver.buildConstraints(target, 1.0e-15, boundary.constraints);

    mfem::Vector previous, next;
    fluxSolver.getInitialState(previous);
    fluxSolver.solve(previous, STEADY_TIME_STEP, boundary, next);
    EXPECT_LT(fluxSolver.computeL2Error(next, exact), L2_TOLERANCE);

    // The exterior load is part of the weak form, so free rows stay balanced
    mfem::Vector residual;
    fluxSolver.computeResidual(previous, next, STEADY_TIME_STEP, boundary, residual);
    for (int i = 0; i < residual.Size(); i++)
    {
        if (!isConstrained(boundary.constraints, i))
        {
            EXPECT_NEAR(residual(i), 0.0, 1.0e-8) << "dof " << i;
        }
    }
}

TEST_F(HeatSolverTest, FluxOnInterfaceIsRejected)
{
    mfem::ConstantCoefficient flux(1.0);
    EXPECT_THROW(solver.setBoundaryFlux(getInterfaceAttribute(Role::Neumann), &flux), ConfigurationError);
    EXPECT_THROW(solver.setBoundaryFlux(RIGHT_ATTRIBUTE, nullptr), ConfigurationError);
    EXPECT_THROW(solver.setBoundaryFlux(7, &flux), ConfigurationError);
}

TEST_F(HeatSolverTest, InterfaceSourceIntegratesFlux)
{
    const InterfaceSample& sample = solver.getInterfaceSample(SampleKind::Consumption);
    mfem::Vector flux(sample.size());
    flux = 2.0;

    mfem::Vector source;
    solver.buildSource(flux, source);
    ASSERT_EQ(source.Size(), solver.getSize());
    EXPECT_NEAR(source.Sum(), 2.0, 1.0e-12);
}

TEST_F(HeatSolverTest, InvalidInputsAreRejected)
{
    BoundaryData boundary;
    baseData(boundary);
    mfem::Vector previous, next;
    solver.getInitialState(previous);

    EXPECT_THROW(solver.solve(previous, 0.0, boundary, next), ConfigurationError);

    mfem::Vector shortState(3);
    shortState = 0.0;
    EXPECT_THROW(solver.solve(shortState, TIME_STEP, boundary, next), ConfigurationError);

    EXPECT_THROW(HeatSolver(mesh.get(), POLYNOMIAL_ORDER, 9, &diffusivity, &exact, &linearSolver),
                 ConfigurationError);
}

TEST_F(HeatSolverTest, StalledLinearSolveIsSolverDivergence)
{
    PcgSolver oneIteration(1.0e-14, 0.0, 1);
    HeatSolver limited(mesh.get(), POLYNOMIAL_ORDER, getInterfaceAttribute(Role::Neumann), &diffusivity, &exact,
                       &oneIteration);

    BoundaryData boundary;
    limited.getBaseConstraints(boundary.constraints);
    mfem::Vector previous, next;
    limited.getInitialState(previous);

    EXPECT_THROW(limited.solve(previous, TIME_STEP, boundary, next), SolverDivergence);
}

TEST(PartitionedHeatProblemTest, HalvesMeetAtTheInterface)
{
    std::unique_ptr<mfem::Mesh> lower(makeSubdomainMesh(Role::Neumann, NELEMS));
    std::unique_ptr<mfem::Mesh> upper(makeSubdomainMesh(Role::Dirichlet, NELEMS));

    mfem::Vector lowMin, lowMax, upMin, upMax;
    lower->GetBoundingBox(lowMin, lowMax);
    upper->GetBoundingBox(upMin, upMax);

    EXPECT_NEAR(lowMin(1), 0.0, 1.0e-14);
    EXPECT_NEAR(lowMax(1), INTERFACE_HEIGHT, 1.0e-14);
    EXPECT_NEAR(upMin(1), INTERFACE_HEIGHT, 1.0e-14);
    EXPECT_NEAR(upMax(1), 1.0, 1.0e-14);
    EXPECT_EQ(lower->GetNE(), NELEMS * NELEMS / 2);

    EXPECT_EQ(getInterfaceAttribute(Role::Neumann), 3);
    EXPECT_EQ(getInterfaceAttribute(Role::Dirichlet), 1);
    EXPECT_THROW(makeSubdomainMesh(Role::Neumann, 3), ConfigurationError);
}

TEST(PartitionedHeatProblemTest, ProjectorOnlyOnDirichletSide)
{
    RunConfig config;
    config.role = Role::Dirichlet;
    PartitionedHeatProblem dirichlet(config);
    EXPECT_NE(dirichlet.getProjector(), nullptr);

    config.role = Role::Neumann;
    PartitionedHeatProblem neumann(config);
    EXPECT_EQ(neumann.getProjector(), nullptr);
    EXPECT_DOUBLE_EQ(neumann.getMeshSize(), 1.0 / config.nelems);
}

TEST(PartitionedHeatProblemTest, ExteriorFluxReleasesTheRightEdge)
{
    RunConfig config;
    config.role = Role::Neumann;
    config.nelems = NELEMS;
    config.exteriorFlux = true;
    PartitionedHeatProblem problem(config);

    mfem::Vector constraints;
    problem.getSolver().getBaseConstraints(constraints);
    int constrained = 0;
    for (int i = 0; i < constraints.Size(); i++)
    {
        constrained += isConstrained(constraints, i) ? 1 : 0;
    }
    // Bottom and left edges only
    EXPECT_EQ(constrained, (NELEMS + 1) + NELEMS / 2);
}

int main(int argc, char** argv)
{
#ifdef MFEM_USE_MPI
    MPI_Init(&argc, &argv);
#endif

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

#ifdef MFEM_USE_MPI
    MPI_Finalize();
#endif

    return result;
}
