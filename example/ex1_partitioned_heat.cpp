#include "heatcouple/channels/precice_channel.hpp"
#include "heatcouple/core/coupling_controller.hpp"
#include "heatcouple/core/run_config.hpp"
#include "heatcouple/io/solution_writer.hpp"
#include "heatcouple/physics/partitioned_heat_problem.hpp"
#include "mfem.hpp"
#include <iostream>

// Partitioned heat conduction, one preCICE participant per process
// Problem: du/dt - k lap(u) = 0 in [0,1]^2, split at y = 0.5
//          u = sin(x) cosh(y) on the exterior boundary, u(x, 0) = 0
//
// Dirichlet side (upper half): reads the interface temperature, writes the
// interface heat flux recovered from the weak-form residual.
// Neumann side (lower half): reads the heat flux, writes the temperature.
//
// Run both sides from the directory holding precice-config.xml:
//   ex1_partitioned_heat -s Dirichlet &
//   ex1_partitioned_heat -s Neumann

using namespace heatcouple;

int main(int argc, char *argv[])
{
    // --- (I) Command line options -------------------------------------------
    RunConfig config;
    try
    {
        if (!parseRunConfig(argc, argv, config))
        {
            return 1;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const std::string participant = config.getParticipantName();

    std::cout << "========================================" << std::endl;
    std::cout << "Partitioned Heat Conduction (preCICE)" << std::endl;
    std::cout << "========================================" << std::endl;
    config.print(std::cout);
    std::cout << "preCICE config: " << config.preciceConfig << std::endl;
    std::cout << "========================================" << std::endl;

    try
    {
        // --- (II) Local problem ---------------------------------------------
        PartitionedHeatProblem problem(config);
        std::cout << "Number of DOFs: " << problem.getSolver().getSize() << std::endl;

        // --- (III) Coupling -------------------------------------------------
        PreciceCouplingChannel channel(participant, config.preciceConfig);
        CouplingController controller(&channel, &problem.getSolver(), problem.getProjector(),
                                      config.makeControllerOptions());

        WriterOptions writerOptions;
        writerOptions.collectionName = "solution-" + std::string(roleName(config.role));
        writerOptions.outputDir = config.outputDir;
        writerOptions.paraview = config.paraview;
        writerOptions.saveEvery = config.outputEvery;
        writerOptions.printLevel = config.printLevel;
        writerOptions.prefix = "[" + participant + "] ";
        SolutionWriter writer(problem.getSolver().getFiniteElementSpace(), &problem.getExactSolution(),
                              writerOptions);
        controller.setObserver(&writer);

        // --- (IV) Time loop -------------------------------------------------
        controller.initialize();
        writer.saveInitial(controller.getSolution());
        while (!controller.isFinalized())
        {
            controller.iterate();
        }

        // --- (V) Error report -----------------------------------------------
        const double err = problem.computeL2Error(controller.getSolution());
        writeErrorLog("Error-" + std::string(roleName(config.role)) + ".log", problem.getMeshSize(), err);

        std::cout << "\nCoupling completed!" << std::endl;
        std::cout << "Committed windows: " << controller.getCommittedWindows() << std::endl;
        std::cout << "Local solves:      " << controller.getSolveCount() << std::endl;
        std::cout << "Rollbacks:         " << controller.getRollbackCount() << std::endl;
        std::cout << "Final time:        " << controller.getTime() << std::endl;
        std::cout << "L2 error:          " << err << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[" << participant << "] Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
