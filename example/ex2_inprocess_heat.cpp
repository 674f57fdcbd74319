#include "heatcouple/channels/in_process_channel.hpp"
#include "heatcouple/core/coupling_controller.hpp"
#include "heatcouple/core/run_config.hpp"
#include "heatcouple/io/solution_writer.hpp"
#include "heatcouple/physics/partitioned_heat_problem.hpp"
#include "mfem.hpp"
#include <iostream>
#include <memory>

// Partitioned heat conduction with both participants in one process
//
// Same problem as ex1_partitioned_heat, coupled through an in-process hub:
// serial Gauss-Seidel exchange with a fixed number of iterations per time
// window and constant under-relaxation of the Neumann temperature.
// The --side option is ignored; both sides are run.

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

    std::cout << "========================================" << std::endl;
    std::cout << "Partitioned Heat Conduction (in-process)" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Final time:    " << config.finalTime << std::endl;
    std::cout << "Iterations:    " << config.iterations << std::endl;
    std::cout << "Relaxation:    " << config.relaxation << std::endl;
    std::cout << "========================================" << std::endl;

    try
    {
        // --- (II) Both halves -----------------------------------------------
        RunConfig dirichletConfig = config;
        dirichletConfig.role = Role::Dirichlet;
        RunConfig neumannConfig = config;
        neumannConfig.role = Role::Neumann;

        PartitionedHeatProblem dirichlet(dirichletConfig);
        PartitionedHeatProblem neumann(neumannConfig);

        // --- (III) Hub, Dirichlet first -------------------------------------
        InProcessSettings settings;
        settings.maxTime = config.finalTime;
        settings.windowSize = config.timeStep;
        settings.iterationsPerWindow = config.iterations;
        settings.relaxation = config.relaxation;
        InProcessCouplingHub hub(settings);

        std::unique_ptr<InProcessCouplingChannel> dirichletChannel =
            hub.connect(dirichletConfig.getParticipantName());
        std::unique_ptr<InProcessCouplingChannel> neumannChannel =
            hub.connect(neumannConfig.getParticipantName());

        CouplingController dirichletController(dirichletChannel.get(), &dirichlet.getSolver(),
                                               dirichlet.getProjector(), dirichletConfig.makeControllerOptions());
        CouplingController neumannController(neumannChannel.get(), &neumann.getSolver(), nullptr,
                                             neumannConfig.makeControllerOptions());

        WriterOptions writerOptions;
        writerOptions.outputDir = config.outputDir;
        writerOptions.paraview = config.paraview;
        writerOptions.saveEvery = config.outputEvery;
        writerOptions.printLevel = config.printLevel;

        writerOptions.collectionName = "solution-Dirichlet";
        writerOptions.prefix = "[" + dirichletConfig.getParticipantName() + "] ";
        SolutionWriter dirichletWriter(dirichlet.getSolver().getFiniteElementSpace(),
                                       &dirichlet.getExactSolution(), writerOptions);
        writerOptions.collectionName = "solution-Neumann";
        writerOptions.prefix = "[" + neumannConfig.getParticipantName() + "] ";
        SolutionWriter neumannWriter(neumann.getSolver().getFiniteElementSpace(),
                                     &neumann.getExactSolution(), writerOptions);

        dirichletController.setObserver(&dirichletWriter);
        neumannController.setObserver(&neumannWriter);

        // --- (IV) Time loop, the two sides alternating per sweep ------------
        dirichletController.initialize();
        neumannController.initialize();
        dirichletWriter.saveInitial(dirichletController.getSolution());
        neumannWriter.saveInitial(neumannController.getSolution());

        // A sweep ends when the side completes a window-iteration
        auto runSweep = [](CouplingController& controller, const InProcessCouplingChannel& channel)
        {
            const int sweep = channel.getCompletedSweeps();
            while (!controller.isFinalized() && channel.getCompletedSweeps() == sweep)
            {
                controller.iterate();
            }
        };

        while (!dirichletController.isFinalized() || !neumannController.isFinalized())
        {
            runSweep(dirichletController, *dirichletChannel);
            runSweep(neumannController, *neumannChannel);
        }

        // --- (V) Error report -----------------------------------------------
        const double errD = dirichlet.computeL2Error(dirichletController.getSolution());
        const double errN = neumann.computeL2Error(neumannController.getSolution());
        writeErrorLog("Error-Dirichlet.log", dirichlet.getMeshSize(), errD);
        writeErrorLog("Error-Neumann.log", neumann.getMeshSize(), errN);

        std::cout << "\nCoupling completed!" << std::endl;
        std::cout << "Committed windows: " << dirichletController.getCommittedWindows() << std::endl;
        std::cout << "Rollbacks:         " << dirichletController.getRollbackCount() << std::endl;
        std::cout << "Final time:        " << dirichletController.getTime() << std::endl;
        std::cout << "L2 error (Dirichlet): " << errD << std::endl;
        std::cout << "L2 error (Neumann):   " << errN << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
