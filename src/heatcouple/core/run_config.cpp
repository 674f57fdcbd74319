/**
 * @file core/run_config.cpp
 * @brief Validation and command-line parsing of RunConfig
 */

#include "heatcouple/core/run_config.hpp"
#include "heatcouple/core/errors.hpp"
#include "mfem.hpp"
#include <iostream>

namespace heatcouple
{

void RunConfig::validate() const
{
    if (nelems < 2 || nelems % 2 != 0)
    {
        throw ConfigurationError("nelems must be an even number of at least 2, got " + std::to_string(nelems));
    }
    if (order < 1)
    {
        throw ConfigurationError("polynomial order must be at least 1");
    }
    if (!(diffusivity > 0.0))
    {
        throw ConfigurationError("diffusivity must be positive");
    }
    if (!(timeStep > 0.0))
    {
        throw ConfigurationError("time step must be positive");
    }
    if (subsamples < 1)
    {
        throw ConfigurationError("at least one sub-sample per boundary element is required");
    }
    if (dropTolerance < 0.0)
    {
        throw ConfigurationError("drop tolerance must be non-negative");
    }
    if (outputEvery < 1)
    {
        throw ConfigurationError("output interval must be at least 1");
    }
    if (!(finalTime > 0.0))
    {
        throw ConfigurationError("final time must be positive");
    }
    if (iterations < 1)
    {
        throw ConfigurationError("at least one iteration per window is required");
    }
    if (!(relaxation > 0.0) || relaxation > 1.0)
    {
        throw ConfigurationError("relaxation must lie in (0, 1]");
    }
}

std::string RunConfig::getParticipantName() const
{
    return std::string("Heat") + roleName(role);
}

std::string RunConfig::getConsumptionMeshName() const
{
    return std::string(roleName(role)) + "-GP-Mesh";
}

std::string RunConfig::getProductionMeshName() const
{
    return std::string(roleName(role)) + "-CC-Mesh";
}

ControllerOptions RunConfig::makeControllerOptions() const
{
    ControllerOptions options;
    options.role = role;
    options.maxTimeStep = timeStep;
    options.dropTolerance = dropTolerance;
    options.consumptionMeshName = getConsumptionMeshName();
    options.productionMeshName = getProductionMeshName();
    options.printLevel = printLevel;
    return options;
}

void RunConfig::print(std::ostream& os) const
{
    os << "Participant:   " << getParticipantName() << std::endl;
    os << "Elements:      " << nelems << " x " << nelems / 2 << std::endl;
    os << "FE order:      " << order << std::endl;
    os << "Diffusivity:   " << diffusivity << std::endl;
    os << "Time step:     " << timeStep << std::endl;
    os << "Projection:    " << projectionKindName(projection) << std::endl;
    os << "Sub-samples:   " << subsamples << std::endl;
    os << "Right edge:    " << (exteriorFlux ? "flux" : "temperature") << std::endl;
    os << "Output dir:    " << outputDir << std::endl;
}

bool parseRunConfig(int argc, char* argv[], RunConfig& config)
{
    const char* side = roleName(config.role);
    const char* projection = projectionKindName(config.projection);
    const std::string defaultConfig = config.preciceConfig;
    const std::string defaultOutput = config.outputDir;
    const char* preciceConfig = defaultConfig.c_str();
    const char* outputDir = defaultOutput.c_str();

    mfem::OptionsParser args(argc, argv);
    args.AddOption(&side, "-s", "--side", "Participant side: Dirichlet or Neumann.");
    args.AddOption(&config.nelems, "-n", "--nelems", "Elements per unit length (even).");
    args.AddOption(&config.order, "-o", "--order", "Finite element order.");
    args.AddOption(&config.diffusivity, "-k", "--diffusivity", "Thermal diffusivity.");
    args.AddOption(&config.timeStep, "-dt", "--time-step", "Largest local time step.");
    args.AddOption(&projection, "-p", "--projection", "Flux projection: projection or average.");
    args.AddOption(&config.subsamples, "-ss", "--subsamples", "Sub-samples per interface element.");
    args.AddOption(&config.dropTolerance, "-tol", "--drop-tolerance", "Support tolerance of the interface fit.");
    args.AddOption(&config.exteriorFlux, "-ef", "--exterior-flux", "-no-ef", "--no-exterior-flux",
                   "Impose the exact flux on the right edge instead of the temperature.");
    args.AddOption(&preciceConfig, "-c", "--config", "preCICE configuration file.");
    args.AddOption(&outputDir, "-out", "--output-dir", "Output directory.");
    args.AddOption(&config.paraview, "-pv", "--paraview", "-no-pv", "--no-paraview", "Save ParaView files.");
    args.AddOption(&config.outputEvery, "-vs", "--vis-steps", "Save every n committed windows.");
    args.AddOption(&config.printLevel, "-pl", "--print-level", "Console verbosity.");
    args.AddOption(&config.finalTime, "-tf", "--final-time", "Final time (in-process coupling).");
    args.AddOption(&config.iterations, "-it", "--iterations", "Iterations per window (in-process coupling).");
    args.AddOption(&config.relaxation, "-w", "--relaxation", "Under-relaxation (in-process coupling).");
    args.Parse();

    if (!args.Good())
    {
        args.PrintUsage(std::cout);
        return false;
    }

    config.role = parseRole(side);
    config.projection = parseProjectionKind(projection);
    config.preciceConfig = preciceConfig;
    config.outputDir = outputDir;
    config.validate();

    if (config.printLevel > 0)
    {
        args.PrintOptions(std::cout);
    }
    return true;
}

} // namespace heatcouple
