/**
 * @file core/run_config.hpp
 * @brief Run parameters of one coupling participant
 */

#ifndef HEATCOUPLE_CORE_RUN_CONFIG_HPP
#define HEATCOUPLE_CORE_RUN_CONFIG_HPP

#include "heatcouple/core/coupling_controller.hpp"
#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/flux_projector.hpp"
#include <iosfwd>
#include <string>

namespace heatcouple
{

struct RunConfig
{
    Role role = Role::Dirichlet;
    int nelems = 8;
    int order = 1;
    double diffusivity = 1.0;
    double timeStep = 0.1;
    ProjectionKind projection = ProjectionKind::ConstrainedProjection;
    int subsamples = 16;
    double dropTolerance = 1.0e-15;
    /// Right edge carries the exact normal flux instead of Dirichlet data
    bool exteriorFlux = false;

    std::string preciceConfig = "precice-config.xml";
    std::string outputDir = "results";
    bool paraview = true;
    int outputEvery = 1;
    int printLevel = 1;

    // In-process coordinator only
    double finalTime = 1.0;
    int iterations = 3;
    double relaxation = 0.5;

    /// Throws ConfigurationError on the first invalid value
    void validate() const;

    /// Heat<Role>
    std::string getParticipantName() const;
    /// <Role>-GP-Mesh, the Gauss points the participant reads on
    std::string getConsumptionMeshName() const;
    /// <Role>-CC-Mesh, the cell-centred points the participant writes on
    std::string getProductionMeshName() const;

    ControllerOptions makeControllerOptions() const;

    void print(std::ostream& os) const;
};

/**
 * @brief Fills config from the command line with mfem::OptionsParser
 *
 * Returns false when the usage was printed (help requested or a bad
 * option), true otherwise. The parsed values are validated.
 */
bool parseRunConfig(int argc, char* argv[], RunConfig& config);

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_RUN_CONFIG_HPP
