/**
 * @file core/coupling_controller.hpp
 * @brief State machine driving one participant through the coupled run
 */

#ifndef HEATCOUPLE_CORE_COUPLING_CONTROLLER_HPP
#define HEATCOUPLE_CORE_COUPLING_CONTROLLER_HPP

#include "heatcouple/core/coupling_channel.hpp"
#include "heatcouple/core/coupling_observer.hpp"
#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/field_solver_interface.hpp"
#include "heatcouple/core/flux_projector.hpp"
#include "mfem.hpp"
#include <string>

namespace heatcouple
{

struct ControllerOptions
{
    Role role = Role::Dirichlet;
    double maxTimeStep = 0.1;
    double dropTolerance = 1.0e-15;
    std::string consumptionMeshName;
    std::string productionMeshName;
    int printLevel = 0;
};

/**
 * @class CouplingController
 * @brief AwaitRead -> MaybeCheckpoint -> Solve -> MaybeWrite -> Advance -> Decide
 *
 * One call to iterate() runs the six steps once. The loop ends when the
 * channel stops reporting ongoing; the controller then finalizes and
 * releases the channel. The current, checkpointed and boundary states are
 * owned by the controller, so independent runs may coexist in one
 * process.
 *
 * Any heatcouple::Error raised inside a step is tagged with the step name
 * and rethrown; there is no local retry. A coordinator rollback restores
 * the checkpoint and is not an error.
 *
 * The channel, solver and projector are not owned. The projector is only
 * used, and only required, in the Dirichlet role.
 */
class CouplingController
{
public:
    CouplingController(CouplingChannel* channel,
                       LocalFieldSolver* solver,
                       const FluxProjector* projector,
                       const ControllerOptions& options);

    void setObserver(CouplingObserver* observer) { observer_ = observer; }

    /// Registers the interface samples and initializes the channel
    void initialize();

    /// Runs one pass of the state machine
    void iterate();

    /// Releases the channel; idempotent
    void finalize();

    /// initialize(), iterate() until done, finalize()
    void run();

    bool isOngoing() const;
    bool isFinalized() const { return state_ == CouplingStep::Finalized; }
    CouplingStep getState() const { return state_; }

    /// Last committed SolutionState
    const mfem::Vector& getSolution() const { return previous_; }
    /// Simulation time of the last committed state
    double getTime() const { return time_; }
    double getLastStepSize() const { return dt_; }

    const Checkpoint& getCheckpoint() const { return checkpoint_; }
    const BoundaryData& getBoundaryData() const { return boundary_; }

    int getSolveCount() const { return solveCount_; }
    int getCommittedWindows() const { return committedWindows_; }
    int getRollbackCount() const { return rollbackCount_; }

    const ControllerOptions& getOptions() const { return options_; }

private:
    void runStep(CouplingStep step);

    void initializeStep();
    void awaitRead();
    void maybeCheckpoint();
    void solveStep();
    void maybeWrite();
    void advanceStep();
    void decide();

    void checkBuffer(const mfem::Vector& values, const MeshHandle& mesh, SampleKind kind,
                     const char* what) const;
    void log(const std::string& message) const;

    CouplingChannel* channel_;
    LocalFieldSolver* solver_;
    const FluxProjector* projector_;
    ControllerOptions options_;
    CouplingObserver* observer_;

    CouplingStep state_;
    bool initialized_;

    MeshHandle readMesh_;
    MeshHandle writeMesh_;

    mfem::Vector previous_;
    mfem::Vector current_;
    Checkpoint checkpoint_;
    BoundaryData boundary_;

    double time_;
    double dt_;

    int solveCount_;
    int committedWindows_;
    int rollbackCount_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_COUPLING_CONTROLLER_HPP
