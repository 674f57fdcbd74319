/**
 * @file core/coupling_controller.cpp
 * @brief Implementation of the coupling state machine
 */

#include "heatcouple/core/coupling_controller.hpp"
#include "heatcouple/core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace heatcouple
{

const char* stepName(CouplingStep step)
{
    switch (step)
    {
    case CouplingStep::Initialize:
        return "Initialize";
    case CouplingStep::AwaitRead:
        return "AwaitRead";
    case CouplingStep::MaybeCheckpoint:
        return "MaybeCheckpoint";
    case CouplingStep::Solve:
        return "Solve";
    case CouplingStep::MaybeWrite:
        return "MaybeWrite";
    case CouplingStep::Advance:
        return "Advance";
    case CouplingStep::Decide:
        return "Decide";
    case CouplingStep::Finalized:
        return "Finalized";
    }
    return "Unknown";
}

CouplingController::CouplingController(CouplingChannel* channel,
                                       LocalFieldSolver* solver,
                                       const FluxProjector* projector,
                                       const ControllerOptions& options)
    : channel_(channel),
      solver_(solver),
      projector_(projector),
      options_(options),
      observer_(nullptr),
      state_(CouplingStep::Initialize),
      initialized_(false),
      time_(0.0),
      dt_(0.0),
      solveCount_(0),
      committedWindows_(0),
      rollbackCount_(0)
{
    if (channel_ == nullptr || solver_ == nullptr)
    {
        throw ConfigurationError("coupling controller needs a channel and a field solver");
    }
    if (options_.role == Role::Dirichlet && projector_ == nullptr)
    {
        throw ConfigurationError("the Dirichlet side needs a flux projector");
    }
    if (!(options_.maxTimeStep > 0.0))
    {
        throw ConfigurationError("maximum time step must be positive");
    }
    if (options_.dropTolerance < 0.0)
    {
        throw ConfigurationError("drop tolerance must be non-negative");
    }
    if (options_.consumptionMeshName.empty() || options_.productionMeshName.empty())
    {
        throw ConfigurationError("interface mesh names must not be empty");
    }
    if (options_.consumptionMeshName == options_.productionMeshName)
    {
        throw ConfigurationError("consumption and production meshes need distinct names");
    }
}

void CouplingController::initialize()
{
    if (initialized_)
    {
        throw CoordinatorProtocolViolation("initialize() called twice");
    }

    runStep(CouplingStep::Initialize);
    initialized_ = true;

    if (!channel_->getClock().ongoing)
    {
        finalize();
    }
}

void CouplingController::iterate()
{
    if (!initialized_)
    {
        throw CoordinatorProtocolViolation("iterate() called before initialize()");
    }
    if (isFinalized())
    {
        throw CoordinatorProtocolViolation("iterate() called after the run was finalized");
    }

    runStep(CouplingStep::AwaitRead);
    runStep(CouplingStep::MaybeCheckpoint);
    runStep(CouplingStep::Solve);
    runStep(CouplingStep::MaybeWrite);
    runStep(CouplingStep::Advance);
    runStep(CouplingStep::Decide);

    if (!channel_->getClock().ongoing)
    {
        finalize();
    }
}

void CouplingController::finalize()
{
    if (isFinalized())
    {
        return;
    }

    try
    {
        channel_->finalize();
    }
    catch (Error& e)
    {
        e.setStep(stepName(CouplingStep::Finalized));
        throw;
    }

    // Only a released channel counts as finalized
    state_ = CouplingStep::Finalized;
    if (observer_ != nullptr)
    {
        observer_->onStep(state_);
    }

    log("finalized after " + std::to_string(committedWindows_) + " committed windows");
}

void CouplingController::run()
{
    initialize();
    while (!isFinalized())
    {
        iterate();
    }
}

bool CouplingController::isOngoing() const
{
    return initialized_ && !isFinalized();
}

void CouplingController::runStep(CouplingStep step)
{
    state_ = step;
    if (observer_ != nullptr)
    {
        observer_->onStep(step);
    }

    try
    {
        switch (step)
        {
        case CouplingStep::Initialize:
            initializeStep();
            break;
        case CouplingStep::AwaitRead:
            awaitRead();
            break;
        case CouplingStep::MaybeCheckpoint:
            maybeCheckpoint();
            break;
        case CouplingStep::Solve:
            solveStep();
            break;
        case CouplingStep::MaybeWrite:
            maybeWrite();
            break;
        case CouplingStep::Advance:
            advanceStep();
            break;
        case CouplingStep::Decide:
            decide();
            break;
        case CouplingStep::Finalized:
            break;
        }
    }
    catch (Error& e)
    {
        e.setStep(stepName(step));
        throw;
    }
}

void CouplingController::initializeStep()
{
    const int n = solver_->getSize();

    solver_->getInitialState(previous_);
    if (previous_.Size() != n)
    {
        throw ConfigurationError("initial state has " + std::to_string(previous_.Size())
                                 + " entries, expected " + std::to_string(n));
    }
    current_ = previous_;

    solver_->getBaseConstraints(boundary_.constraints);
    if (boundary_.constraints.Size() != n)
    {
        throw ConfigurationError("base constraints have " + std::to_string(boundary_.constraints.Size())
                                 + " entries, expected " + std::to_string(n));
    }
    boundary_.source.SetSize(n);
    boundary_.source = 0.0;

    readMesh_ = channel_->registerInterface(options_.consumptionMeshName,
                                            solver_->getInterfaceSample(SampleKind::Consumption));
    writeMesh_ = channel_->registerInterface(options_.productionMeshName,
                                             solver_->getInterfaceSample(SampleKind::Production));

    if (readMesh_.size() != solver_->getInterfaceSample(SampleKind::Consumption).size()
        || writeMesh_.size() != solver_->getInterfaceSample(SampleKind::Production).size())
    {
        throw ConfigurationError("coordinator registered a different number of vertices than sample points");
    }

    // The admissible step is taken from the clock before every solve
    channel_->initialize();
    time_ = channel_->getClock().time;
    checkpoint_ = Checkpoint();

    log("initialized, " + std::to_string(readMesh_.size()) + " read points, "
        + std::to_string(writeMesh_.size()) + " write points");
}

void CouplingController::awaitRead()
{
    if (!channel_->isReadAvailable())
    {
        return;
    }

    mfem::Vector values;
    channel_->read(readQuantity(options_.role), readMesh_, values);
    checkBuffer(values, readMesh_, SampleKind::Consumption, "read");

    switch (options_.role)
    {
    case Role::Dirichlet:
        solver_->buildConstraints(values, options_.dropTolerance, boundary_.constraints);
        break;
    case Role::Neumann:
        solver_->buildSource(values, boundary_.source);
        break;
    }
}

void CouplingController::maybeCheckpoint()
{
    if (!channel_->isActionRequired(CheckpointAction::WriteCheckpoint))
    {
        return;
    }

    checkpoint_.state = previous_;
    checkpoint_.time = time_;
    checkpoint_.valid = true;
    channel_->acknowledge(CheckpointAction::WriteCheckpoint);

    log("writing iteration checkpoint at t = " + std::to_string(time_));
}

void CouplingController::solveStep()
{
    const CouplingClock clock = channel_->getClock();
    dt_ = std::min(options_.maxTimeStep, clock.admissibleStep);
    if (!(dt_ > 0.0))
    {
        throw CoordinatorProtocolViolation("coordinator granted a non-positive time step");
    }

    solver_->solve(previous_, dt_, boundary_, current_);
    ++solveCount_;
}

void CouplingController::maybeWrite()
{
    if (!channel_->isWriteRequired(dt_))
    {
        return;
    }

    mfem::Vector values;
    switch (options_.role)
    {
    case Role::Dirichlet:
    {
        mfem::Vector residual;
        solver_->computeResidual(previous_, current_, dt_, boundary_, residual);
        projector_->project(residual, values);
        break;
    }
    case Role::Neumann:
        solver_->evaluate(current_, SampleKind::Production, values);
        break;
    }

    checkBuffer(values, writeMesh_, SampleKind::Production, "write");
    channel_->write(writeQuantity(options_.role), writeMesh_, values);
}

void CouplingController::advanceStep()
{
    channel_->advance(dt_);
}

void CouplingController::decide()
{
    if (channel_->isActionRequired(CheckpointAction::ReadCheckpoint))
    {
        if (!checkpoint_.valid)
        {
            throw CoordinatorProtocolViolation("rollback requested but no checkpoint was written");
        }

        previous_ = checkpoint_.state;
        time_ = checkpoint_.time;
        channel_->acknowledge(CheckpointAction::ReadCheckpoint);
        ++rollbackCount_;

        log("reading iteration checkpoint, back to t = " + std::to_string(time_));
        if (observer_ != nullptr)
        {
            observer_->onRollback(time_);
        }
        return;
    }

    previous_ = current_;
    time_ = channel_->getClock().time;
    ++committedWindows_;

    if (observer_ != nullptr)
    {
        observer_->onWindowCommitted(committedWindows_, time_, previous_);
    }
}

void CouplingController::checkBuffer(const mfem::Vector& values,
                                     const MeshHandle& mesh,
                                     SampleKind kind,
                                     const char* what) const
{
    const int expected = solver_->getInterfaceSample(kind).size();
    if (values.Size() != expected || mesh.size() != expected)
    {
        throw ConfigurationError(std::string(what) + " buffer on mesh '" + mesh.name + "' has "
                                 + std::to_string(values.Size()) + " values for "
                                 + std::to_string(expected) + " sample points");
    }
}

void CouplingController::log(const std::string& message) const
{
    if (options_.printLevel > 0)
    {
        std::cout << "[" << roleName(options_.role) << "] " << message << std::endl;
    }
}

} // namespace heatcouple
