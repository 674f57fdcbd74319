/**
 * @file channels/precice_channel.cpp
 * @brief Implementation of the preCICE coupling channel
 */

#include "heatcouple/channels/precice_channel.hpp"
#include "heatcouple/core/errors.hpp"
#include <precice/Constants.hpp>
#include <precice/SolverInterface.hpp>

namespace heatcouple
{

PreciceCouplingChannel::PreciceCouplingChannel(const std::string& participant,
                                               const std::string& configFile,
                                               int rank,
                                               int size)
    : participant_(participant),
      interface_(new precice::SolverInterface(participant, configFile, rank, size)),
      initialized_(false),
      finalized_(false),
      time_(0.0),
      checkpointTime_(0.0),
      admissibleStep_(0.0)
{
}

PreciceCouplingChannel::~PreciceCouplingChannel() = default;

MeshHandle PreciceCouplingChannel::registerInterface(const std::string& meshName, const InterfaceSample& sample)
{
    if (initialized_ || finalized_)
    {
        throw CoordinatorProtocolViolation("registerInterface() called after initialize()");
    }
    if (sample.getDimension() != interface_->getDimensions())
    {
        throw ConfigurationError("sample dimension " + std::to_string(sample.getDimension())
                                 + " does not match the preCICE dimension "
                                 + std::to_string(interface_->getDimensions()));
    }

    MeshHandle handle;
    handle.name = meshName;
    handle.meshId = interface_->getMeshID(meshName);
    handle.vertexIds.resize(sample.size());
    if (sample.size() > 0)
    {
        interface_->setMeshVertices(handle.meshId, sample.size(), sample.getCoordinates().data(),
                                    handle.vertexIds.data());
    }
    return handle;
}

double PreciceCouplingChannel::initialize()
{
    if (initialized_)
    {
        throw CoordinatorProtocolViolation("initialize() called twice");
    }
    if (finalized_)
    {
        throw CoordinatorProtocolViolation("initialize() called after finalize()");
    }

    admissibleStep_ = interface_->initialize();
    initialized_ = true;
    time_ = 0.0;
    checkpointTime_ = 0.0;
    return admissibleStep_;
}

bool PreciceCouplingChannel::isOngoing() const
{
    return initialized_ && !finalized_ && interface_->isCouplingOngoing();
}

bool PreciceCouplingChannel::isReadAvailable() const
{
    requireActive("isReadAvailable()");
    return interface_->isReadDataAvailable();
}

bool PreciceCouplingChannel::isWriteRequired(double dt)
{
    requireActive("isWriteRequired()");
    return interface_->isWriteDataRequired(dt);
}

void PreciceCouplingChannel::read(const std::string& quantity, const MeshHandle& mesh, mfem::Vector& values)
{
    requireActive("read()");
    const int dataId = getDataId(quantity, mesh);

    values.SetSize(mesh.size());
    if (mesh.size() > 0)
    {
        interface_->readBlockScalarData(dataId, mesh.size(), mesh.vertexIds.data(), values.GetData());
    }
}

void PreciceCouplingChannel::write(const std::string& quantity, const MeshHandle& mesh, const mfem::Vector& values)
{
    requireActive("write()");
    if (values.Size() != mesh.size())
    {
        throw ConfigurationError("write() of " + std::to_string(values.Size()) + " values on mesh '"
                                 + mesh.name + "' with " + std::to_string(mesh.size()) + " vertices");
    }
    const int dataId = getDataId(quantity, mesh);

    if (mesh.size() > 0)
    {
        interface_->writeBlockScalarData(dataId, mesh.size(), mesh.vertexIds.data(), values.GetData());
    }
}

double PreciceCouplingChannel::advance(double dt)
{
    requireActive("advance()");
    if (!(dt > 0.0))
    {
        throw CoordinatorProtocolViolation("advance() with non-positive step " + std::to_string(dt));
    }

    admissibleStep_ = interface_->advance(dt);
    time_ += dt;
    return admissibleStep_;
}

bool PreciceCouplingChannel::isActionRequired(CheckpointAction action) const
{
    requireActive("isActionRequired()");
    return interface_->isActionRequired(actionString(action));
}

void PreciceCouplingChannel::acknowledge(CheckpointAction action)
{
    requireActive("acknowledge()");
    if (!interface_->isActionRequired(actionString(action)))
    {
        throw CoordinatorProtocolViolation(std::string("acknowledged ") + actionName(action)
                                           + " which was not required");
    }

    switch (action)
    {
    case CheckpointAction::WriteCheckpoint:
        checkpointTime_ = time_;
        break;
    case CheckpointAction::ReadCheckpoint:
        time_ = checkpointTime_;
        break;
    }
    interface_->markActionFulfilled(actionString(action));
}

CouplingClock PreciceCouplingChannel::getClock() const
{
    CouplingClock clock;
    clock.time = time_;
    clock.ongoing = isOngoing();
    clock.admissibleStep = clock.ongoing ? admissibleStep_ : 0.0;
    return clock;
}

void PreciceCouplingChannel::finalize()
{
    if (finalized_)
    {
        throw CoordinatorProtocolViolation("finalize() called twice");
    }
    if (!initialized_)
    {
        throw CoordinatorProtocolViolation("finalize() called before initialize()");
    }
    interface_->finalize();
    finalized_ = true;
}

void PreciceCouplingChannel::requireActive(const char* call) const
{
    if (!initialized_)
    {
        throw CoordinatorProtocolViolation(std::string(call) + " called before initialize()");
    }
    if (finalized_)
    {
        throw CoordinatorProtocolViolation(std::string(call) + " called after finalize()");
    }
}

int PreciceCouplingChannel::getDataId(const std::string& quantity, const MeshHandle& mesh) const
{
    if (mesh.meshId < 0)
    {
        throw CoordinatorProtocolViolation("mesh '" + mesh.name + "' was never registered");
    }
    if (!interface_->hasData(quantity, mesh.meshId))
    {
        throw ConfigurationError("quantity '" + quantity + "' is not defined on mesh '" + mesh.name + "'");
    }
    return interface_->getDataID(quantity, mesh.meshId);
}

const std::string& PreciceCouplingChannel::actionString(CheckpointAction action)
{
    switch (action)
    {
    case CheckpointAction::WriteCheckpoint:
        return precice::constants::actionWriteIterationCheckpoint();
    case CheckpointAction::ReadCheckpoint:
        break;
    }
    return precice::constants::actionReadIterationCheckpoint();
}

} // namespace heatcouple
