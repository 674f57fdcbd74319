/**
 * @file channels/in_process_channel.cpp
 * @brief Implementation of the in-process coupling coordinator
 */

#include "heatcouple/channels/in_process_channel.hpp"
#include "heatcouple/core/errors.hpp"
#include <algorithm>
#include <limits>

namespace heatcouple
{

namespace
{

constexpr double TIME_EPSILON = 1.0e-10;

} // namespace

void mapNearestNeighbour(const InterfaceSample& source,
                         const mfem::Vector& sourceValues,
                         const InterfaceSample& target,
                         mfem::Vector& targetValues)
{
    if (source.getDimension() != target.getDimension())
    {
        throw ConfigurationError("cannot map between point sets of different dimension");
    }
    if (sourceValues.Size() != source.size())
    {
        throw ConfigurationError("source values do not match the source point set");
    }
    if (source.size() == 0 && target.size() > 0)
    {
        throw CoordinatorProtocolViolation("cannot map from an empty point set");
    }

    const int dim = source.getDimension();
    const std::vector<double>& from = source.getCoordinates();
    const std::vector<double>& to = target.getCoordinates();

    targetValues.SetSize(target.size());
    for (int i = 0; i < target.size(); i++)
    {
        int nearest = 0;
        double best = std::numeric_limits<double>::max();
        for (int j = 0; j < source.size(); j++)
        {
            double dist2 = 0.0;
            for (int d = 0; d < dim; d++)
            {
                const double diff = to[i * dim + d] - from[j * dim + d];
                dist2 += diff * diff;
            }
            if (dist2 < best)
            {
                best = dist2;
                nearest = j;
            }
        }
        targetValues(i) = sourceValues(nearest);
    }
}

// ---------------------------------------------------------------------------
// InProcessCouplingHub

InProcessCouplingHub::InProcessCouplingHub(const InProcessSettings& settings)
    : settings_(settings)
{
    if (!(settings_.maxTime > 0.0) || !(settings_.windowSize > 0.0))
    {
        throw ConfigurationError("final time and window size must be positive");
    }
    if (settings_.iterationsPerWindow < 1)
    {
        throw ConfigurationError("at least one iteration per window is required");
    }
    if (!(settings_.relaxation > 0.0) || settings_.relaxation > 1.0)
    {
        throw ConfigurationError("relaxation must lie in (0, 1]");
    }
    slots_.reserve(2);
}

std::unique_ptr<InProcessCouplingChannel> InProcessCouplingHub::connect(const std::string& participant)
{
    if (slots_.size() >= 2)
    {
        throw ConfigurationError("in-process coupling supports two participants, '" + participant
                                 + "' would be the third");
    }
    for (const Slot& slot : slots_)
    {
        if (slot.name == participant)
        {
            throw ConfigurationError("participant '" + participant + "' is already connected");
        }
    }

    Slot slot;
    slot.name = participant;
    slots_.push_back(slot);

    const int index = static_cast<int>(slots_.size()) - 1;
    return std::unique_ptr<InProcessCouplingChannel>(new InProcessCouplingChannel(this, index));
}

void InProcessCouplingHub::publish(int index, int sweep, const std::string& quantity,
                                   const InterfaceSample& sample, const mfem::Vector& values,
                                   bool relax)
{
    Published& data = slots_[index].data;

    const bool canRelax = relax && data.sweep >= 0 && data.quantity == quantity
                          && data.values.Size() == values.Size();
    if (canRelax)
    {
        const double omega = settings_.relaxation;
        data.values *= (1.0 - omega);
        data.values.Add(omega, values);
    }
    else
    {
        data.values = values;
    }

    data.quantity = quantity;
    data.sample = sample;
    data.sweep = sweep;
}

// ---------------------------------------------------------------------------
// InProcessCouplingChannel

InProcessCouplingChannel::InProcessCouplingChannel(InProcessCouplingHub* hub, int index)
    : hub_(hub),
      index_(index),
      initialized_(false),
      finalized_(false),
      windowStart_(0.0),
      windowTime_(0.0),
      iteration_(0),
      sweeps_(0),
      writeCheckpointPending_(false),
      readCheckpointPending_(false),
      hasPendingWrite_(false),
      pendingMesh_(-1)
{
}

const std::string& InProcessCouplingChannel::getParticipant() const
{
    return hub_->slots_[index_].name;
}

MeshHandle InProcessCouplingChannel::registerInterface(const std::string& meshName,
                                                       const InterfaceSample& sample)
{
    if (initialized_ || finalized_)
    {
        throw CoordinatorProtocolViolation("registerInterface() called after initialize()");
    }
    for (const RegisteredMesh& mesh : meshes_)
    {
        if (mesh.handle.name == meshName)
        {
            throw ConfigurationError("mesh '" + meshName + "' is already registered");
        }
    }

    RegisteredMesh mesh;
    mesh.handle.name = meshName;
    mesh.handle.meshId = static_cast<int>(meshes_.size());
    mesh.handle.vertexIds.resize(sample.size());
    for (int i = 0; i < sample.size(); i++)
    {
        mesh.handle.vertexIds[i] = i;
    }
    mesh.sample = sample;
    meshes_.push_back(mesh);

    return meshes_.back().handle;
}

double InProcessCouplingChannel::initialize()
{
    if (initialized_)
    {
        throw CoordinatorProtocolViolation("initialize() called twice");
    }
    if (finalized_)
    {
        throw CoordinatorProtocolViolation("initialize() called after finalize()");
    }

    initialized_ = true;
    windowStart_ = 0.0;
    windowTime_ = 0.0;
    iteration_ = 0;
    writeCheckpointPending_ = hub_->isImplicit() && isOngoing();

    return getWindowLength();
}

bool InProcessCouplingChannel::isOngoing() const
{
    return initialized_ && !finalized_ && windowStart_ < hub_->settings_.maxTime - TIME_EPSILON;
}

bool InProcessCouplingChannel::isReadAvailable() const
{
    requireActive("isReadAvailable()");

    // The first participant has nothing to read before its peer's first sweep
    return index_ == 1 || sweeps_ > 0;
}

bool InProcessCouplingChannel::isWriteRequired(double dt)
{
    requireActive("isWriteRequired()");
    return windowTime_ + dt >= getWindowLength() - TIME_EPSILON;
}

void InProcessCouplingChannel::read(const std::string& quantity, const MeshHandle& mesh, mfem::Vector& values)
{
    requireActive("read()");
    if (readCheckpointPending_)
    {
        throw CoordinatorProtocolViolation("read() before the iteration checkpoint was restored");
    }
    const RegisteredMesh& target = lookup(mesh, "read()");

    if (hub_->slots_.size() < 2)
    {
        throw CoordinatorProtocolViolation("read() with no peer connected to the hub");
    }

    const InProcessCouplingHub::Published& data = hub_->slots_[1 - index_].data;
    const int expectedSweep = index_ == 0 ? sweeps_ - 1 : sweeps_;
    if (expectedSweep < 0 || data.sweep != expectedSweep)
    {
        throw CoordinatorProtocolViolation("participant '" + getParticipant() + "' read sweep "
                                           + std::to_string(expectedSweep) + " but its peer published sweep "
                                           + std::to_string(data.sweep));
    }
    if (data.quantity != quantity)
    {
        throw CoordinatorProtocolViolation("peer publishes '" + data.quantity + "', not '" + quantity + "'");
    }

    mapNearestNeighbour(data.sample, data.values, target.sample, values);
}

void InProcessCouplingChannel::write(const std::string& quantity, const MeshHandle& mesh,
                                     const mfem::Vector& values)
{
    requireActive("write()");
    const RegisteredMesh& source = lookup(mesh, "write()");

    if (quantity != TEMPERATURE && quantity != FLUX)
    {
        throw ConfigurationError("unknown coupling quantity '" + quantity + "'");
    }
    if (values.Size() != source.sample.size())
    {
        throw ConfigurationError("write() of " + std::to_string(values.Size()) + " values on mesh '"
                                 + mesh.name + "' with " + std::to_string(source.sample.size()) + " vertices");
    }

    pendingQuantity_ = quantity;
    pendingMesh_ = source.handle.meshId;
    pendingValues_ = values;
    hasPendingWrite_ = true;
}

double InProcessCouplingChannel::advance(double dt)
{
    requireActive("advance()");
    if (writeCheckpointPending_)
    {
        throw CoordinatorProtocolViolation("advance() before the iteration checkpoint was written");
    }
    if (readCheckpointPending_)
    {
        throw CoordinatorProtocolViolation("advance() before the iteration checkpoint was restored");
    }

    const double length = getWindowLength();
    if (!(dt > 0.0) || windowTime_ + dt > length + TIME_EPSILON)
    {
        throw CoordinatorProtocolViolation("advance(" + std::to_string(dt) + ") exceeds the admissible step "
                                           + std::to_string(length - windowTime_));
    }

    windowTime_ += dt;
    if (windowTime_ < length - TIME_EPSILON)
    {
        return length - windowTime_;
    }

    // Window complete: publish the data written for it
    if (!hasPendingWrite_)
    {
        throw CoordinatorProtocolViolation("participant '" + getParticipant()
                                           + "' completed a window without writing data");
    }
    const bool relax = hub_->isImplicit() && index_ == 1 && iteration_ > 0;
    hub_->publish(index_, sweeps_, pendingQuantity_, meshes_[pendingMesh_].sample, pendingValues_, relax);
    hasPendingWrite_ = false;
    ++sweeps_;
    windowTime_ = 0.0;

    if (iteration_ + 1 < hub_->settings_.iterationsPerWindow)
    {
        ++iteration_;
        readCheckpointPending_ = true;
        return length;
    }

    windowStart_ += length;
    iteration_ = 0;
    writeCheckpointPending_ = hub_->isImplicit() && isOngoing();
    return isOngoing() ? getWindowLength() : 0.0;
}

bool InProcessCouplingChannel::isActionRequired(CheckpointAction action) const
{
    requireActive("isActionRequired()");
    switch (action)
    {
    case CheckpointAction::WriteCheckpoint:
        return writeCheckpointPending_;
    case CheckpointAction::ReadCheckpoint:
        return readCheckpointPending_;
    }
    return false;
}

void InProcessCouplingChannel::acknowledge(CheckpointAction action)
{
    requireActive("acknowledge()");
    bool& pending = action == CheckpointAction::WriteCheckpoint ? writeCheckpointPending_
                                                                : readCheckpointPending_;
    if (!pending)
    {
        throw CoordinatorProtocolViolation(std::string("acknowledged ") + actionName(action)
                                           + " which was not required");
    }
    pending = false;
}

CouplingClock InProcessCouplingChannel::getClock() const
{
    CouplingClock clock;
    clock.time = windowStart_ + windowTime_;
    clock.ongoing = isOngoing();
    clock.admissibleStep = clock.ongoing ? getWindowLength() - windowTime_ : 0.0;
    return clock;
}

void InProcessCouplingChannel::finalize()
{
    if (finalized_)
    {
        throw CoordinatorProtocolViolation("finalize() called twice");
    }
    finalized_ = true;
    hub_->slots_[index_].finalized = true;
}

void InProcessCouplingChannel::requireActive(const char* call) const
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

const InProcessCouplingChannel::RegisteredMesh& InProcessCouplingChannel::lookup(const MeshHandle& mesh,
                                                                                  const char* call) const
{
    if (mesh.meshId < 0 || mesh.meshId >= static_cast<int>(meshes_.size())
        || meshes_[mesh.meshId].handle.name != mesh.name)
    {
        throw CoordinatorProtocolViolation(std::string(call) + " on unregistered mesh '" + mesh.name + "'");
    }
    return meshes_[mesh.meshId];
}

double InProcessCouplingChannel::getWindowLength() const
{
    const InProcessSettings& s = hub_->settings_;
    return std::min(s.windowSize, s.maxTime - windowStart_);
}

} // namespace heatcouple
