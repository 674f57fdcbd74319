/**
 * @file channels/in_process_channel.hpp
 * @brief Coupling coordinator for two participants living in one process
 */

#ifndef HEATCOUPLE_CHANNELS_IN_PROCESS_CHANNEL_HPP
#define HEATCOUPLE_CHANNELS_IN_PROCESS_CHANNEL_HPP

#include "heatcouple/core/coupling_channel.hpp"
#include "mfem.hpp"
#include <memory>
#include <string>
#include <vector>

namespace heatcouple
{

struct InProcessSettings
{
    double maxTime = 1.0;
    double windowSize = 0.1;
    /// 1 gives an explicit scheme, more gives fixed implicit iterations
    int iterationsPerWindow = 1;
    /// Under-relaxation of the second participant's data between iterations
    double relaxation = 1.0;
};

class InProcessCouplingChannel;

/**
 * @class InProcessCouplingHub
 * @brief Serial (Gauss-Seidel) coupling of two in-process participants
 *
 * The first participant to connect solves each window with the data the
 * second one published in its previous sweep; the second then solves with
 * the data the first one just published. Data are moved between the
 * writer's and the reader's sample points by nearest-neighbour mapping.
 * Participants must be iterated alternately, one window at a time; a read
 * that would see data from the wrong sweep is a protocol violation.
 *
 * The hub must outlive the channels it hands out.
 */
class InProcessCouplingHub
{
public:
    explicit InProcessCouplingHub(const InProcessSettings& settings);

    /// Connects a participant; a third one is a ConfigurationError
    std::unique_ptr<InProcessCouplingChannel> connect(const std::string& participant);

    const InProcessSettings& getSettings() const { return settings_; }
    bool isImplicit() const { return settings_.iterationsPerWindow > 1; }
    int getNumParticipants() const { return static_cast<int>(slots_.size()); }

private:
    friend class InProcessCouplingChannel;

    struct Published
    {
        std::string quantity;
        InterfaceSample sample;
        mfem::Vector values;
        int sweep = -1;
    };

    struct Slot
    {
        std::string name;
        Published data;
        bool finalized = false;
    };

    void publish(int index, int sweep, const std::string& quantity, const InterfaceSample& sample,
                 const mfem::Vector& values, bool relax);

    InProcessSettings settings_;
    std::vector<Slot> slots_;
};

/**
 * @class InProcessCouplingChannel
 * @brief One endpoint of an InProcessCouplingHub
 */
class InProcessCouplingChannel : public CouplingChannel
{
public:
    MeshHandle registerInterface(const std::string& meshName, const InterfaceSample& sample) override;
    double initialize() override;

    bool isOngoing() const override;
    bool isReadAvailable() const override;
    bool isWriteRequired(double dt) override;

    void read(const std::string& quantity, const MeshHandle& mesh, mfem::Vector& values) override;
    void write(const std::string& quantity, const MeshHandle& mesh, const mfem::Vector& values) override;

    double advance(double dt) override;

    bool isActionRequired(CheckpointAction action) const override;
    void acknowledge(CheckpointAction action) override;

    CouplingClock getClock() const override;
    void finalize() override;

    const std::string& getParticipant() const;
    /// Window-iterations completed so far, rolled-back ones included
    int getCompletedSweeps() const { return sweeps_; }
    int getIteration() const { return iteration_; }

private:
    friend class InProcessCouplingHub;

    InProcessCouplingChannel(InProcessCouplingHub* hub, int index);

    struct RegisteredMesh
    {
        MeshHandle handle;
        InterfaceSample sample;
    };

    void requireActive(const char* call) const;
    const RegisteredMesh& lookup(const MeshHandle& mesh, const char* call) const;
    double getWindowLength() const;

    InProcessCouplingHub* hub_;
    int index_;
    std::vector<RegisteredMesh> meshes_;

    bool initialized_;
    bool finalized_;
    double windowStart_;
    double windowTime_;
    int iteration_;
    int sweeps_;
    bool writeCheckpointPending_;
    bool readCheckpointPending_;

    bool hasPendingWrite_;
    std::string pendingQuantity_;
    int pendingMesh_;
    mfem::Vector pendingValues_;
};

/// Nearest-neighbour transfer of values between two point sets
void mapNearestNeighbour(const InterfaceSample& source,
                         const mfem::Vector& sourceValues,
                         const InterfaceSample& target,
                         mfem::Vector& targetValues);

} // namespace heatcouple

#endif // HEATCOUPLE_CHANNELS_IN_PROCESS_CHANNEL_HPP
