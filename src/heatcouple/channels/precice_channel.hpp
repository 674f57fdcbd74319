/**
 * @file channels/precice_channel.hpp
 * @brief CouplingChannel backed by a preCICE v2 SolverInterface
 */

#ifndef HEATCOUPLE_CHANNELS_PRECICE_CHANNEL_HPP
#define HEATCOUPLE_CHANNELS_PRECICE_CHANNEL_HPP

#include "heatcouple/core/coupling_channel.hpp"
#include "mfem.hpp"
#include <memory>
#include <string>

namespace precice
{
class SolverInterface;
} // namespace precice

namespace heatcouple
{

/**
 * @class PreciceCouplingChannel
 * @brief Talks to the other participant through preCICE
 *
 * Meshes and data are looked up by name in the preCICE configuration.
 * Checkpoint actions map to preCICE's iteration checkpoint actions. The
 * channel keeps its own copy of the coupling time, rolled back when a
 * ReadCheckpoint is acknowledged.
 */
class PreciceCouplingChannel : public CouplingChannel
{
public:
    PreciceCouplingChannel(const std::string& participant,
                           const std::string& configFile,
                           int rank = 0,
                           int size = 1);
    ~PreciceCouplingChannel() override;

    PreciceCouplingChannel(const PreciceCouplingChannel&) = delete;
    PreciceCouplingChannel& operator=(const PreciceCouplingChannel&) = delete;

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

    const std::string& getParticipant() const { return participant_; }

private:
    void requireActive(const char* call) const;
    int getDataId(const std::string& quantity, const MeshHandle& mesh) const;
    static const std::string& actionString(CheckpointAction action);

    std::string participant_;
    std::unique_ptr<precice::SolverInterface> interface_;

    bool initialized_;
    bool finalized_;
    double time_;
    double checkpointTime_;
    double admissibleStep_;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CHANNELS_PRECICE_CHANNEL_HPP
