/**
 * @file core/coupling_channel.hpp
 * @brief Abstract process-boundary channel to the coupling coordinator
 */

#ifndef HEATCOUPLE_CORE_COUPLING_CHANNEL_HPP
#define HEATCOUPLE_CORE_COUPLING_CHANNEL_HPP

#include "heatcouple/core/coupling_types.hpp"
#include "heatcouple/core/interface_sample.hpp"
#include "mfem.hpp"
#include <string>
#include <vector>

namespace heatcouple
{

/// A point set registered with the coordinator
struct MeshHandle
{
    std::string name;
    int meshId = -1;
    std::vector<int> vertexIds;

    int size() const { return static_cast<int>(vertexIds.size()); }
};

/**
 * @class CouplingChannel
 * @brief Contract of the external coupling coordinator
 *
 * read() is only valid when isReadAvailable() is true, write() only when
 * isWriteRequired() returned true for the step about to be advanced, and
 * acknowledge() only for an action that is currently required. Calls out
 * of order throw CoordinatorProtocolViolation. read(), write() and
 * advance() may block on the other participant.
 */
class CouplingChannel
{
public:
    virtual ~CouplingChannel() = default;

    /// Registers the sample points under a mesh name; buffers follow the sample order
    virtual MeshHandle registerInterface(const std::string& meshName, const InterfaceSample& sample) = 0;

    /// Completes setup and returns the first admissible step
    virtual double initialize() = 0;

    virtual bool isOngoing() const = 0;
    virtual bool isReadAvailable() const = 0;
    virtual bool isWriteRequired(double dt) = 0;

    virtual void read(const std::string& quantity, const MeshHandle& mesh, mfem::Vector& values) = 0;
    virtual void write(const std::string& quantity, const MeshHandle& mesh, const mfem::Vector& values) = 0;

    /// Advances the coupling clock by dt and returns the next admissible step
    virtual double advance(double dt) = 0;

    virtual bool isActionRequired(CheckpointAction action) const = 0;
    virtual void acknowledge(CheckpointAction action) = 0;

    virtual CouplingClock getClock() const = 0;

    /// Releases the coordinator
    virtual void finalize() = 0;
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_COUPLING_CHANNEL_HPP
