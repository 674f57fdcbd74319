/**
 * @file core/coupling_types.hpp
 * @brief Value types shared by the coupling controller, channels and solvers
 */

#ifndef HEATCOUPLE_CORE_COUPLING_TYPES_HPP
#define HEATCOUPLE_CORE_COUPLING_TYPES_HPP

#include "mfem.hpp"
#include <string>

namespace heatcouple
{

/// Quantity names exchanged across the interface
constexpr const char* TEMPERATURE = "Temperature";
constexpr const char* FLUX = "Flux";

/**
 * @brief Interface role of a participant
 *
 * Dirichlet participants receive the interface temperature and send the
 * flux; Neumann participants receive the flux and send the temperature.
 */
enum class Role { Dirichlet, Neumann };

Role parseRole(const std::string& name);
const char* roleName(Role role);

const char* readQuantity(Role role);
const char* writeQuantity(Role role);

/// Checkpoint actions signalled by the coordinator
enum class CheckpointAction { WriteCheckpoint, ReadCheckpoint };

const char* actionName(CheckpointAction action);

/// The two point sets of an interface
enum class SampleKind { Consumption, Production };

/**
 * @brief Coupling time as seen through the channel
 *
 * Mutated by CouplingChannel::initialize() and CouplingChannel::advance()
 * only.
 */
struct CouplingClock
{
    double time = 0.0;
    double admissibleStep = 0.0;
    bool ongoing = false;
};

/**
 * @brief Boundary data folded into the local problem
 *
 * constraints has one entry per dof, NaN where unconstrained. source is the
 * interface load added to the weak-form residual (Neumann role).
 */
struct BoundaryData
{
    mfem::Vector constraints;
    mfem::Vector source;
};

/// Saved state at the start of a coupling window
struct Checkpoint
{
    mfem::Vector state;
    double time = 0.0;
    bool valid = false;
};

/// Returns true if entry i of a constraint vector is constrained
inline bool isConstrained(const mfem::Vector& constraints, int i)
{
    return constraints(i) == constraints(i);
}

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_COUPLING_TYPES_HPP
