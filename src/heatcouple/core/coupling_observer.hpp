/**
 * @file core/coupling_observer.hpp
 * @brief Hooks into the coupling state machine
 */

#ifndef HEATCOUPLE_CORE_COUPLING_OBSERVER_HPP
#define HEATCOUPLE_CORE_COUPLING_OBSERVER_HPP

#include "mfem.hpp"

namespace heatcouple
{

/// States of the coupling controller, in per-iteration order
enum class CouplingStep
{
    Initialize,
    AwaitRead,
    MaybeCheckpoint,
    Solve,
    MaybeWrite,
    Advance,
    Decide,
    Finalized
};

const char* stepName(CouplingStep step);

/**
 * @class CouplingObserver
 * @brief Receives state transitions, committed windows and rollbacks
 *
 * The committed state passed to onWindowCommitted is the final
 * SolutionState of that window, ready for an external writer.
 */
class CouplingObserver
{
public:
    virtual ~CouplingObserver() = default;

    virtual void onStep(CouplingStep step) { (void)step; }

    virtual void onWindowCommitted(int window, double time, const mfem::Vector& state)
    {
        (void)window;
        (void)time;
        (void)state;
    }

    virtual void onRollback(double time) { (void)time; }
};

} // namespace heatcouple

#endif // HEATCOUPLE_CORE_COUPLING_OBSERVER_HPP
