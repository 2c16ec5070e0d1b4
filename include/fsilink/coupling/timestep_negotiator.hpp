#pragma once

/**
 * @file timestep_negotiator.hpp
 * @brief Agreement on a common time step with the peer solver
 *
 * Once per time step the coordinating rank receives the peer's proposal
 * ("DTAST"), selects the smallest of the reference step, the peer step and
 * the local candidate, and returns the choice ("DTCALC"). The result and
 * the iteration sentinel are broadcast to the local group.
 *
 * A failed exchange is not an error for the fluid run: the session is
 * marked terminated, the step falls back to the reference step and the
 * run is scheduled to stop after the next step.
 */

#include <fsilink/core/core.hpp>
#include <fsilink/coupling/coupling_session.hpp>
#include <fsilink/coupling/run_control.hpp>
#include <fsilink/coupling/protocol.hpp>
#include <fsilink/coupling/transport.hpp>

namespace fsl {
namespace coupling {

class TimeStepNegotiator {
public:
    TimeStepNegotiator(TransportChannel& transport, Communicator& comm)
        : transport_(transport), comm_(comm) {}

    /**
     * @brief Negotiate the step of the next time iteration
     *
     * Collective over the local group. A terminated session returns
     * dt_local unchanged and leaves the session untouched.
     *
     * @param session Coupling state (iteration, dt record, sub-iteration reset)
     * @param run Run control, rescheduled on disconnect
     * @param dt_local Step proposed by the fluid solver
     * @return Step to use on every local rank
     */
    Real negotiate(CouplingSession& session, RunControl& run, Real dt_local);

private:
    /// Peer exchange on the coordinating rank; returns false on failure
    bool exchange_with_peer(const CouplingSession& session, Int iteration,
                            Real dt_local, Real& dt);

    TransportChannel& transport_;
    Communicator& comm_;
};

} // namespace coupling
} // namespace fsl
