/**
 * @file timestep_negotiator.cpp
 * @brief Time-step negotiation implementation
 */

#include <fsilink/coupling/timestep_negotiator.hpp>

#include <algorithm>

namespace fsl {
namespace coupling {

bool TimeStepNegotiator::exchange_with_peer(const CouplingSession& session, Int iteration,
                                            Real dt_local, Real& dt) {
    const int peer = session.peer().root_rank;

    Real dt_peer = session.dt_reference();
    int status = transport_.receive_scalar(peer, iteration, message::peer_time_step, dt_peer);
    if (transport_status::failed(status)) {
        FSL_LOG_DEBUG("Receive of {} failed: {}", message::peer_time_step,
                      transport_status::to_string(status));
        return false;
    }

    dt = std::min({session.dt_reference(), dt_peer, dt_local});

    status = transport_.send_scalar(peer, iteration, message::negotiated_time_step, dt);
    if (transport_status::failed(status)) {
        FSL_LOG_DEBUG("Send of {} failed: {}", message::negotiated_time_step,
                      transport_status::to_string(status));
        return false;
    }

    if (session.verbosity() > 1) {
        FSL_LOG_INFO("Time step exchange {}: fluid {:.6e}, structure {:.6e}, selected {:.6e}",
                     iteration, dt_local, dt_peer, dt);
    }
    return true;
}

Real TimeStepNegotiator::negotiate(CouplingSession& session, RunControl& run, Real dt_local) {
    if (session.is_terminated()) {
        return dt_local;
    }

    Int iteration = session.iteration() + 1;
    Real dt = std::min(session.dt_reference(), dt_local);

    if (!session.is_dry_run() && comm_.is_root()) {
        if (!exchange_with_peer(session, iteration, dt_local, dt)) {
            // Remaining steps run at the reference step
            dt = session.dt_reference();
            iteration = -1;

            FSL_LOG_WARN("Structural solver disconnected (finished) or exchange error; "
                         "stopping at end of next time step");
        }
    }

    comm_.broadcast(&dt, 1, 0);
    comm_.broadcast(&iteration, 1, 0);

    if (iteration < 0 && run.nt_cur() < run.nt_max() + 1) {
        run.schedule_stop(run.nt_cur() + 1);
    }

    session.set_iteration(iteration);
    session.set_dt(dt);
    session.reset_sub_iterations();

    if (comm_.is_root() && session.verbosity() > 0 && !session.is_terminated()) {
        FSL_LOG_INFO("Coupling iteration {}: dt = {:.6e}", iteration, dt);
    }

    return dt;
}

} // namespace coupling
} // namespace fsl
