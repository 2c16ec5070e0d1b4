/**
 * @file session_controller.cpp
 * @brief Session controller implementation
 */

#include <fsilink/coupling/session_controller.hpp>
#include <fsilink/coupling/protocol.hpp>

#include <algorithm>
#include <string>

namespace fsl {
namespace coupling {

SessionController::SessionController(CouplingSession& session, RunControl& run,
                                     TransportChannel& transport, Communicator& comm)
    : session_(session)
    , run_(run)
    , transport_(transport)
    , comm_(comm)
    , negotiator_(transport, comm)
    , evaluator_(comm)
{
}

// ============================================================================
// Helpers
// ============================================================================

void SessionController::require_state(SessionState expected, const char* operation) const {
    if (state_ != expected) {
        throw LogicError(std::string(operation) + " called in state " + to_string(state_) +
                         " (expected " + to_string(expected) + ")");
    }
}

void SessionController::handle_disconnect(const char* what) {
    if (session_.is_terminated()) {
        return;
    }

    session_.terminate();

    if (run_.nt_cur() < run_.nt_max() + 1) {
        run_.schedule_stop(run_.nt_cur() + 1);
    }

    if (comm_.is_root()) {
        FSL_LOG_WARN("Structural solver disconnected (finished) or error during {}; "
                     "stopping at end of time step {}", what,
                     std::max(run_.nt_cur(), run_.nt_max()));
    }
}

bool SessionController::failed_on_root(int status) {
    Int shared = static_cast<Int>(status);
    comm_.broadcast(&shared, 1, 0);
    return transport_status::failed(shared);
}

bool SessionController::sub_iteration_done(bool converged) const {
    const Int cap = std::max<Int>(1, session_.max_sub_iterations());
    return converged || session_.is_terminated() || session_.sub_iteration_id() >= cap;
}

// ============================================================================
// Run Sequence
// ============================================================================

void SessionController::initialize() {
    require_state(SessionState::Uninitialized, "initialize");

    if (!session_.is_registered()) {
        throw LogicError("Coupling geometry must be registered before initialization");
    }

    displacement_staging_.assign(vec3_stride * session_.n_vertices(), 0.0);
    velocity_staging_.assign(vec3_stride * session_.n_vertices(), 0.0);

    if (session_.is_dry_run()) {
        if (comm_.is_root()) {
            FSL_LOG_INFO("Coupling in dry-run mode: no structural solver connected");
        }
        state_ = SessionState::Active;
        return;
    }

    int status = transport_status::Ok;

    if (comm_.is_root()) {
        const CouplingParameters& p = session_.parameters();
        const int peer = session_.peer().root_rank;

        if (p.verbosity > 0) {
            FSL_LOG_INFO("Sending calculation parameters to {} '{}'",
                         session_.peer().app_type, session_.peer().app_name);
        }

        status = transport_.send_scalar(peer, 0, message::max_time_steps, p.max_time_steps);
        if (!transport_status::failed(status)) {
            status = transport_.send_scalar(peer, 0, message::max_sub_iterations,
                                            p.max_sub_iterations);
        }
        if (!transport_status::failed(status)) {
            status = transport_.send_scalar(peer, 0, message::tolerance, p.tolerance);
        }
        if (!transport_status::failed(status)) {
            status = transport_.send_scalar(peer, 0, message::initial_time, p.initial_time);
        }
        if (!transport_status::failed(status)) {
            status = transport_.send_scalar(peer, 0, message::reference_time_step,
                                            p.dt_reference);
        }
    }

    if (failed_on_root(status)) {
        handle_disconnect("parameter exchange");
    }

    state_ = SessionState::Active;
}

Real SessionController::begin_time_step(Real dt_local) {
    require_state(SessionState::Active, "begin_time_step");

    state_ = SessionState::NegotiatingDt;

    run_.advance_step();
    step_dt_ = negotiator_.negotiate(session_, run_, dt_local);
    session_.reset_sub_iterations();

    state_ = SessionState::SubIterating;
    return step_dt_;
}

Real SessionController::run_time_step(Real dt_local, CouplingHooks& hooks) {
    FSL_SCOPED_TIMER("Coupled time step");

    begin_time_step(dt_local);

    bool done = false;
    while (!done) {
        hooks.compute_fluid_forces(session_, session_.force_current());
        send_forces();

        receive_displacement();
        predict_displacement();

        // Without a peer the last imposed motion stays frozen
        if (!session_.is_terminated()) {
            hooks.apply_mesh_displacement(session_, session_.displacement_predicted());
        }

        const bool converged = exchange_convergence(hooks);
        save_values();

        session_.increment_sub_iteration();
        done = sub_iteration_done(converged);
    }

    state_ = SessionState::StepDone;

    if (comm_.is_root() && session_.verbosity() > 0) {
        FSL_LOG_INFO("Time step {} (t = {:.6e}): {} sub-iteration(s)",
                     run_.nt_cur(), run_.t_cur() + step_dt_, session_.sub_iteration_id());
    }

    return step_dt_;
}

void SessionController::end_time_step() {
    if (state_ != SessionState::StepDone && state_ != SessionState::SubIterating) {
        throw LogicError(std::string("end_time_step called in state ") + to_string(state_));
    }

    run_.complete_step(step_dt_);

    state_ = run_.is_last_step() ? SessionState::Terminating : SessionState::Active;
}

void SessionController::finalize() {
    if (state_ == SessionState::Closed) {
        return;
    }

    if (state_ != SessionState::Uninitialized && is_connected() && comm_.is_root()) {
        transport_.close(session_.peer().root_rank);
    }

    session_.release();
    state_ = SessionState::Closed;

    if (comm_.is_root() && session_.verbosity() > 0) {
        FSL_LOG_INFO("Coupling session closed after {} time step(s)", run_.nt_cur());
    }
}

// ============================================================================
// Sub-Iteration Stages
// ============================================================================

void SessionController::send_forces() {
    require_state(SessionState::SubIterating, "send_forces");

    if (session_.is_terminated()) {
        return;
    }

    Predictor::predict_forces(session_);

    if (session_.is_dry_run()) {
        return;
    }

    const int status = transport_.send_field(session_.peer().root_rank, message::fluid_forces,
                                             session_.force_predicted());
    if (transport_status::failed(status)) {
        handle_disconnect("force exchange");
    }
}

void SessionController::receive_displacement() {
    require_state(SessionState::SubIterating, "receive_displacement");

    if (session_.is_dry_run()) {
        Span<Real> displacement = session_.displacement_current();
        Span<Real> velocity = session_.velocity_current();
        std::fill(displacement.begin(), displacement.end(), 0.0);
        std::fill(velocity.begin(), velocity.end(), 0.0);
        return;
    }

    if (session_.is_terminated()) {
        return;
    }

    const int peer = session_.peer().root_rank;

    if (session_.verbosity() > 1 && comm_.is_root()) {
        FSL_LOG_DEBUG("Receiving {} and {}", message::mesh_displacement, message::mesh_velocity);
    }

    int status = transport_.receive_field(peer, message::mesh_displacement,
                                          displacement_staging_);
    if (!transport_status::failed(status)) {
        status = transport_.receive_field(peer, message::mesh_velocity, velocity_staging_);
    }

    if (transport_status::failed(status)) {
        handle_disconnect("displacement exchange");
        return;
    }

    FSL_ASSERT(displacement_staging_.size() == session_.displacement_current().size(),
               "staging buffers sized at initialize");
    std::copy(displacement_staging_.begin(), displacement_staging_.end(),
              session_.displacement_current().begin());
    std::copy(velocity_staging_.begin(), velocity_staging_.end(),
              session_.velocity_current().begin());
}

PredictionCoefficients SessionController::predict_displacement(Span<Real> parent_displacement) {
    require_state(SessionState::SubIterating, "predict_displacement");

    if (session_.is_terminated()) {
        return PredictionCoefficients{};
    }

    const PredictionCoefficients coef = Predictor::predict_displacement(session_);

    if (!parent_displacement.empty()) {
        session_.mapper()->scatter_vertices(session_.displacement_predicted(),
                                            parent_displacement);
    }
    return coef;
}

bool SessionController::exchange_convergence(CouplingHooks& hooks) {
    require_state(SessionState::SubIterating, "exchange_convergence");

    const bool local = evaluator_.evaluate(session_);
    const bool peer_converged = hooks.peer_convergence(session_, local);
    session_.set_global_convergence(peer_converged);

    Int shared[2] = {(local && peer_converged) ? 1 : 0, transport_status::Ok};

    if (comm_.is_root() && is_connected()) {
        shared[1] = transport_.send_scalar(session_.peer().root_rank, session_.iteration(),
                                           message::convergence, Int(local ? 1 : 0));
    }
    comm_.broadcast(shared, 2, 0);

    if (transport_status::failed(shared[1])) {
        handle_disconnect("convergence exchange");
    }

    return shared[0] != 0;
}

void SessionController::save_values() {
    if (!session_.is_implicit()) {
        session_.save_previous();
    }
}

// ============================================================================
// Output
// ============================================================================

bool SessionController::scatter_output(Span<Real> vertex_displacement,
                                       Span<Real> vertex_velocity,
                                       Span<Real> face_forces) const {
    const FieldMapper* mapper = session_.mapper();
    if (session_.visualization() <= 0 || mapper == nullptr) {
        return false;
    }

    mapper->scatter_vertices(session_.displacement_current(), vertex_displacement);
    mapper->scatter_vertices(session_.velocity_current(), vertex_velocity);
    mapper->scatter_faces(session_.force_current(), face_forces);
    return true;
}

} // namespace coupling
} // namespace fsl
