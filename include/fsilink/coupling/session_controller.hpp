#pragma once

/**
 * @file session_controller.hpp
 * @brief Time-step and sub-iteration sequencing of a coupled run
 *
 * State machine:
 *
 *   Uninitialized --initialize--> Active
 *   Active --begin_time_step--> NegotiatingDt --> SubIterating
 *   SubIterating --(converged | cap reached | disconnect)--> StepDone
 *   StepDone --end_time_step--> Active | Terminating
 *   any --finalize--> Closed
 *
 * One sub-iteration:
 *   1. the fluid solver provides interface forces, which are extrapolated
 *      and sent to the structure ("fluid_forces");
 *   2. displacements and velocities are received ("mesh_displacement",
 *      "mesh_velocity");
 *   3. the mesh displacement is predicted and handed to the fluid solver;
 *   4. the convergence flag is computed and exchanged ("ICVAST");
 *   5. previous values are saved (explicit coupling only).
 *
 * Transport failures never reach the caller as exceptions: the session is
 * marked terminated, the run is scheduled to stop after the next step and
 * no further message is exchanged with the peer.
 */

#include <fsilink/core/core.hpp>
#include <fsilink/coupling/convergence.hpp>
#include <fsilink/coupling/coupling_session.hpp>
#include <fsilink/coupling/predictor.hpp>
#include <fsilink/coupling/run_control.hpp>
#include <fsilink/coupling/timestep_negotiator.hpp>
#include <fsilink/coupling/transport.hpp>

#include <vector>

namespace fsl {
namespace coupling {

enum class SessionState {
    Uninitialized,
    Active,
    NegotiatingDt,
    SubIterating,
    StepDone,
    Terminating,
    Closed
};

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Active: return "Active";
        case SessionState::NegotiatingDt: return "NegotiatingDt";
        case SessionState::SubIterating: return "SubIterating";
        case SessionState::StepDone: return "StepDone";
        case SessionState::Terminating: return "Terminating";
        case SessionState::Closed: return "Closed";
        default: return "Unknown";
    }
}

// ============================================================================
// Fluid Solver Hooks
// ============================================================================

/**
 * @brief Callbacks into the fluid solver during a coupled time step
 */
class CouplingHooks {
public:
    virtual ~CouplingHooks() = default;

    /// Write the current interface forces (3 per coupled face)
    virtual void compute_fluid_forces(const CouplingSession& session, Span<Real> forces) = 0;

    /// Impose the predicted interface displacement (3 per coupled vertex)
    virtual void apply_mesh_displacement(const CouplingSession& session,
                                         ConstSpan<Real> displacement) = 0;

    /**
     * @brief Convergence state on the structure side
     *
     * Defaults to the fluid-side flag, i.e. the fluid decides alone.
     */
    virtual bool peer_convergence(const CouplingSession& /*session*/, bool local_converged) {
        return local_converged;
    }
};

// ============================================================================
// Session Controller
// ============================================================================

class SessionController {
public:
    SessionController(CouplingSession& session, RunControl& run,
                      TransportChannel& transport, Communicator& comm);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    SessionState state() const { return state_; }

    /// Peer found and not disconnected
    bool is_connected() const {
        return !session_.is_dry_run() && !session_.is_terminated();
    }

    // ========================================================================
    // Run Sequence
    // ========================================================================

    /**
     * @brief Send the run parameters to the peer
     *
     * Requires registered geometry. No peer I/O in dry-run mode.
     */
    void initialize();

    /// Advance run control and negotiate the step; returns the step to use
    Real begin_time_step(Real dt_local);

    /**
     * @brief Run a complete coupled time step
     *
     * Negotiates the step, then sub-iterates until convergence, the
     * sub-iteration cap or a disconnect.
     *
     * @return Time step used
     */
    Real run_time_step(Real dt_local, CouplingHooks& hooks);

    /// Complete the step in run control; Terminating after the last step
    void end_time_step();

    /// Close the channel, release the session; safe to call repeatedly
    void finalize();

    // ========================================================================
    // Sub-Iteration Stages
    // ========================================================================

    /// Predict forces from force_current and send them
    void send_forces();

    /// Receive displacement and velocity (zeros in dry-run mode)
    void receive_displacement();

    /// Predict the interface displacement; optionally scatter it to a parent array
    PredictionCoefficients predict_displacement(Span<Real> parent_displacement = {});

    /**
     * @brief Evaluate and exchange convergence
     *
     * @return Agreed decision (local AND peer), identical on all ranks
     */
    bool exchange_convergence(CouplingHooks& hooks);

    /// Save previous values (explicit coupling only)
    void save_values();

    // ========================================================================
    // Output
    // ========================================================================

    /**
     * @brief Scatter interface values onto parent-mesh arrays for output
     *
     * Writes the current displacement and velocity per parent vertex and
     * the current forces per parent boundary face.
     *
     * @return false if visualization is disabled (arrays untouched)
     */
    bool scatter_output(Span<Real> vertex_displacement,
                        Span<Real> vertex_velocity,
                        Span<Real> face_forces) const;

    Real last_residual() const { return evaluator_.last_residual(); }

private:
    void require_state(SessionState expected, const char* operation) const;

    /// Common reaction to a failed exchange; every local rank must call it
    void handle_disconnect(const char* what);

    /// Broadcast a root-side status; true if the peer exchange failed
    bool failed_on_root(int status);

    bool sub_iteration_done(bool converged) const;

    CouplingSession& session_;
    RunControl& run_;
    TransportChannel& transport_;
    Communicator& comm_;

    TimeStepNegotiator negotiator_;
    ConvergenceEvaluator evaluator_;

    SessionState state_ = SessionState::Uninitialized;
    Real step_dt_ = 0.0;

    std::vector<Real> displacement_staging_;
    std::vector<Real> velocity_staging_;
};

} // namespace coupling
} // namespace fsl
