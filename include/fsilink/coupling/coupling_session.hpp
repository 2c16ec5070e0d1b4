#pragma once

/**
 * @file coupling_session.hpp
 * @brief State of one fluid-structure coupling run
 *
 * The session owns the interface history buffers, the iteration counters,
 * the time-step record and the convergence flags. It is created by the
 * driver, passed by reference to the negotiator, predictor, convergence
 * evaluator and controller, and mutated only through the controller.
 *
 * Buffer layout: interlaced 3-vectors in the mapper's interface ordering,
 * i.e. 3 * n_vertices reals for displacements and velocities and
 * 3 * n_faces reals for forces.
 */

#include <fsilink/core/core.hpp>
#include <fsilink/coupling/coupling_config.hpp>
#include <fsilink/coupling/field_mapper.hpp>
#include <fsilink/coupling/peer_discovery.hpp>

#include <vector>

namespace fsl {
namespace coupling {

class CouplingSession {
public:
    CouplingSession(const CouplingParameters& params, PeerInfo peer);

    CouplingSession(const CouplingSession&) = delete;
    CouplingSession& operator=(const CouplingSession&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Attach the coupling interface
     *
     * Allocates zeroed history buffers, reduces the global face and vertex
     * counts over the local group and records the reference length. The
     * mapper is borrowed until release(). Collective over comm.
     *
     * @throws ConfigurationError if lref <= 0 or geometry is already registered
     */
    void register_geometry(const FieldMapper& mapper, Real lref, Communicator& comm);

    /// Free buffers and drop the mapper; safe to call repeatedly
    void release();

    bool is_registered() const { return mapper_ != nullptr; }
    bool is_released() const { return released_; }

    // ========================================================================
    // Peer and Parameters
    // ========================================================================

    const PeerInfo& peer() const { return peer_; }
    bool is_dry_run() const { return !peer_.found(); }

    const CouplingParameters& parameters() const { return params_; }

    CouplingScheme scheme() const { return params_.scheme(); }
    bool is_implicit() const { return scheme() == CouplingScheme::Implicit; }

    Int max_sub_iterations() const { return params_.max_sub_iterations; }
    Real tolerance() const { return params_.tolerance; }
    Real dt_reference() const { return params_.dt_reference; }
    Real reference_length() const { return reference_length_; }
    Int verbosity() const { return params_.verbosity; }
    Int visualization() const { return params_.visualization; }

    const FieldMapper* mapper() const { return mapper_; }

    // ========================================================================
    // Interface Sizes
    // ========================================================================

    Index n_faces() const { return n_faces_; }
    Index n_vertices() const { return n_vertices_; }
    Int64 n_g_faces() const { return n_g_faces_; }
    Int64 n_g_vertices() const { return n_g_vertices_; }

    // ========================================================================
    // History Buffers
    // ========================================================================

    Span<Real> displacement_current() { return displacement_current_; }
    Span<Real> displacement_predicted() { return displacement_predicted_; }
    Span<Real> velocity_current() { return velocity_current_; }
    Span<Real> velocity_previous() { return velocity_previous_; }
    Span<Real> force_current() { return force_current_; }
    Span<Real> force_previous() { return force_previous_; }
    Span<Real> force_predicted() { return force_predicted_; }

    ConstSpan<Real> displacement_current() const { return displacement_current_; }
    ConstSpan<Real> displacement_predicted() const { return displacement_predicted_; }
    ConstSpan<Real> velocity_current() const { return velocity_current_; }
    ConstSpan<Real> velocity_previous() const { return velocity_previous_; }
    ConstSpan<Real> force_current() const { return force_current_; }
    ConstSpan<Real> force_previous() const { return force_previous_; }
    ConstSpan<Real> force_predicted() const { return force_predicted_; }

    /// Copy current forces and velocities into the previous-value buffers
    void save_previous();

    // ========================================================================
    // Iteration State
    // ========================================================================

    /// 0 before the first step, > 0 active step, < 0 terminated
    Int iteration() const { return iteration_; }
    bool is_terminated() const { return iteration_ < 0; }

    void set_iteration(Int iteration) { iteration_ = iteration; }
    void terminate() { iteration_ = -1; }

    Int sub_iteration_id() const { return sub_iteration_id_; }
    void reset_sub_iterations() { sub_iteration_id_ = 0; }
    void increment_sub_iteration() { ++sub_iteration_id_; }

    // ========================================================================
    // Time Step
    // ========================================================================

    Real dt_current() const { return dt_current_; }
    Real dt_previous() const { return dt_previous_; }

    /// Record a negotiated step; the former current step becomes the previous one
    void set_dt(Real dt) {
        dt_previous_ = dt_current_;
        dt_current_ = dt;
    }

    // ========================================================================
    // Convergence
    // ========================================================================

    bool local_convergence() const { return local_convergence_; }
    bool global_convergence() const { return global_convergence_; }

    void set_local_convergence(bool converged) { local_convergence_ = converged; }
    void set_global_convergence(bool converged) { global_convergence_ = converged; }

private:
    CouplingParameters params_;
    PeerInfo peer_;

    const FieldMapper* mapper_ = nullptr;
    bool released_ = false;

    Index n_faces_ = 0;
    Index n_vertices_ = 0;
    Int64 n_g_faces_ = 0;
    Int64 n_g_vertices_ = 0;

    Real reference_length_ = 0.0;

    std::vector<Real> displacement_current_;
    std::vector<Real> displacement_predicted_;
    std::vector<Real> velocity_current_;
    std::vector<Real> velocity_previous_;
    std::vector<Real> force_current_;
    std::vector<Real> force_previous_;
    std::vector<Real> force_predicted_;

    Int iteration_ = 0;
    Int sub_iteration_id_ = 0;

    Real dt_current_ = 0.0;
    Real dt_previous_ = 0.0;

    bool local_convergence_ = false;
    bool global_convergence_ = false;
};

} // namespace coupling
} // namespace fsl
