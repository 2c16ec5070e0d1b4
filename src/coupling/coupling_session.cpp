/**
 * @file coupling_session.cpp
 * @brief Coupling session implementation
 */

#include <fsilink/coupling/coupling_session.hpp>

#include <algorithm>
#include <utility>

namespace fsl {
namespace coupling {

CouplingSession::CouplingSession(const CouplingParameters& params, PeerInfo peer)
    : params_(params)
    , peer_(std::move(peer))
    , dt_current_(params.dt_reference)
    , dt_previous_(params.dt_reference)
{
}

void CouplingSession::register_geometry(const FieldMapper& mapper, Real lref,
                                        Communicator& comm) {
    if (released_) {
        throw ConfigurationError("Coupling session already released");
    }
    if (mapper_ != nullptr) {
        throw ConfigurationError("Coupling geometry already registered");
    }
    if (lref <= 0.0) {
        throw ConfigurationError("Coupling reference length must be positive, got " +
                                 std::to_string(lref));
    }

    n_faces_ = mapper.n_faces();
    n_vertices_ = mapper.n_vertices();

    const Int64 local_counts[2] = {static_cast<Int64>(n_faces_),
                                   static_cast<Int64>(mapper.n_owned_vertices())};
    Int64 global_counts[2] = {0, 0};
    comm.allreduce_sum(local_counts, global_counts, 2);

    n_g_faces_ = global_counts[0];
    n_g_vertices_ = global_counts[1];

    const Index nv = vec3_stride * n_vertices_;
    const Index nf = vec3_stride * n_faces_;

    displacement_current_.assign(nv, 0.0);
    displacement_predicted_.assign(nv, 0.0);
    velocity_current_.assign(nv, 0.0);
    velocity_previous_.assign(nv, 0.0);
    force_current_.assign(nf, 0.0);
    force_previous_.assign(nf, 0.0);
    force_predicted_.assign(nf, 0.0);

    reference_length_ = lref;
    mapper_ = &mapper;

    if (comm.is_root() && params_.verbosity > 0) {
        FSL_LOG_INFO("Coupling interface: {} faces, {} vertices (global), lref = {:.4e}",
                     n_g_faces_, n_g_vertices_, reference_length_);
    }
}

void CouplingSession::release() {
    if (released_) {
        return;
    }

    for (auto* buffer : {&displacement_current_, &displacement_predicted_,
                         &velocity_current_, &velocity_previous_,
                         &force_current_, &force_previous_, &force_predicted_}) {
        std::vector<Real>().swap(*buffer);
    }

    mapper_ = nullptr;
    released_ = true;
}

void CouplingSession::save_previous() {
    std::copy(force_current_.begin(), force_current_.end(), force_previous_.begin());
    std::copy(velocity_current_.begin(), velocity_current_.end(), velocity_previous_.begin());
}

} // namespace coupling
} // namespace fsl
