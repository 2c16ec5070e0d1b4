/**
 * @file field_mapper.cpp
 * @brief Surface field mapper and scatter implementation
 */

#include <fsilink/coupling/field_mapper.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace fsl {
namespace coupling {

void scatter_values_r3(ConstSpan<Index> elt_ids,
                       ConstSpan<Real> in,
                       Span<Real> out) {
    const Index n_elts = in.size() / vec3_stride;

    if (elt_ids.empty()) {
        FSL_REQUIRE(out.size() >= in.size(), "parent array too small for scatter");
        std::copy(in.begin(), in.end(), out.begin());
        return;
    }

    FSL_REQUIRE(elt_ids.size() == n_elts, "id list and value count differ");

    for (Index i = 0; i < n_elts; ++i) {
        const Index j = elt_ids[i];
        FSL_CHECK_RANGE(vec3_stride * j + 2, out.size());

        out[3*j + 0] = in[3*i + 0];
        out[3*j + 1] = in[3*i + 1];
        out[3*j + 2] = in[3*i + 2];
    }
}

SurfaceFieldMapper::SurfaceFieldMapper(std::vector<Index> face_ids,
                                       ConstSpan<Index> face_vertex_index,
                                       ConstSpan<Index> face_vertex_ids,
                                       std::vector<bool> vertex_owned)
    : face_ids_(std::move(face_ids))
{
    FSL_REQUIRE(!face_vertex_index.empty(), "face -> vertex index must have n_b_faces + 1 entries");

    const Index n_b_faces = face_vertex_index.size() - 1;

    for (Index f : face_ids_) {
        if (f >= n_b_faces) {
            throw InvalidArgumentError("Coupled face id " + std::to_string(f) +
                                       " out of range [0, " + std::to_string(n_b_faces) + ")");
        }
        const Index start = face_vertex_index[f];
        const Index end = face_vertex_index[f + 1];
        FSL_REQUIRE(start <= end && end <= face_vertex_ids.size(),
                    "inconsistent face -> vertex connectivity");

        for (Index k = start; k < end; ++k) {
            vertex_ids_.push_back(face_vertex_ids[k]);
        }
    }

    std::sort(vertex_ids_.begin(), vertex_ids_.end());
    vertex_ids_.erase(std::unique(vertex_ids_.begin(), vertex_ids_.end()),
                      vertex_ids_.end());

    if (vertex_owned.empty()) {
        n_owned_vertices_ = vertex_ids_.size();
    } else {
        for (Index v : vertex_ids_) {
            FSL_CHECK_RANGE(v, vertex_owned.size());
            if (vertex_owned[v]) {
                ++n_owned_vertices_;
            }
        }
    }

    FSL_LOG_DEBUG("Surface mapper: {} faces, {} vertices ({} owned)",
                  face_ids_.size(), vertex_ids_.size(), n_owned_vertices_);
}

} // namespace coupling
} // namespace fsl
