#pragma once

/**
 * @file field_mapper.hpp
 * @brief Mapping between the parent CFD mesh and the coupling interface
 *
 * The coupling interface stores values compactly, one 3-vector per coupled
 * face or vertex, in the order of the mapper's id lists. The mapper gives
 * the parent-mesh ids of that ordering and scatters compact values back
 * into parent-indexed arrays through borrowed views.
 */

#include <fsilink/core/core.hpp>

#include <vector>

namespace fsl {
namespace coupling {

// ============================================================================
// Scatter
// ============================================================================

/**
 * @brief Scatter interlaced 3-vectors onto parent locations
 *
 * out[3*elt_ids[i] + k] = in[3*i + k]. With an empty id list the values
 * are copied in order. The parent array must be large enough for every id.
 */
void scatter_values_r3(ConstSpan<Index> elt_ids,
                       ConstSpan<Real> in,
                       Span<Real> out);

// ============================================================================
// Field Mapper Interface
// ============================================================================

class FieldMapper {
public:
    virtual ~FieldMapper() = default;

    virtual Index n_faces() const = 0;
    virtual Index n_vertices() const = 0;

    /// Vertices whose ownership is attributed to this partition
    virtual Index n_owned_vertices() const = 0;

    /// Parent boundary-face ids of the interface ordering
    virtual ConstSpan<Index> face_ids() const = 0;

    /// Parent vertex ids of the interface ordering
    virtual ConstSpan<Index> vertex_ids() const = 0;

    void scatter_faces(ConstSpan<Real> values, Span<Real> parent_values) const {
        scatter_values_r3(face_ids(), values, parent_values);
    }

    void scatter_vertices(ConstSpan<Real> values, Span<Real> parent_values) const {
        scatter_values_r3(vertex_ids(), values, parent_values);
    }
};

// ============================================================================
// Surface Field Mapper
// ============================================================================

/**
 * @brief Interface built from a selection of parent boundary faces
 *
 * The vertex list is the sorted set of vertices of the selected faces.
 * Vertices on partition boundaries appear on several ranks; an optional
 * ownership mask (indexed by parent vertex id) selects the ones counted
 * by this rank in the global vertex count.
 */
class SurfaceFieldMapper : public FieldMapper {
public:
    /**
     * @param face_ids Coupled boundary faces
     * @param face_vertex_index CSR index of boundary face -> vertices (n_b_faces + 1)
     * @param face_vertex_ids Parent vertex ids referenced by the CSR index
     * @param vertex_owned Ownership flags per parent vertex, empty if all owned
     */
    SurfaceFieldMapper(std::vector<Index> face_ids,
                       ConstSpan<Index> face_vertex_index,
                       ConstSpan<Index> face_vertex_ids,
                       std::vector<bool> vertex_owned = {});

    Index n_faces() const override { return face_ids_.size(); }
    Index n_vertices() const override { return vertex_ids_.size(); }
    Index n_owned_vertices() const override { return n_owned_vertices_; }

    ConstSpan<Index> face_ids() const override { return face_ids_; }
    ConstSpan<Index> vertex_ids() const override { return vertex_ids_; }

private:
    std::vector<Index> face_ids_;
    std::vector<Index> vertex_ids_;
    Index n_owned_vertices_ = 0;
};

} // namespace coupling
} // namespace fsl
