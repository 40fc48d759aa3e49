/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef MGFEM_MESH_BASE_H
#define MGFEM_MESH_BASE_H

#include "MeshTypes.h"

#include <unordered_map>
#include <utility>
#include <vector>

namespace mgfem {

/**
 * @brief Immutable single-family mesh container
 *
 * Stores:
 * - reference coordinates (flat, spatial_dim components per vertex)
 * - fixed-size cell-to-vertex connectivity for one CellFamily
 * - a deduplicated edge list derived in finalize()
 *
 * The mesh is filled once through build_from_arrays() and finalize(); after
 * that only const access is offered. Meshes are shared read-only between
 * hierarchies and spaces.
 */
class MeshBase {
public:
  // ---- Lifecycle ----
  MeshBase();
  explicit MeshBase(int spatial_dim);

  MeshBase(const MeshBase&) = delete;
  MeshBase& operator=(const MeshBase&) = delete;
  MeshBase(MeshBase&&) = default;
  MeshBase& operator=(MeshBase&&) = default;

  /**
   * @brief Fill the mesh from flat arrays
   *
   * @param spatial_dim Number of coordinate components per vertex (1..3)
   * @param family Cell family shared by all cells
   * @param X_ref Vertex coordinates, spatial_dim per vertex
   * @param cell2vertex Connectivity, cell_num_vertices(family) per cell
   * @throws MeshConfigurationError on inconsistent input
   */
  void build_from_arrays(int spatial_dim,
                         CellFamily family,
                         const std::vector<real_t>& X_ref,
                         const std::vector<index_t>& cell2vertex);

  /// Derive edges; required before the mesh is used
  void finalize();

  // ---- Basic queries ----
  int dim() const noexcept { return spatial_dim_; }
  int tdim() const noexcept { return cell_dimension(family_); }
  CellFamily cell_family() const noexcept { return family_; }
  int n_vertices_per_cell() const noexcept { return cell_num_vertices(family_); }
  bool is_finalized() const noexcept { return finalized_; }

  size_t n_vertices() const noexcept {
    return X_ref_.size() / static_cast<size_t>(spatial_dim_ > 0 ? spatial_dim_ : 1);
  }
  size_t n_cells() const noexcept {
    return cell2vertex_.size() / static_cast<size_t>(n_vertices_per_cell());
  }
  size_t n_edges() const noexcept { return edge2vertex_.size(); }

  // ---- Coordinates ----
  const std::vector<real_t>& X_ref() const noexcept { return X_ref_; }
  std::array<real_t,3> get_vertex_coords(index_t v) const;
  std::vector<std::array<real_t,3>> cell_vertex_coords(index_t c) const;
  BoundingBox bounding_box() const;

  // ---- Topology ----
  const std::vector<index_t>& cell2vertex() const noexcept { return cell2vertex_; }
  std::pair<const index_t*, size_t> cell_vertices_span(index_t c) const;
  std::vector<index_t> cell_vertices(index_t c) const;

  const std::vector<std::array<index_t,2>>& edge2vertex() const noexcept { return edge2vertex_; }
  const std::array<index_t,2>& edge_vertices(index_t e) const { return edge2vertex_.at(static_cast<size_t>(e)); }

  /// Edge id joining two vertices, or INVALID_INDEX
  index_t find_edge(index_t a, index_t b) const;

  // ---- Geometry ----
  /// Map reference coordinates of cell c to physical coordinates
  std::array<real_t,3> map_to_physical(index_t c, const std::array<real_t,3>& xi) const;

  /// Length / area / volume of cell c (unsigned)
  real_t cell_measure(index_t c) const;

private:
  static gid_t edge_key(index_t a, index_t b) noexcept;

  int spatial_dim_ = 0;
  CellFamily family_ = CellFamily::Point;
  bool finalized_ = false;

  std::vector<real_t> X_ref_;
  std::vector<index_t> cell2vertex_;

  std::vector<std::array<index_t,2>> edge2vertex_;
  std::unordered_map<gid_t, index_t> edge_lookup_;
};

} // namespace mgfem

#endif // MGFEM_MESH_BASE_H
