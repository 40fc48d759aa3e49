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

#ifndef MGFEM_EXTRUDED_MESH_H
#define MGFEM_EXTRUDED_MESH_H

#include "../Core/MeshBase.h"

#include <memory>
#include <vector>

namespace mgfem {

/**
 * @brief Base mesh stacked into uniform vertical layers
 *
 * Numbering:
 * - cell (base_cell, layer)      -> base_cell * layers + layer
 * - vertex (base_vertex, level)  -> base_vertex * (layers + 1) + level
 *
 * Reference coordinates of an extruded cell are the base reference
 * coordinates followed by one vertical coordinate in [-1, 1]. The vertical
 * physical coordinate is stored in component base().dim(), with layer l
 * spanning [l * h, (l + 1) * h].
 */
class ExtrudedMesh {
public:
  /**
   * @param base Finalized base mesh of dimension 1 or 2
   * @param layers Number of layers (>= 1)
   * @param layer_height Height of one layer; non-positive selects 1 / layers
   * @throws MeshConfigurationError on invalid input
   */
  ExtrudedMesh(std::shared_ptr<const MeshBase> base, int layers, real_t layer_height = 0.0);

  const MeshBase& base() const noexcept { return *base_; }
  const std::shared_ptr<const MeshBase>& base_ptr() const noexcept { return base_; }

  int layers() const noexcept { return layers_; }
  real_t layer_height() const noexcept { return layer_height_; }

  int dim() const noexcept { return base_->dim() + 1; }
  int tdim() const noexcept { return base_->tdim() + 1; }

  size_t n_cells() const noexcept { return base_->n_cells() * static_cast<size_t>(layers_); }
  size_t n_vertices() const noexcept { return base_->n_vertices() * static_cast<size_t>(layers_ + 1); }

  index_t cell_index(index_t base_cell, int layer) const noexcept { return base_cell * layers_ + layer; }
  index_t base_cell(index_t cell) const noexcept { return cell / layers_; }
  int layer(index_t cell) const noexcept { return static_cast<int>(cell % layers_); }

  index_t vertex_index(index_t base_vertex, int level) const noexcept {
    return base_vertex * (layers_ + 1) + level;
  }

  /// Bottom ring (base vertex order) followed by the top ring
  std::vector<index_t> cell_vertices(index_t cell) const;

  std::array<real_t,3> get_vertex_coords(index_t v) const;

  /// Cells directly below and above, INVALID_INDEX at the ends of the column
  std::array<index_t,2> vertical_neighbors(index_t cell) const;

  std::array<real_t,3> map_to_physical(index_t cell, const std::array<real_t,3>& xi) const;

  real_t cell_measure(index_t cell) const;

private:
  void check_cell(index_t cell) const;

  std::shared_ptr<const MeshBase> base_;
  int layers_;
  real_t layer_height_;
};

} // namespace mgfem

#endif // MGFEM_EXTRUDED_MESH_H
