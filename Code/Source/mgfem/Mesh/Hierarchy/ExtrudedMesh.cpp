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

#include "ExtrudedMesh.h"
#include "../Core/MeshExceptions.h"

#include <stdexcept>
#include <string>

namespace mgfem {

ExtrudedMesh::ExtrudedMesh(std::shared_ptr<const MeshBase> base, int layers, real_t layer_height)
    : base_(std::move(base)), layers_(layers), layer_height_(layer_height) {
  if (!base_) {
    throw MeshConfigurationError("ExtrudedMesh: base mesh is null");
  }
  if (layers_ < 1) {
    throw MeshConfigurationError("ExtrudedMesh: number of layers must be at least 1");
  }
  if (base_->dim() > 2 || base_->tdim() > 2) {
    throw MeshConfigurationError(std::string("ExtrudedMesh: cannot extrude ") +
                                 cell_family_name(base_->cell_family()) + " mesh of dimension " +
                                 std::to_string(base_->dim()));
  }
  if (layer_height_ <= 0.0) {
    layer_height_ = 1.0 / static_cast<real_t>(layers_);
  }
}

void ExtrudedMesh::check_cell(index_t cell) const {
  if (cell < 0 || static_cast<size_t>(cell) >= n_cells()) {
    throw std::out_of_range("ExtrudedMesh: invalid cell index " + std::to_string(cell));
  }
}

std::vector<index_t> ExtrudedMesh::cell_vertices(index_t cell) const {
  check_cell(cell);
  const index_t bc = base_cell(cell);
  const int l = layer(cell);
  auto [verts, nv] = base_->cell_vertices_span(bc);

  std::vector<index_t> out;
  out.reserve(2 * nv);
  for (size_t i = 0; i < nv; ++i) out.push_back(vertex_index(verts[i], l));
  for (size_t i = 0; i < nv; ++i) out.push_back(vertex_index(verts[i], l + 1));
  return out;
}

std::array<real_t,3> ExtrudedMesh::get_vertex_coords(index_t v) const {
  if (v < 0 || static_cast<size_t>(v) >= n_vertices()) {
    throw std::out_of_range("ExtrudedMesh: invalid vertex index " + std::to_string(v));
  }
  auto x = base_->get_vertex_coords(v / (layers_ + 1));
  x[base_->dim()] = static_cast<real_t>(v % (layers_ + 1)) * layer_height_;
  return x;
}

std::array<index_t,2> ExtrudedMesh::vertical_neighbors(index_t cell) const {
  check_cell(cell);
  const int l = layer(cell);
  return {l > 0 ? cell - 1 : INVALID_INDEX,
          l + 1 < layers_ ? cell + 1 : INVALID_INDEX};
}

std::array<real_t,3> ExtrudedMesh::map_to_physical(index_t cell, const std::array<real_t,3>& xi) const {
  check_cell(cell);
  const int vdim = base_->tdim();
  auto x = base_->map_to_physical(base_cell(cell), xi);
  x[base_->dim()] = (static_cast<real_t>(layer(cell)) + 0.5 * (xi[vdim] + 1.0)) * layer_height_;
  return x;
}

real_t ExtrudedMesh::cell_measure(index_t cell) const {
  check_cell(cell);
  return base_->cell_measure(base_cell(cell)) * layer_height_;
}

} // namespace mgfem
