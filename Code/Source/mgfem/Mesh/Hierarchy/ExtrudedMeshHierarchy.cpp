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

#include "ExtrudedMeshHierarchy.h"
#include "../Core/MeshExceptions.h"

#include <stdexcept>
#include <string>

namespace mgfem {

ExtrudedMeshHierarchy::ExtrudedMeshHierarchy(std::shared_ptr<const MeshHierarchy> base, int layers)
    : base_(std::move(base)), layers_(layers) {}

std::shared_ptr<const ExtrudedMeshHierarchy> ExtrudedMeshHierarchy::build(
    std::shared_ptr<const MeshHierarchy> base, int layers, real_t layer_height) {
  if (!base) {
    throw MeshConfigurationError("ExtrudedMeshHierarchy::build: base hierarchy is null");
  }
  if (layers < 1) {
    throw MeshConfigurationError("ExtrudedMeshHierarchy::build: number of layers must be at least 1");
  }

  std::shared_ptr<ExtrudedMeshHierarchy> h(new ExtrudedMeshHierarchy(base, layers));
  for (const auto& level_mesh : base->meshes()) {
    h->meshes_.push_back(std::make_shared<const ExtrudedMesh>(level_mesh, layers, layer_height));
  }
  for (const auto& m : base->composite_child_maps()) {
    h->maps_.push_back(m.extended());
  }
  return h;
}

const ExtrudedMesh& ExtrudedMeshHierarchy::mesh(size_t level) const {
  return *mesh_ptr(level);
}

std::shared_ptr<const ExtrudedMesh> ExtrudedMeshHierarchy::mesh_ptr(size_t level) const {
  if (level >= meshes_.size()) {
    throw std::out_of_range("ExtrudedMeshHierarchy: invalid level " + std::to_string(level));
  }
  return meshes_[level];
}

ParentRef ExtrudedMeshHierarchy::parent(size_t level, index_t fine_cell) const {
  const ExtrudedMesh& fine = mesh(level);
  const ParentRef& p = base_->parent(level, fine.base_cell(fine_cell));
  return {mesh(level - 1).cell_index(p.cell, fine.layer(fine_cell)), p.child};
}

std::vector<index_t> ExtrudedMeshHierarchy::children(size_t level, index_t coarse_cell) const {
  const ExtrudedMesh& coarse = mesh(level);
  const ExtrudedMesh& fine = mesh(level + 1);
  const int l = coarse.layer(coarse_cell);
  std::vector<index_t> kids = base_->children(level, coarse.base_cell(coarse_cell));
  for (auto& k : kids) k = fine.cell_index(k, l);
  return kids;
}

const AffineMap& ExtrudedMeshHierarchy::composite_child_map(size_t level, size_t child) const {
  if (level + 1 >= meshes_.size()) {
    throw std::out_of_range("ExtrudedMeshHierarchy: invalid level " + std::to_string(level));
  }
  return maps_.at(child);
}

int ExtrudedMeshHierarchy::locate_child(const Point3& xi, Point3& xi_child, real_t tol) const {
  const int vdim = base_->mesh(0).tdim();
  if (xi[vdim] < -1.0 - tol || xi[vdim] > 1.0 + tol) return -1;
  const int c = base_->locate_child(xi, xi_child, tol);
  if (c >= 0) xi_child[vdim] = xi[vdim];
  return c;
}

} // namespace mgfem
