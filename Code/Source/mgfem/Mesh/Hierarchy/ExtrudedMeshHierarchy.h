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

#ifndef MGFEM_EXTRUDED_MESH_HIERARCHY_H
#define MGFEM_EXTRUDED_MESH_HIERARCHY_H

#include "ExtrudedMesh.h"
#include "MeshHierarchy.h"

#include <memory>
#include <vector>

namespace mgfem {

/**
 * @brief Mesh hierarchy whose levels are extrusions of a base hierarchy
 *
 * Every level carries the same number of layers and the same layer height.
 * The parent of extruded cell (b, l) is (parent(b), l); the composite child
 * index is the base one, and the child-to-parent map acts on the base
 * reference coordinates and leaves the vertical coordinate unchanged.
 */
class ExtrudedMeshHierarchy {
public:
  /**
   * @param base Base (horizontal) hierarchy
   * @param layers Number of layers at every level
   * @param layer_height Height of one layer; non-positive selects 1 / layers
   * @throws MeshConfigurationError on invalid input
   */
  static std::shared_ptr<const ExtrudedMeshHierarchy> build(std::shared_ptr<const MeshHierarchy> base,
                                                            int layers,
                                                            real_t layer_height = 0.0);

  ExtrudedMeshHierarchy(const ExtrudedMeshHierarchy&) = delete;
  ExtrudedMeshHierarchy& operator=(const ExtrudedMeshHierarchy&) = delete;

  size_t num_levels() const noexcept { return meshes_.size(); }
  int layers() const noexcept { return layers_; }
  real_t layer_height() const noexcept { return meshes_.front()->layer_height(); }

  const MeshHierarchy& base_hierarchy() const noexcept { return *base_; }
  const std::shared_ptr<const MeshHierarchy>& base_hierarchy_ptr() const noexcept { return base_; }

  const ExtrudedMesh& mesh(size_t level) const;
  std::shared_ptr<const ExtrudedMesh> mesh_ptr(size_t level) const;

  size_t num_children() const noexcept { return base_->num_children(); }

  /// Parent of extruded cell `fine_cell` of level `level` (level >= 1)
  ParentRef parent(size_t level, index_t fine_cell) const;

  /// Cells of level + 1 refining `coarse_cell`, ordered by composite child index
  std::vector<index_t> children(size_t level, index_t coarse_cell) const;

  /// Composite child map extended by the identity on the vertical coordinate
  const AffineMap& composite_child_map(size_t level, size_t child) const;

  int locate_child(const Point3& xi, Point3& xi_child, real_t tol = 1e-12) const;

private:
  ExtrudedMeshHierarchy(std::shared_ptr<const MeshHierarchy> base, int layers);

  std::shared_ptr<const MeshHierarchy> base_;
  int layers_;
  std::vector<std::shared_ptr<const ExtrudedMesh>> meshes_;
  std::vector<AffineMap> maps_;
};

} // namespace mgfem

#endif // MGFEM_EXTRUDED_MESH_HIERARCHY_H
