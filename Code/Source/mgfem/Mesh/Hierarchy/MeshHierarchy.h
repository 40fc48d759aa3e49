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

#ifndef MGFEM_MESH_HIERARCHY_H
#define MGFEM_MESH_HIERARCHY_H

#include "HierarchyOptions.h"
#include "../Core/MeshBase.h"
#include "../Geometry/AffineMap.h"

#include <memory>
#include <vector>

namespace mgfem {

class RefinementRule;

/**
 * @brief Parent of a fine cell in the next coarser hierarchy level
 *
 * child is the composite child index c_1 * N^(k-1) + ... + c_k for k
 * refinement steps per level with N children per step, c_1 being the child
 * slot of the first (coarsest) step.
 */
struct ParentRef {
  index_t cell = INVALID_INDEX;
  index_t child = INVALID_INDEX;
};

/**
 * @brief Sequence of uniformly refined meshes, coarsest first
 *
 * Level 0 is the base mesh. Level i+1 is obtained from level i by
 * refinements_per_level uniform refinement steps. For every level i > 0 a
 * flat parent map fine_cell -> (coarse_cell, composite child) is stored,
 * together with its inverse.
 *
 * Fine cells are numbered parent-major: within one refinement step the
 * children of coarse cell c get ids c * N + child. Edge midpoints are
 * deduplicated through the coarse edge they split, so cells sharing an
 * edge share its midpoint vertex.
 *
 * Instances are immutable and shared through std::shared_ptr<const ...>.
 */
class MeshHierarchy {
public:
  /**
   * @brief Build a hierarchy from a base mesh
   *
   * @param base Finalized base mesh (level 0)
   * @param num_refinements Number of levels above the base mesh
   * @param options Refinement and verification options
   * @return Hierarchy with num_refinements + 1 levels
   * @throws MeshConfigurationError for unsupported cell families or bad counts
   * @throws GeometricConsistencyError if a refinement step fails verification
   */
  static std::shared_ptr<const MeshHierarchy> build(std::shared_ptr<const MeshBase> base,
                                                    int num_refinements,
                                                    const HierarchyOptions& options = {});

  static std::shared_ptr<const MeshHierarchy> build(std::shared_ptr<const MeshBase> base,
                                                    int num_refinements,
                                                    int refinements_per_level);

  MeshHierarchy(const MeshHierarchy&) = delete;
  MeshHierarchy& operator=(const MeshHierarchy&) = delete;

  size_t num_levels() const noexcept { return meshes_.size(); }
  int refinements_per_level() const noexcept { return options_.refinements_per_level; }
  const HierarchyOptions& options() const noexcept { return options_; }
  CellFamily cell_family() const noexcept { return meshes_.front()->cell_family(); }

  const MeshBase& mesh(size_t level) const;
  std::shared_ptr<const MeshBase> mesh_ptr(size_t level) const;
  const std::vector<std::shared_ptr<const MeshBase>>& meshes() const noexcept { return meshes_; }

  /// Single-step refinement rule of the cell family
  const RefinementRule& rule() const noexcept { return *rule_; }

  /// Number of composite children per coarse cell between adjacent levels
  size_t num_children() const noexcept { return composite_maps_.size(); }

  /// Parent of fine cell `fine_cell` of level `level` (level >= 1)
  const ParentRef& parent(size_t level, index_t fine_cell) const;

  /// Parent map of level `level` (level >= 1), indexed by fine cell
  const std::vector<ParentRef>& parent_map(size_t level) const;

  /**
   * @brief Cells of level + 1 refining `coarse_cell` of level `level`
   * @return Fine cell ids ordered by composite child index
   */
  std::vector<index_t> children(size_t level, index_t coarse_cell) const;

  /// Composite child-to-parent map between level and level + 1
  const AffineMap& composite_child_map(size_t level, size_t child) const;

  const std::vector<AffineMap>& composite_child_maps() const noexcept { return composite_maps_; }

  /**
   * @brief Find the composite child containing a coarse reference point
   * @return Composite child index, or -1
   */
  int locate_child(const Point3& xi, Point3& xi_child, real_t tol = 1e-12) const;

  /**
   * @brief Check that `fine` refines `coarse` as `parents` claims
   *
   * Every vertex of fine cell f must lie within `tol` of the image of the
   * matching reference vertex under maps[parents[f].child] composed with the
   * map of parents[f].cell, and the children of each coarse cell must add up
   * to its measure.
   *
   * @throws GeometricConsistencyError on the first violation
   */
  static void verify_refinement(const MeshBase& coarse, const MeshBase& fine,
                                const std::vector<ParentRef>& parents,
                                const std::vector<AffineMap>& maps,
                                real_t tol);

private:
  struct StepResult {
    MeshBase mesh;
    std::vector<ParentRef> parents;
  };

  MeshHierarchy(const RefinementRule& rule, const HierarchyOptions& options);

  static StepResult refine_once(const MeshBase& coarse, const RefinementRule& rule);

  void check_level(size_t level, bool fine) const;

  const RefinementRule* rule_;
  HierarchyOptions options_;
  std::vector<std::shared_ptr<const MeshBase>> meshes_;
  std::vector<std::vector<ParentRef>> parents_;   // parents_[i] relates level i+1 to level i
  std::vector<std::vector<index_t>> children_;    // children_[i][coarse * N + child]
  std::vector<AffineMap> composite_maps_;
  std::vector<AffineMap> composite_inverse_maps_;
};

} // namespace mgfem

#endif // MGFEM_MESH_HIERARCHY_H
