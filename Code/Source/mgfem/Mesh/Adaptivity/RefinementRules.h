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

#ifndef MGFEM_REFINEMENT_RULES_H
#define MGFEM_REFINEMENT_RULES_H

#include "../Core/MeshTypes.h"
#include "../Geometry/AffineMap.h"
#include <array>
#include <memory>
#include <vector>

namespace mgfem {

/**
 * @brief Information about a refined element
 *
 * Local vertex numbering of the refined patch: parent vertices first
 * (0..n_parent-1), then new vertices in the order of new_vertices.
 */
struct RefinedElement {
  /** Child element connectivity (local patch vertex indices) */
  std::vector<std::vector<index_t>> child_connectivity;

  /** New vertex positions (physical) */
  std::vector<std::array<real_t, 3>> new_vertices;

  /**
   * Parent local vertices each new vertex is the average of. Two entries
   * identify an edge midpoint shared with neighbouring cells; more entries
   * identify a cell-interior vertex.
   */
  std::vector<std::vector<index_t>> new_vertex_support;
};

/**
 * @brief Uniform refinement rule for one reference cell family
 *
 * A rule is pure data: the child connectivity in patch-local vertex
 * numbering, the supports of the new vertices, and for every child the
 * affine map child_to_parent from the child's reference coordinates to the
 * parent's reference coordinates. All of it is computed once when the rule
 * is constructed.
 */
class RefinementRule {
public:
  virtual ~RefinementRule() = default;

  CellFamily family() const noexcept { return family_; }

  /// Number of children produced by one refinement step
  size_t num_children() const noexcept { return children_.size(); }

  /// Child connectivity in patch-local numbering
  const std::vector<std::vector<index_t>>& child_connectivity() const noexcept { return children_; }

  const std::vector<std::vector<index_t>>& new_vertex_support() const noexcept { return support_; }

  /// Parent-reference coordinates of every patch-local vertex
  const std::vector<Point3>& reference_points() const noexcept { return ref_points_; }

  /// Affine map from child reference coordinates to parent reference coordinates
  const AffineMap& child_to_parent(size_t child) const { return maps_.at(child); }

  const std::vector<AffineMap>& child_maps() const noexcept { return maps_; }

  /**
   * @brief Refine an element
   *
   * @param vertices Element vertex coordinates (physical)
   * @return Refined element information
   */
  virtual RefinedElement refine(const std::vector<std::array<real_t, 3>>& vertices) const;

  /**
   * @brief Find the child whose image contains a parent reference point
   *
   * @param xi Parent reference coordinates
   * @param xi_child Output child reference coordinates
   * @param tol Containment tolerance
   * @return Child index, or -1 if no child contains the point
   */
  int locate_child(const Point3& xi, Point3& xi_child, real_t tol = 1e-12) const;

  /**
   * @brief Check that the children tile the parent reference cell
   *
   * Every child image must lie inside the parent, preserve orientation, and
   * the child measures must sum to the parent measure.
   */
  bool verify_tiling(real_t tol = 1e-12) const;

protected:
  RefinementRule(CellFamily family,
                 std::vector<std::vector<index_t>> children,
                 std::vector<std::vector<index_t>> support);

private:
  static AffineMap map_from_vertices(CellFamily family, const std::vector<Point3>& child_ref);

  CellFamily family_;
  std::vector<std::vector<index_t>> children_;
  std::vector<std::vector<index_t>> support_;
  std::vector<Point3> ref_points_;
  std::vector<AffineMap> maps_;
  std::vector<AffineMap> inverse_maps_;
};

/**
 * @brief Refinement rule for line elements (bisection, 2 children)
 */
class LineRefinementRule : public RefinementRule {
public:
  LineRefinementRule();
};

/**
 * @brief Refinement rule for triangle elements (red refinement, 4 children)
 *
 * Children 0..2 sit at the parent corners; child 3 is the central triangle
 * {m12, m20, m01}, a half-scale copy rotated by pi.
 */
class TriangleRefinementRule : public RefinementRule {
public:
  TriangleRefinementRule();
};

/**
 * @brief Refinement rule for quadrilateral elements (4 children)
 */
class QuadRefinementRule : public RefinementRule {
public:
  QuadRefinementRule();
};

/**
 * @brief Manager for all refinement rules
 */
class RefinementRulesManager {
public:
  /** Singleton instance */
  static RefinementRulesManager& instance();

  /**
   * @brief Get refinement rule for element type
   * @throws MeshConfigurationError if no rule is registered
   */
  const RefinementRule& get_rule(CellFamily family) const;

  /**
   * @brief Check if a rule exists for the element type
   */
  bool can_refine(CellFamily family) const noexcept;

  /**
   * @brief Get number of children for refinement
   */
  size_t num_children(CellFamily family) const;

private:
  RefinementRulesManager();
  static constexpr size_t kCellFamilyCount = static_cast<size_t>(CellFamily::Pyramid) + 1;
  std::array<std::unique_ptr<RefinementRule>, kCellFamilyCount> rules_{};
};

/**
 * @brief Utility functions for refinement
 */
class RefinementUtils {
public:
  /**
   * @brief Compute edge midpoint
   */
  static std::array<real_t, 3> edge_midpoint(
      const std::array<real_t, 3>& v1,
      const std::array<real_t, 3>& v2);

  /**
   * @brief Compute cell center (vertex average)
   */
  static std::array<real_t, 3> cell_center(
      const std::vector<std::array<real_t, 3>>& cell_vertices);
};

} // namespace mgfem

#endif // MGFEM_REFINEMENT_RULES_H
