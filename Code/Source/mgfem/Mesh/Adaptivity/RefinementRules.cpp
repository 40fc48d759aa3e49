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

#include "RefinementRules.h"
#include "../Core/MeshExceptions.h"
#include "../Topology/ReferenceCell.h"
#include <cmath>
#include <string>

namespace mgfem {

// ====================
// RefinementRule Implementation
// ====================

RefinementRule::RefinementRule(CellFamily family,
                               std::vector<std::vector<index_t>> children,
                               std::vector<std::vector<index_t>> support)
    : family_(family), children_(std::move(children)), support_(std::move(support)) {

  ref_points_ = ReferenceCell::vertices(family_);
  for (const auto& s : support_) {
    std::vector<Point3> pts;
    for (index_t v : s) pts.push_back(ref_points_[static_cast<size_t>(v)]);
    ref_points_.push_back(RefinementUtils::cell_center(pts));
  }

  for (const auto& child : children_) {
    std::vector<Point3> child_ref;
    child_ref.reserve(child.size());
    for (index_t v : child) child_ref.push_back(ref_points_[static_cast<size_t>(v)]);
    maps_.push_back(map_from_vertices(family_, child_ref));
    inverse_maps_.push_back(maps_.back().inverse());
  }
}

AffineMap RefinementRule::map_from_vertices(CellFamily family, const std::vector<Point3>& child_ref) {
  // Origin vertex, axis vertices and the reference edge length along each axis
  int origin = 0;
  std::vector<int> axes;
  real_t scale = 1.0;
  switch (family) {
    case CellFamily::Line:     axes = {1};    scale = 2.0; break;
    case CellFamily::Triangle: axes = {1, 2}; scale = 1.0; break;
    case CellFamily::Quad:     axes = {1, 3}; scale = 2.0; break;
    default:
      throw MeshConfigurationError(std::string("RefinementRule: unsupported family ") +
                                   cell_family_name(family));
  }

  const auto& ref = ReferenceCell::vertices(family);
  const int dim = cell_dimension(family);

  AffineMap m = AffineMap::identity(dim);
  for (int k = 0; k < dim; ++k) {
    for (int i = 0; i < dim; ++i) {
      m.A[i][k] = (child_ref[axes[k]][i] - child_ref[origin][i]) / scale;
    }
  }
  for (int i = 0; i < dim; ++i) {
    real_t s = child_ref[origin][i];
    for (int j = 0; j < dim; ++j) s -= m.A[i][j] * ref[origin][j];
    m.b[i] = s;
  }

  // Every child vertex must be reproduced, otherwise the child is not an affine image
  for (size_t v = 0; v < child_ref.size(); ++v) {
    const Point3 x = m.apply(ref[v]);
    for (int i = 0; i < dim; ++i) {
      if (std::abs(x[i] - child_ref[v][i]) > 1e-14) {
        throw GeometricConsistencyError("RefinementRule: child is not an affine image of the reference cell");
      }
    }
  }
  return m;
}

RefinedElement RefinementRule::refine(const std::vector<std::array<real_t, 3>>& vertices) const {
  if (vertices.size() != static_cast<size_t>(cell_num_vertices(family_))) {
    throw std::invalid_argument("Invalid element for " + std::string(cell_family_name(family_)) +
                                " refinement");
  }

  RefinedElement refined;
  refined.child_connectivity = children_;
  refined.new_vertex_support = support_;
  refined.new_vertices.reserve(support_.size());

  for (const auto& s : support_) {
    if (s.size() == 2) {
      refined.new_vertices.push_back(
          RefinementUtils::edge_midpoint(vertices[s[0]], vertices[s[1]]));
    } else {
      std::vector<std::array<real_t, 3>> pts;
      for (index_t v : s) pts.push_back(vertices[v]);
      refined.new_vertices.push_back(RefinementUtils::cell_center(pts));
    }
  }
  return refined;
}

int RefinementRule::locate_child(const Point3& xi, Point3& xi_child, real_t tol) const {
  for (size_t c = 0; c < inverse_maps_.size(); ++c) {
    const Point3 local = inverse_maps_[c].apply(xi);
    if (ReferenceCell::contains(family_, local, tol)) {
      xi_child = local;
      return static_cast<int>(c);
    }
  }
  return -1;
}

bool RefinementRule::verify_tiling(real_t tol) const {
  const real_t parent_measure = ReferenceCell::measure(family_);
  real_t total = 0.0;

  for (size_t c = 0; c < children_.size(); ++c) {
    const real_t det = maps_[c].determinant();
    if (det <= tol) return false;  // inverted or degenerate child
    total += det * parent_measure;

    for (index_t v : children_[c]) {
      if (!ReferenceCell::contains(family_, ref_points_[static_cast<size_t>(v)], tol)) return false;
    }

    // The child centroid must be covered by exactly one child
    const Point3 centre = maps_[c].apply(ReferenceCell::centroid(family_));
    int hits = 0;
    for (size_t o = 0; o < children_.size(); ++o) {
      if (ReferenceCell::contains(family_, inverse_maps_[o].apply(centre), tol)) ++hits;
    }
    if (hits != 1) return false;
  }

  return std::abs(total - parent_measure) <= tol * parent_measure * 10.0;
}

// ====================
// Concrete rules
// ====================

// Patch-local numbering: 0,1 parent vertices; 2 midpoint
LineRefinementRule::LineRefinementRule()
    : RefinementRule(CellFamily::Line,
                     {{0, 2}, {2, 1}},
                     {{0, 1}}) {}

// Patch-local numbering: 0..2 parent vertices; 3 = m01, 4 = m12, 5 = m20
TriangleRefinementRule::TriangleRefinementRule()
    : RefinementRule(CellFamily::Triangle,
                     {{0, 3, 5},   // Triangle at vertex 0
                      {3, 1, 4},   // Triangle at vertex 1
                      {5, 4, 2},   // Triangle at vertex 2
                      {4, 5, 3}},  // Central triangle
                     {{0, 1}, {1, 2}, {2, 0}}) {}

// Patch-local numbering: 0..3 parent vertices; 4 = m01, 5 = m12, 6 = m23, 7 = m30, 8 = center
QuadRefinementRule::QuadRefinementRule()
    : RefinementRule(CellFamily::Quad,
                     {{0, 4, 8, 7},
                      {4, 1, 5, 8},
                      {8, 5, 2, 6},
                      {7, 8, 6, 3}},
                     {{0, 1}, {1, 2}, {2, 3}, {3, 0}, {0, 1, 2, 3}}) {}

// ====================
// RefinementRulesManager Implementation
// ====================

RefinementRulesManager& RefinementRulesManager::instance() {
  static RefinementRulesManager instance;
  return instance;
}

RefinementRulesManager::RefinementRulesManager() {
  rules_[static_cast<size_t>(CellFamily::Line)] = std::make_unique<LineRefinementRule>();
  rules_[static_cast<size_t>(CellFamily::Triangle)] = std::make_unique<TriangleRefinementRule>();
  rules_[static_cast<size_t>(CellFamily::Quad)] = std::make_unique<QuadRefinementRule>();
}

const RefinementRule& RefinementRulesManager::get_rule(CellFamily family) const {
  const size_t idx = static_cast<size_t>(family);
  if (idx >= rules_.size() || !rules_[idx]) {
    throw MeshConfigurationError(std::string("No refinement rule for cell family ") +
                                 cell_family_name(family));
  }
  return *rules_[idx];
}

bool RefinementRulesManager::can_refine(CellFamily family) const noexcept {
  const size_t idx = static_cast<size_t>(family);
  return idx < rules_.size() && rules_[idx] != nullptr;
}

size_t RefinementRulesManager::num_children(CellFamily family) const {
  return get_rule(family).num_children();
}

// ====================
// RefinementUtils Implementation
// ====================

std::array<real_t, 3> RefinementUtils::edge_midpoint(
    const std::array<real_t, 3>& v1,
    const std::array<real_t, 3>& v2) {
  return {
    0.5 * (v1[0] + v2[0]),
    0.5 * (v1[1] + v2[1]),
    0.5 * (v1[2] + v2[2])
  };
}

std::array<real_t, 3> RefinementUtils::cell_center(
    const std::vector<std::array<real_t, 3>>& cell_vertices) {
  std::array<real_t, 3> center = {0, 0, 0};
  for (const auto& v : cell_vertices) {
    center[0] += v[0];
    center[1] += v[1];
    center[2] += v[2];
  }
  const real_t n = static_cast<real_t>(cell_vertices.size());
  center[0] /= n;
  center[1] /= n;
  center[2] /= n;
  return center;
}

} // namespace mgfem
