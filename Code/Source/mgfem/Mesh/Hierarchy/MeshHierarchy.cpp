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

#include "MeshHierarchy.h"
#include "../Adaptivity/RefinementRules.h"
#include "../Core/MeshExceptions.h"
#include "../Topology/ReferenceCell.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

namespace mgfem {

namespace {

gid_t edge_key(index_t a, index_t b) {
  const gid_t lo = std::min(a, b);
  const gid_t hi = std::max(a, b);
  return (lo << 32) | hi;
}

real_t mesh_extent(const MeshBase& mesh) {
  const BoundingBox box = mesh.bounding_box();
  real_t extent = 0.0;
  for (int d = 0; d < mesh.dim(); ++d) {
    extent = std::max(extent, box.max[d] - box.min[d]);
  }
  return std::max(extent, real_t(1.0));
}

} // namespace

MeshHierarchy::MeshHierarchy(const RefinementRule& rule, const HierarchyOptions& options)
    : rule_(&rule), options_(options) {}

std::shared_ptr<const MeshHierarchy> MeshHierarchy::build(std::shared_ptr<const MeshBase> base,
                                                          int num_refinements,
                                                          int refinements_per_level) {
  HierarchyOptions options;
  options.refinements_per_level = refinements_per_level;
  return build(std::move(base), num_refinements, options);
}

std::shared_ptr<const MeshHierarchy> MeshHierarchy::build(std::shared_ptr<const MeshBase> base,
                                                          int num_refinements,
                                                          const HierarchyOptions& options) {
  if (!base) {
    throw MeshConfigurationError("MeshHierarchy::build: base mesh is null");
  }
  if (!base->is_finalized()) {
    throw MeshConfigurationError("MeshHierarchy::build: base mesh is not finalized");
  }
  if (num_refinements < 0) {
    throw MeshConfigurationError("MeshHierarchy::build: number of refinements must be non-negative");
  }
  if (options.refinements_per_level < 1) {
    throw MeshConfigurationError("MeshHierarchy::build: refinements_per_level must be at least 1");
  }

  // Throws MeshConfigurationError for families without a rule
  const RefinementRule& rule = RefinementRulesManager::instance().get_rule(base->cell_family());
  if (!rule.verify_tiling()) {
    throw GeometricConsistencyError(std::string("MeshHierarchy::build: refinement rule for ") +
                                    cell_family_name(rule.family()) + " does not tile the parent cell");
  }

  std::shared_ptr<MeshHierarchy> h(new MeshHierarchy(rule, options));
  const int k = options.refinements_per_level;
  const size_t n_step = rule.num_children();

  // Composite maps: digits most significant first, outermost map first
  size_t n_comp = 1;
  for (int s = 0; s < k; ++s) n_comp *= n_step;
  h->composite_maps_.reserve(n_comp);
  for (size_t c = 0; c < n_comp; ++c) {
    AffineMap m = AffineMap::identity(cell_dimension(rule.family()));
    size_t place = n_comp / n_step;
    size_t rest = c;
    for (int s = 0; s < k; ++s) {
      const size_t digit = rest / place;
      rest %= place;
      if (place > 1) place /= n_step;
      m = m.compose(rule.child_to_parent(digit));
    }
    h->composite_maps_.push_back(m);
    h->composite_inverse_maps_.push_back(m.inverse());
  }

  const real_t tol = options.geometric_tolerance * mesh_extent(*base);

  h->meshes_.push_back(base);
  for (int level = 0; level < num_refinements; ++level) {
    const MeshBase* current = h->meshes_.back().get();
    std::shared_ptr<const MeshBase> holder;
    std::vector<ParentRef> composite;

    for (int s = 0; s < k; ++s) {
      StepResult step = refine_once(*current, rule);
      if (options.verify_each_step) {
        verify_refinement(*current, step.mesh, step.parents, rule.child_maps(), tol);
      }

      if (s == 0) {
        composite = std::move(step.parents);
      } else {
        std::vector<ParentRef> next(step.parents.size());
        for (size_t f = 0; f < step.parents.size(); ++f) {
          const ParentRef& mid = composite[static_cast<size_t>(step.parents[f].cell)];
          next[f].cell = mid.cell;
          next[f].child = mid.child * static_cast<index_t>(n_step) + step.parents[f].child;
        }
        composite = std::move(next);
      }

      holder = std::make_shared<const MeshBase>(std::move(step.mesh));
      current = holder.get();
    }

    if (!options.verify_each_step) {
      verify_refinement(*h->meshes_.back(), *holder, composite, h->composite_maps_, tol);
    }

    std::vector<index_t> kids(h->meshes_.back()->n_cells() * n_comp, INVALID_INDEX);
    for (size_t f = 0; f < composite.size(); ++f) {
      const ParentRef& p = composite[f];
      kids[static_cast<size_t>(p.cell) * n_comp + static_cast<size_t>(p.child)] = static_cast<index_t>(f);
    }

    h->meshes_.push_back(std::move(holder));
    h->parents_.push_back(std::move(composite));
    h->children_.push_back(std::move(kids));
  }

  return h;
}

MeshHierarchy::StepResult MeshHierarchy::refine_once(const MeshBase& coarse, const RefinementRule& rule) {
  const int dim = coarse.dim();
  const size_t n_children = rule.num_children();
  const index_t n_coarse = static_cast<index_t>(coarse.n_cells());

  std::vector<real_t> X = coarse.X_ref();
  index_t n_vertices = static_cast<index_t>(coarse.n_vertices());

  std::unordered_map<gid_t, index_t> midpoint_of_edge;
  midpoint_of_edge.reserve(coarse.n_edges());

  auto add_vertex = [&](const std::array<real_t,3>& x) {
    for (int d = 0; d < dim; ++d) X.push_back(x[d]);
    return n_vertices++;
  };

  std::vector<index_t> cell2vertex;
  cell2vertex.reserve(static_cast<size_t>(n_coarse) * n_children *
                      static_cast<size_t>(coarse.n_vertices_per_cell()));
  std::vector<ParentRef> parents;
  parents.reserve(static_cast<size_t>(n_coarse) * n_children);

  std::vector<index_t> patch;
  for (index_t c = 0; c < n_coarse; ++c) {
    const std::vector<index_t> verts = coarse.cell_vertices(c);
    const RefinedElement refined = rule.refine(coarse.cell_vertex_coords(c));

    patch.assign(verts.begin(), verts.end());
    for (size_t i = 0; i < refined.new_vertices.size(); ++i) {
      const auto& support = refined.new_vertex_support[i];
      if (support.size() == 2) {
        const gid_t key = edge_key(verts[support[0]], verts[support[1]]);
        auto it = midpoint_of_edge.find(key);
        if (it == midpoint_of_edge.end()) {
          it = midpoint_of_edge.emplace(key, add_vertex(refined.new_vertices[i])).first;
        }
        patch.push_back(it->second);
      } else {
        patch.push_back(add_vertex(refined.new_vertices[i]));
      }
    }

    for (size_t ch = 0; ch < refined.child_connectivity.size(); ++ch) {
      for (index_t lv : refined.child_connectivity[ch]) {
        cell2vertex.push_back(patch[static_cast<size_t>(lv)]);
      }
      parents.push_back({c, static_cast<index_t>(ch)});
    }
  }

  MeshBase fine(dim);
  fine.build_from_arrays(dim, coarse.cell_family(), X, cell2vertex);
  fine.finalize();
  return {std::move(fine), std::move(parents)};
}

void MeshHierarchy::verify_refinement(const MeshBase& coarse, const MeshBase& fine,
                                      const std::vector<ParentRef>& parents,
                                      const std::vector<AffineMap>& maps,
                                      real_t tol) {
  const CellFamily family = coarse.cell_family();
  const auto& ref = ReferenceCell::vertices(family);

  if (parents.size() != fine.n_cells()) {
    throw GeometricConsistencyError("MeshHierarchy: parent map does not cover the fine mesh");
  }

  // Every fine vertex must sit where the parent cell maps the child vertex
  for (index_t f = 0; f < static_cast<index_t>(fine.n_cells()); ++f) {
    const ParentRef& p = parents[static_cast<size_t>(f)];
    const AffineMap& m = maps.at(static_cast<size_t>(p.child));
    auto [verts, nv] = fine.cell_vertices_span(f);
    for (size_t i = 0; i < nv; ++i) {
      const auto expected = coarse.map_to_physical(p.cell, m.apply(ref[i]));
      const auto actual = fine.get_vertex_coords(verts[i]);
      for (int d = 0; d < 3; ++d) {
        if (std::abs(expected[d] - actual[d]) > tol) {
          throw GeometricConsistencyError("MeshHierarchy: vertex " + std::to_string(verts[i]) +
                                          " of fine cell " + std::to_string(f) +
                                          " does not match its position in parent cell " +
                                          std::to_string(p.cell));
        }
      }
    }
  }

  // Children must tile the parent: measures add up
  std::vector<real_t> child_measure(coarse.n_cells(), 0.0);
  for (index_t f = 0; f < static_cast<index_t>(fine.n_cells()); ++f) {
    child_measure[static_cast<size_t>(parents[static_cast<size_t>(f)].cell)] += fine.cell_measure(f);
  }
  for (index_t c = 0; c < static_cast<index_t>(coarse.n_cells()); ++c) {
    const real_t parent_measure = coarse.cell_measure(c);
    if (std::abs(child_measure[static_cast<size_t>(c)] - parent_measure) > 1e-9 * parent_measure) {
      throw GeometricConsistencyError("MeshHierarchy: children of cell " + std::to_string(c) +
                                      " do not tile the parent");
    }
  }
}

void MeshHierarchy::check_level(size_t level, bool fine) const {
  if (level >= meshes_.size() || (fine && level == 0) || (!fine && level + 1 >= meshes_.size())) {
    throw std::out_of_range("MeshHierarchy: invalid level " + std::to_string(level));
  }
}

const MeshBase& MeshHierarchy::mesh(size_t level) const {
  return *mesh_ptr(level);
}

std::shared_ptr<const MeshBase> MeshHierarchy::mesh_ptr(size_t level) const {
  if (level >= meshes_.size()) {
    throw std::out_of_range("MeshHierarchy: invalid level " + std::to_string(level));
  }
  return meshes_[level];
}

const ParentRef& MeshHierarchy::parent(size_t level, index_t fine_cell) const {
  check_level(level, true);
  return parents_[level - 1].at(static_cast<size_t>(fine_cell));
}

const std::vector<ParentRef>& MeshHierarchy::parent_map(size_t level) const {
  check_level(level, true);
  return parents_[level - 1];
}

std::vector<index_t> MeshHierarchy::children(size_t level, index_t coarse_cell) const {
  check_level(level, false);
  const size_t n = num_children();
  if (coarse_cell < 0 || static_cast<size_t>(coarse_cell) >= meshes_[level]->n_cells()) {
    throw std::out_of_range("MeshHierarchy::children: invalid cell index");
  }
  const auto& kids = children_[level];
  const auto begin = kids.begin() + static_cast<std::ptrdiff_t>(static_cast<size_t>(coarse_cell) * n);
  return std::vector<index_t>(begin, begin + static_cast<std::ptrdiff_t>(n));
}

const AffineMap& MeshHierarchy::composite_child_map(size_t level, size_t child) const {
  check_level(level, false);
  return composite_maps_.at(child);
}

int MeshHierarchy::locate_child(const Point3& xi, Point3& xi_child, real_t tol) const {
  const CellFamily family = cell_family();
  for (size_t c = 0; c < composite_inverse_maps_.size(); ++c) {
    const Point3 local = composite_inverse_maps_[c].apply(xi);
    if (ReferenceCell::contains(family, local, tol)) {
      xi_child = local;
      return static_cast<int>(c);
    }
  }
  return -1;
}

} // namespace mgfem
