/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

/**
 * @file test_MeshHierarchy.cpp
 * @brief Uniformly refined mesh hierarchies.
 *
 * Covers:
 * - cell and vertex counts per level (shared edge midpoints created once)
 * - parent / children maps are mutually inverse
 * - composite child maps place every fine cell inside its parent
 * - several refinements per level compose to the same fine mesh
 * - rejected inputs
 */

#include <gtest/gtest.h>

#include "../../../Builders/MeshBuilders.h"
#include "../../../Core/MeshExceptions.h"
#include "../../../Hierarchy/MeshHierarchy.h"
#include "../../../Topology/ReferenceCell.h"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

namespace mgfem {
namespace test {

namespace {

std::shared_ptr<const MeshBase> share(MeshBase mesh) {
  return std::make_shared<const MeshBase>(std::move(mesh));
}

void expect_parent_child_inverse(const MeshHierarchy& h) {
  for (size_t level = 1; level < h.num_levels(); ++level) {
    const MeshBase& fine = h.mesh(level);
    for (index_t f = 0; f < static_cast<index_t>(fine.n_cells()); ++f) {
      const ParentRef& p = h.parent(level, f);
      ASSERT_GE(p.child, 0);
      ASSERT_LT(static_cast<size_t>(p.child), h.num_children());
      EXPECT_EQ(h.children(level - 1, p.cell)[static_cast<size_t>(p.child)], f);
    }
  }
}

// Fine cell geometry equals the parent geometry composed with the child map,
// sampled at the reference vertices and centroid.
void expect_nested_geometry(const MeshHierarchy& h, double tol = 1e-13) {
  const CellFamily family = h.cell_family();
  std::vector<Point3> samples = ReferenceCell::vertices(family);
  samples.push_back(ReferenceCell::centroid(family));

  for (size_t level = 1; level < h.num_levels(); ++level) {
    const MeshBase& coarse = h.mesh(level - 1);
    const MeshBase& fine = h.mesh(level);
    for (index_t f = 0; f < static_cast<index_t>(fine.n_cells()); ++f) {
      const ParentRef& p = h.parent(level, f);
      const AffineMap& m = h.composite_child_map(level - 1, static_cast<size_t>(p.child));
      for (const auto& xi : samples) {
        const auto a = fine.map_to_physical(f, xi);
        const auto b = coarse.map_to_physical(p.cell, m.apply(xi));
        for (int d = 0; d < 3; ++d) {
          EXPECT_NEAR(a[d], b[d], tol) << "level " << level << " cell " << f;
        }
      }
    }
  }
}

} // namespace

TEST(MeshHierarchy, IntervalCounts) {
  auto h = MeshHierarchy::build(share(MeshBuilders::unit_interval(3)), 2);
  ASSERT_EQ(h->num_levels(), 3u);
  EXPECT_EQ(h->num_children(), 2u);
  EXPECT_EQ(h->mesh(0).n_cells(), 3u);
  EXPECT_EQ(h->mesh(1).n_cells(), 6u);
  EXPECT_EQ(h->mesh(2).n_cells(), 12u);
  EXPECT_EQ(h->mesh(1).n_vertices(), 7u);
  EXPECT_EQ(h->mesh(2).n_vertices(), 13u);
}

TEST(MeshHierarchy, SharedMidpointsAreCreatedOnce) {
  auto tri = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2)), 1);
  EXPECT_EQ(tri->mesh(1).n_cells(), 32u);
  EXPECT_EQ(tri->mesh(1).n_vertices(), 25u);

  auto quad = MeshHierarchy::build(share(MeshBuilders::unit_square_quads(2, 2)), 2);
  EXPECT_EQ(quad->mesh(1).n_cells(), 16u);
  EXPECT_EQ(quad->mesh(1).n_vertices(), 25u);
  EXPECT_EQ(quad->mesh(2).n_cells(), 64u);
  EXPECT_EQ(quad->mesh(2).n_vertices(), 81u);
}

TEST(MeshHierarchy, CoarsestLevelIsTheInputMesh) {
  auto base = share(MeshBuilders::unit_square(2, 2));
  auto h = MeshHierarchy::build(base, 1);
  EXPECT_EQ(h->mesh_ptr(0).get(), base.get());
  EXPECT_EQ(h->cell_family(), CellFamily::Triangle);
}

TEST(MeshHierarchy, ZeroRefinementsGiveOneLevel) {
  auto h = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 0);
  EXPECT_EQ(h->num_levels(), 1u);
  EXPECT_THROW(h->children(0, 0), std::out_of_range);
}

TEST(MeshHierarchy, ParentAndChildrenAreInverse) {
  expect_parent_child_inverse(*MeshHierarchy::build(share(MeshBuilders::unit_interval(3)), 3));
  expect_parent_child_inverse(*MeshHierarchy::build(share(MeshBuilders::unit_square(2, 3)), 2));
  expect_parent_child_inverse(*MeshHierarchy::build(share(MeshBuilders::unit_square_quads(3, 2)), 2));
}

TEST(MeshHierarchy, FineCellsNestInParents) {
  expect_nested_geometry(*MeshHierarchy::build(share(MeshBuilders::unit_interval(4)), 2));
  expect_nested_geometry(*MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2, SquareDiagonal::Left)), 2));
  expect_nested_geometry(*MeshHierarchy::build(share(MeshBuilders::unit_square_quads(2, 3)), 2));
}

TEST(MeshHierarchy, ChildMeasuresTileParent) {
  auto h = MeshHierarchy::build(share(MeshBuilders::unit_square(3, 2)), 1);
  const MeshBase& coarse = h->mesh(0);
  const MeshBase& fine = h->mesh(1);
  for (index_t c = 0; c < static_cast<index_t>(coarse.n_cells()); ++c) {
    real_t sum = 0.0;
    for (index_t k : h->children(0, c)) sum += fine.cell_measure(k);
    EXPECT_NEAR(sum, coarse.cell_measure(c), 1e-15);
  }
}

TEST(MeshHierarchy, MultipleRefinementsPerLevelCompose) {
  auto base = share(MeshBuilders::unit_square(2, 2));
  auto single = MeshHierarchy::build(base, 2);
  auto doubled = MeshHierarchy::build(base, 1, 2);

  ASSERT_EQ(doubled->num_levels(), 2u);
  EXPECT_EQ(doubled->refinements_per_level(), 2);
  EXPECT_EQ(doubled->num_children(), 16u);

  const MeshBase& a = single->mesh(2);
  const MeshBase& b = doubled->mesh(1);
  ASSERT_EQ(a.n_cells(), b.n_cells());
  ASSERT_EQ(a.n_vertices(), b.n_vertices());
  EXPECT_EQ(a.X_ref(), b.X_ref());
  EXPECT_EQ(a.cell2vertex(), b.cell2vertex());

  // Composite child index = outer child * N + inner child
  for (index_t f = 0; f < static_cast<index_t>(b.n_cells()); ++f) {
    const ParentRef& inner = single->parent(2, f);
    const ParentRef& outer = single->parent(1, inner.cell);
    const ParentRef& composite = doubled->parent(1, f);
    EXPECT_EQ(composite.cell, outer.cell);
    EXPECT_EQ(composite.child, outer.child * 4 + inner.child);
  }

  expect_parent_child_inverse(*doubled);
  expect_nested_geometry(*doubled);
}

TEST(MeshHierarchy, CompositeLocateChild) {
  auto h = MeshHierarchy::build(share(MeshBuilders::unit_interval(1)), 1, 2);
  ASSERT_EQ(h->num_children(), 4u);

  Point3 local{};
  EXPECT_EQ(h->locate_child({0.75, 0.0, 0.0}, local), 3);
  EXPECT_NEAR(local[0], 0.0, 1e-14);
  EXPECT_EQ(h->locate_child({-0.75, 0.0, 0.0}, local), 0);
  EXPECT_NEAR(local[0], 0.0, 1e-14);
  EXPECT_EQ(h->locate_child({2.0, 0.0, 0.0}, local), -1);

  // Maps are independent of the level they are queried for
  auto deep = MeshHierarchy::build(share(MeshBuilders::unit_interval(1)), 3, 2);
  EXPECT_TRUE(deep->composite_child_map(0, 1).approx_equal(deep->composite_child_map(2, 1), 0.0));
}

TEST(MeshHierarchy, UnverifiedBuildMatchesVerified) {
  HierarchyOptions options;
  options.verify_each_step = false;
  options.refinements_per_level = 2;
  auto base = share(MeshBuilders::unit_square_quads(2, 1));
  auto fast = MeshHierarchy::build(base, 1, options);
  auto checked = MeshHierarchy::build(base, 1, 2);
  EXPECT_EQ(fast->mesh(1).X_ref(), checked->mesh(1).X_ref());
  EXPECT_FALSE(fast->options().verify_each_step);
}

TEST(MeshHierarchy, VerifyRefinementCatchesInconsistentLevels) {
  auto h = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2)), 1);
  const MeshBase& coarse = h->mesh(0);
  const MeshBase& fine = h->mesh(1);
  const auto& maps = h->composite_child_maps();
  EXPECT_NO_THROW(MeshHierarchy::verify_refinement(coarse, fine, h->parent_map(1), maps, 1e-10));

  // First edge midpoint pushed off its edge, in a direction no grid edge has
  std::vector<real_t> X = fine.X_ref();
  const size_t moved = coarse.n_vertices() * static_cast<size_t>(fine.dim());
  X[moved] += 1e-3;
  X[moved + 1] += 2e-3;
  const MeshBase bent = MeshBuilders::from_arrays(fine.dim(), fine.cell_family(), X, fine.cell2vertex());
  EXPECT_THROW(MeshHierarchy::verify_refinement(coarse, bent, h->parent_map(1), maps, 1e-10),
               GeometricConsistencyError);
  // Within a loose tolerance the vertex still counts as placed, but the
  // children no longer tile their parents exactly
  EXPECT_THROW(MeshHierarchy::verify_refinement(coarse, bent, h->parent_map(1), maps, 1e-2),
               GeometricConsistencyError);

  std::vector<ParentRef> swapped = h->parent_map(1);
  swapped[0].child = (swapped[0].child + 1) % 4;
  EXPECT_THROW(MeshHierarchy::verify_refinement(coarse, fine, swapped, maps, 1e-10),
               GeometricConsistencyError);

  std::vector<ParentRef> partial = h->parent_map(1);
  partial.pop_back();
  EXPECT_THROW(MeshHierarchy::verify_refinement(coarse, fine, partial, maps, 1e-10),
               GeometricConsistencyError);
}

TEST(MeshHierarchy, InvalidLevelsThrow) {
  auto h = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 1);
  EXPECT_THROW(h->mesh(2), std::out_of_range);
  EXPECT_THROW(h->parent(0, 0), std::out_of_range);
  EXPECT_THROW(h->children(1, 0), std::out_of_range);
  EXPECT_THROW(h->children(0, 5), std::out_of_range);
  EXPECT_THROW(h->composite_child_map(1, 0), std::out_of_range);
}

TEST(MeshHierarchy, RejectsUnsupportedInput) {
  // Tetrahedra have no refinement rule
  auto tet = share(MeshBuilders::from_arrays(3, CellFamily::Tetra,
                                             {0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0, 0.0, 0.0, 0.0, 1.0},
                                             {0, 1, 2, 3}));
  EXPECT_THROW(MeshHierarchy::build(tet, 1), MeshConfigurationError);

  auto line = share(MeshBuilders::unit_interval(2));
  EXPECT_THROW(MeshHierarchy::build(nullptr, 1), MeshConfigurationError);
  EXPECT_THROW(MeshHierarchy::build(line, -1), MeshConfigurationError);
  EXPECT_THROW(MeshHierarchy::build(line, 1, 0), MeshConfigurationError);

  auto unfinished = std::make_shared<MeshBase>(1);
  unfinished->build_from_arrays(1, CellFamily::Line, {0.0, 1.0}, {0, 1});
  EXPECT_THROW(MeshHierarchy::build(unfinished, 1), MeshConfigurationError);
}

} // namespace test
} // namespace mgfem
