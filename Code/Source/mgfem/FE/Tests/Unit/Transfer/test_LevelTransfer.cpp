/**
 * @file test_LevelTransfer.cpp
 * @brief Unit tests for prolongation, restriction and injection between levels
 *
 * Prolongation must reproduce every field of the coarse space exactly on the
 * fine level. The fields used here are polynomials of the element degree, so
 * the coarse interpolant is the field itself and prolong(coarse) has to match
 * the fine interpolant node by node.
 */

#include <gtest/gtest.h>

#include "FE/Core/FEException.h"
#include "FE/Core/Logger.h"
#include "FE/Function/Function.h"
#include "FE/Spaces/FunctionSpaceHierarchy.h"
#include "FE/Transfer/LevelTransfer.h"
#include "Mesh/Builders/MeshBuilders.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <limits>
#include <random>
#include <span>
#include <string>
#include <vector>

using mgfem::ExtrudedMeshHierarchy;
using mgfem::MeshBase;
using mgfem::MeshBuilders;
using mgfem::MeshHierarchy;
using mgfem::FE::ConfigurationException;
using mgfem::FE::GlobalIndex;
using mgfem::FE::InvalidArgumentException;
using mgfem::FE::LogLevel;
using mgfem::FE::LogMessage;
using mgfem::FE::Logger;
using mgfem::FE::PhysicalPoint;
using mgfem::FE::Real;
using mgfem::FE::elements::ElementDescriptor;
using mgfem::FE::elements::ElementFamily;
using mgfem::FE::functions::FieldFunction;
using mgfem::FE::functions::Function;
using mgfem::FE::functions::MixedFunction;
using mgfem::FE::functions::ScalarFieldFunction;
using mgfem::FE::spaces::FunctionSpace;
using mgfem::FE::spaces::FunctionSpaceHierarchy;
using mgfem::FE::spaces::MixedFunctionSpaceHierarchy;
using mgfem::FE::spaces::MixedSpace;
using mgfem::FE::spaces::VectorFunctionSpaceHierarchy;
using mgfem::FE::transfer::ContinuityAudit;
using mgfem::FE::transfer::TransferOptions;
using mgfem::FE::transfer::TransferReport;

namespace transfer = mgfem::FE::transfer;

namespace {

using HierarchyPtr = std::shared_ptr<const FunctionSpaceHierarchy>;

std::shared_ptr<const MeshBase> share(MeshBase mesh) {
    return std::make_shared<const MeshBase>(std::move(mesh));
}

// Degree-p polynomial in every supported cell family (P_p is inside Q_p and
// inside the prism product space)
ScalarFieldFunction polynomial(int p) {
    return [p](const PhysicalPoint& x) {
        const Real linear = p >= 1 ? 0.5 * x[0] : 0.0;
        return std::pow(x[0] + 2.0 * x[1] - 0.1, p) + std::pow(x[2], p) + linear + 1.0;
    };
}

Real max_difference(std::span<const Real> a, std::span<const Real> b) {
    EXPECT_EQ(a.size(), b.size());
    Real m = 0.0;
    for (std::size_t i = 0; i < std::min(a.size(), b.size()); ++i) {
        m = std::max(m, std::abs(a[i] - b[i]));
    }
    return m;
}

void expect_prolongation_exact(const HierarchyPtr& h, const ScalarFieldFunction& f, Real tol = 1e-11) {
    for (std::size_t level = 1; level < h->num_levels(); ++level) {
        Function coarse(h->space_ptr(level - 1));
        Function fine(h->space_ptr(level));
        Function expected(h->space_ptr(level));
        coarse.interpolate(f);
        expected.interpolate(f);

        const TransferReport report = transfer::prolong(coarse, fine);
        EXPECT_EQ(report.dofs_written, fine.num_dofs());
        EXPECT_LT(max_difference(fine.values(), expected.values()), tol)
            << h->summary() << ", level " << level;
    }
}

// Seeds level 0 with a degree-p field and prolongs level by level, comparing
// each result with the interpolant on that level
void expect_chained_exact(const HierarchyPtr& h, int p, Real tol = 1e-10) {
    const ScalarFieldFunction f = polynomial(p);
    const auto vs = static_cast<std::size_t>(h->element().value_size);
    const FieldFunction field = [&f, vs](const PhysicalPoint& x) {
        std::vector<Real> v(vs);
        for (std::size_t k = 0; k < vs; ++k) {
            v[k] = static_cast<Real>(k + 1) * f(x) - static_cast<Real>(k);
        }
        return v;
    };

    std::vector<Function> chain;
    chain.reserve(h->num_levels());
    chain.emplace_back(h->space_ptr(0));
    chain.front().interpolate(field);
    for (std::size_t level = 1; level < h->num_levels(); ++level) {
        chain.emplace_back(h->space_ptr(level));
        transfer::prolong(chain[level - 1], chain[level]);

        Function expected(h->space_ptr(level));
        expected.interpolate(field);
        EXPECT_LT(max_difference(chain[level].values(), expected.values()), tol)
            << h->summary() << ", level " << level;
    }
}

void fill_random(Function& u, unsigned seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<Real> dist(-1.0, 1.0);
    for (auto& v : u.values()) {
        v = dist(gen);
    }
}

// Collects WARNING messages while alive
class WarningCapture {
public:
    WarningCapture() {
        previous_level_ = Logger::instance().get_level();
        Logger::instance().set_level(LogLevel::WARNING);
        id_ = Logger::instance().add_handler([this](const LogMessage& msg) {
            if (msg.level == LogLevel::WARNING) {
                messages_.push_back(msg.message);
            }
        });
    }
    ~WarningCapture() {
        Logger::instance().remove_handler(id_);
        Logger::instance().set_level(previous_level_);
    }

    const std::vector<std::string>& messages() const { return messages_; }

private:
    std::size_t id_ = 0;
    LogLevel previous_level_ = LogLevel::WARNING;
    std::vector<std::string> messages_;
};

Real dot(std::span<const Real> a, std::span<const Real> b) {
    Real s = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        s += a[i] * b[i];
    }
    return s;
}

} // namespace

// ============================================================================
// Exactness
// ============================================================================

TEST(Prolong, ExactOnIntervals) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(3)), 2);
    for (int p = 1; p <= 4; ++p) {
        expect_prolongation_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, p), polynomial(p));
    }
    for (int p = 0; p <= 3; ++p) {
        expect_prolongation_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, p), polynomial(p));
    }
}

TEST(Prolong, ExactOnTriangles) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 3)), 2);
    for (int p = 1; p <= 3; ++p) {
        expect_prolongation_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, p), polynomial(p));
        expect_prolongation_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, p), polynomial(p));
    }
    expect_prolongation_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, 0), polynomial(0));
}

TEST(Prolong, ExactOnQuads) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square_quads(3, 2)), 2);
    for (int p = 1; p <= 3; ++p) {
        expect_prolongation_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, p), polynomial(p));
        expect_prolongation_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, p), polynomial(p));
    }
}

TEST(Prolong, ExactWithSeveralRefinementsPerLevel) {
    auto tri = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2)), 1, 2);
    expect_prolongation_exact(FunctionSpaceHierarchy::build(tri, ElementFamily::CG, 2), polynomial(2));
    expect_prolongation_exact(FunctionSpaceHierarchy::build(tri, ElementFamily::DG, 1), polynomial(1));

    auto line = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 2, 3);
    expect_prolongation_exact(FunctionSpaceHierarchy::build(line, ElementFamily::CG, 3), polynomial(3));
}

TEST(Prolong, ExactOnExtrudedMeshes) {
    auto intervals = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 2);
    auto layered = ExtrudedMeshHierarchy::build(intervals, 3);
    for (int p = 1; p <= 2; ++p) {
        expect_prolongation_exact(FunctionSpaceHierarchy::build(layered, ElementFamily::CG, p), polynomial(p));
        expect_prolongation_exact(FunctionSpaceHierarchy::build(layered, ElementFamily::DG, p), polynomial(p));
    }

    auto triangles = MeshHierarchy::build(share(MeshBuilders::unit_square(1, 2)), 1);
    auto prisms = ExtrudedMeshHierarchy::build(triangles, 2, 0.5);
    expect_prolongation_exact(FunctionSpaceHierarchy::build(prisms, ElementFamily::CG, 2), polynomial(2));
    expect_prolongation_exact(FunctionSpaceHierarchy::build(prisms, ElementFamily::DG, 0), polynomial(0));
}

// Each (layer, vertical node) slice of an extruded DG1 field prolongs like a
// plain DG1 field on the base hierarchy
TEST(Prolong, ExtrudedTransferFactorsByLayer) {
    auto base_meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(3)), 1);
    const int layers = 3;
    auto layered = FunctionSpaceHierarchy::build(ExtrudedMeshHierarchy::build(base_meshes, layers),
                                                 ElementFamily::DG, 1);
    auto flat = FunctionSpaceHierarchy::build(base_meshes, ElementFamily::DG, 1);

    Function coarse(layered->space_ptr(0));
    Function fine(layered->space_ptr(1));
    fill_random(coarse, 11);
    transfer::prolong(coarse, fine);

    // Cell-major DG numbering, prism node j * 2 + i
    const auto extruded_dof = [layers](GlobalIndex base_cell, int layer, int j, int i) -> GlobalIndex {
        return (base_cell * layers + layer) * 4 + j * 2 + i;
    };

    for (int layer = 0; layer < layers; ++layer) {
        for (int j = 0; j < 2; ++j) {
            Function slice_coarse(flat->space_ptr(0));
            Function slice_fine(flat->space_ptr(1));
            for (GlobalIndex bc = 0; bc < 3; ++bc) {
                for (int i = 0; i < 2; ++i) {
                    slice_coarse[bc * 2 + i] = coarse[extruded_dof(bc, layer, j, i)];
                }
            }
            transfer::prolong(slice_coarse, slice_fine);

            for (GlobalIndex bc = 0; bc < 6; ++bc) {
                for (int i = 0; i < 2; ++i) {
                    EXPECT_NEAR(fine[extruded_dof(bc, layer, j, i)], slice_fine[bc * 2 + i], 1e-13)
                        << "layer " << layer << ", vertical node " << j << ", base cell " << bc;
                }
            }
        }
    }
}

TEST(Prolong, QuadraticOnRefinedInterval) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(10)), 2);
    auto h = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 2);
    ASSERT_EQ(h->num_levels(), 3u);

    const ScalarFieldFunction square = [](const PhysicalPoint& x) { return x[0] * x[0]; };
    Function coarse(h->space_ptr(0));
    Function mid(h->space_ptr(1));
    Function fine(h->space_ptr(2));
    coarse.interpolate(square);
    transfer::prolong(coarse, mid);
    transfer::prolong(mid, fine);

    Function expected(h->space_ptr(2));
    expected.interpolate(square);
    ASSERT_EQ(fine.num_dofs(), 81);
    for (GlobalIndex i = 0; i < fine.num_dofs(); ++i) {
        EXPECT_NEAR(fine[i], expected[i], 1e-9) << "DOF " << i;
    }
}

TEST(Prolong, PiecewiseConstantStaysConstant) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square(4, 4)), 2);
    auto h = FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, 0);

    Function coarse(h->space_ptr(0));
    Function mid(h->space_ptr(1));
    Function fine(h->space_ptr(2));
    coarse.interpolate([](const PhysicalPoint&) { return 1.0; });
    mid.fill(-3.0);
    fine.fill(-3.0);
    transfer::prolong(coarse, mid);
    transfer::prolong(mid, fine);

    EXPECT_EQ(mid.num_dofs(), 128);
    ASSERT_EQ(fine.num_dofs(), 512);
    for (Real v : fine.values()) {
        EXPECT_EQ(v, 1.0);
    }
}

// Only level 0 is seeded; every finer level is reached by prolongation alone
TEST(Prolong, ChainedFromCoarsestLevel) {
    for (int per_level = 1; per_level <= 3; ++per_level) {
        auto line = MeshHierarchy::build(share(MeshBuilders::unit_interval(4)), 2, per_level);
        auto square = MeshHierarchy::build(share(MeshBuilders::unit_square(4, 4)), per_level == 1 ? 2 : 1,
                                           per_level);
        for (const auto& meshes : {line, square}) {
            for (int p = 1; p <= 3; ++p) {
                expect_chained_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, p), p);
                expect_chained_exact(VectorFunctionSpaceHierarchy::build(meshes, ElementFamily::CG, p, 2), p);
            }
            for (int p = 0; p <= 3; ++p) {
                expect_chained_exact(FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, p), p);
                expect_chained_exact(VectorFunctionSpaceHierarchy::build(meshes, ElementFamily::DG, p, 2), p);
            }
        }
    }
}

TEST(Prolong, ChainedOnExtrudedHierarchies) {
    for (int per_level = 1; per_level <= 2; ++per_level) {
        auto intervals = MeshHierarchy::build(share(MeshBuilders::unit_interval(4)), 2, per_level);
        auto quads = MeshHierarchy::build(share(MeshBuilders::unit_square_quads(2, 2)), 1, per_level);
        for (const auto& base : {intervals, quads}) {
            auto layered = ExtrudedMeshHierarchy::build(base, 3);
            for (int p = 1; p <= 2; ++p) {
                expect_chained_exact(FunctionSpaceHierarchy::build(layered, ElementFamily::CG, p), p);
                expect_chained_exact(VectorFunctionSpaceHierarchy::build(layered, ElementFamily::CG, p), p);
            }
            for (int p = 0; p <= 2; ++p) {
                expect_chained_exact(FunctionSpaceHierarchy::build(layered, ElementFamily::DG, p), p);
                expect_chained_exact(VectorFunctionSpaceHierarchy::build(layered, ElementFamily::DG, p), p);
            }
        }
    }
}

// ============================================================================
// Vector and mixed fields
// ============================================================================

TEST(Prolong, VectorFieldIsExact) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2)), 1);
    auto h = VectorFunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 2);
    ASSERT_EQ(h->element().value_size, 2);

    auto field = [](const PhysicalPoint& x) -> std::vector<Real> {
        return {x[0] * x[0], x[0] * x[1] - 1.0};
    };
    Function coarse(h->space_ptr(0));
    Function fine(h->space_ptr(1));
    Function expected(h->space_ptr(1));
    coarse.interpolate(field);
    expected.interpolate(field);
    transfer::prolong(coarse, fine);
    EXPECT_LT(max_difference(fine.values(), expected.values()), 1e-12);
}

TEST(Prolong, ComponentsAreIndependent) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square_quads(2, 2)), 1);
    auto vec = VectorFunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 2);
    auto scalar = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 2);

    Function coarse(vec->space_ptr(0));
    fill_random(coarse, 7);
    Function coarse_x(scalar->space_ptr(0));
    for (GlobalIndex n = 0; n < coarse_x.num_dofs(); ++n) {
        coarse_x[n] = coarse[2 * n];
        coarse[2 * n + 1] = 0.0;
    }

    Function fine(vec->space_ptr(1));
    Function fine_x(scalar->space_ptr(1));
    transfer::prolong(coarse, fine);
    transfer::prolong(coarse_x, fine_x);

    for (GlobalIndex n = 0; n < fine_x.num_dofs(); ++n) {
        EXPECT_EQ(fine[2 * n], fine_x[n]);
        EXPECT_EQ(fine[2 * n + 1], 0.0);
    }
}

TEST(Prolong, MixedFieldIsExact) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2)), 2);
    auto h = MixedFunctionSpaceHierarchy::build(
        meshes, {ElementDescriptor::vector(ElementFamily::CG, 2, 2),
                 ElementDescriptor::scalar(ElementFamily::CG, 1)});

    auto field = [](const PhysicalPoint& x) -> std::vector<Real> {
        return {x[0] * x[1], x[0] * x[0], x[0] + x[1]};
    };
    for (std::size_t level = 1; level < h->num_levels(); ++level) {
        MixedFunction coarse(h->space_ptr(level - 1));
        MixedFunction fine(h->space_ptr(level));
        MixedFunction expected(h->space_ptr(level));
        coarse.interpolate(field);
        expected.interpolate(field);

        const TransferReport report = transfer::prolong(coarse, fine);
        EXPECT_EQ(report.dofs_written, fine.num_dofs());
        EXPECT_LT(max_difference(fine.values(), expected.values()), 1e-12);
    }
}

TEST(Prolong, MixedMatchesComponentwise) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(3)), 1);
    auto h = MixedFunctionSpaceHierarchy::build(
        meshes, {ElementDescriptor::scalar(ElementFamily::DG, 1),
                 ElementDescriptor::scalar(ElementFamily::CG, 3)});

    MixedFunction coarse(h->space_ptr(0));
    fill_random(coarse.sub(0), 1);
    fill_random(coarse.sub(1), 2);
    MixedFunction fine(h->space_ptr(1));
    transfer::prolong(coarse, fine);

    for (std::size_t i = 0; i < 2; ++i) {
        Function expected(h->component(i).space_ptr(1));
        transfer::prolong(coarse.sub(i), expected);
        EXPECT_EQ(max_difference(fine.sub(i).values(), expected.values()), 0.0);
    }
}

// ============================================================================
// Composition and adjoints
// ============================================================================

TEST(Prolong, CompositeStepMatchesRepeatedSteps) {
    auto base = share(MeshBuilders::unit_square(2, 1));
    auto single = FunctionSpaceHierarchy::build(MeshHierarchy::build(base, 2), ElementFamily::CG, 2);
    auto doubled = FunctionSpaceHierarchy::build(MeshHierarchy::build(base, 1, 2), ElementFamily::CG, 2);

    Function c_single(single->space_ptr(0));
    fill_random(c_single, 11);
    Function c_doubled(doubled->space_ptr(0));
    c_doubled.set_values(c_single.values());

    Function mid(single->space_ptr(1));
    Function f_single(single->space_ptr(2));
    transfer::prolong(c_single, mid);
    transfer::prolong(mid, f_single);

    Function f_doubled(doubled->space_ptr(1));
    transfer::prolong(c_doubled, f_doubled);

    EXPECT_LT(max_difference(f_single.values(), f_doubled.values()), 1e-13);
}

TEST(Restrict, IsTransposeOfProlong) {
    auto check = [](const HierarchyPtr& h) {
        Function c(h->space_ptr(0));
        Function f(h->space_ptr(1));
        fill_random(c, 3);
        fill_random(f, 5);

        Function pc(h->space_ptr(1));
        Function rf(h->space_ptr(0));
        transfer::prolong(c, pc);
        const TransferReport report = transfer::restrict(f, rf);
        EXPECT_EQ(report.dofs_written, rf.num_dofs());

        const Real lhs = dot(pc.values(), f.values());
        const Real rhs = dot(c.values(), rf.values());
        EXPECT_NEAR(lhs, rhs, 1e-11 * std::max(Real(1), std::abs(lhs))) << h->summary();
    };

    auto tri = MeshHierarchy::build(share(MeshBuilders::unit_square(3, 2)), 1);
    check(FunctionSpaceHierarchy::build(tri, ElementFamily::CG, 2));
    check(FunctionSpaceHierarchy::build(tri, ElementFamily::DG, 1));
    check(VectorFunctionSpaceHierarchy::build(tri, ElementFamily::CG, 1));

    auto layered = ExtrudedMeshHierarchy::build(MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 1), 2);
    check(FunctionSpaceHierarchy::build(layered, ElementFamily::CG, 2));
}

TEST(Restrict, MixedRestrictsEachComponent) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 1);
    auto h = MixedFunctionSpaceHierarchy::build(
        meshes, {ElementDescriptor::scalar(ElementFamily::CG, 1),
                 ElementDescriptor::vector(ElementFamily::DG, 0, 2)});

    MixedFunction fine(h->space_ptr(1));
    fill_random(fine.sub(0), 8);
    fill_random(fine.sub(1), 9);
    MixedFunction coarse(h->space_ptr(0));
    transfer::restrict(fine, coarse);

    for (std::size_t i = 0; i < 2; ++i) {
        Function expected(h->component(i).space_ptr(0));
        transfer::restrict(fine.sub(i), expected);
        EXPECT_EQ(max_difference(coarse.sub(i).values(), expected.values()), 0.0);
    }
}

TEST(Inject, RecoversProlongedFunctions) {
    auto check = [](const HierarchyPtr& h) {
        Function c(h->space_ptr(0));
        fill_random(c, 13);
        Function f(h->space_ptr(1));
        transfer::prolong(c, f);

        Function back(h->space_ptr(0));
        const TransferReport report = transfer::inject(f, back);
        EXPECT_EQ(report.dofs_written, back.num_dofs());
        EXPECT_LT(max_difference(back.values(), c.values()), 1e-12) << h->summary();
    };

    auto line = MeshHierarchy::build(share(MeshBuilders::unit_interval(3)), 1);
    check(FunctionSpaceHierarchy::build(line, ElementFamily::CG, 3));
    check(FunctionSpaceHierarchy::build(line, ElementFamily::DG, 2));

    auto tri = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2)), 1);
    check(FunctionSpaceHierarchy::build(tri, ElementFamily::CG, 2));
    check(FunctionSpaceHierarchy::build(tri, ElementFamily::DG, 0));
    check(VectorFunctionSpaceHierarchy::build(tri, ElementFamily::DG, 1));

    auto quads = MeshHierarchy::build(share(MeshBuilders::unit_square_quads(2, 2)), 1, 2);
    check(FunctionSpaceHierarchy::build(quads, ElementFamily::CG, 2));

    auto prisms = ExtrudedMeshHierarchy::build(
        MeshHierarchy::build(share(MeshBuilders::unit_square(1, 1)), 1), 2);
    check(FunctionSpaceHierarchy::build(prisms, ElementFamily::CG, 1));
}

TEST(Inject, MixedInjectsEachComponent) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square_quads(1, 2)), 1);
    auto h = MixedFunctionSpaceHierarchy::build(
        meshes, {ElementDescriptor::vector(ElementFamily::CG, 2, 2),
                 ElementDescriptor::scalar(ElementFamily::DG, 1)});

    MixedFunction coarse(h->space_ptr(0));
    coarse.interpolate([](const PhysicalPoint& x) -> std::vector<Real> {
        return {x[0] * x[1], 1.0 - x[1], 2.0 * x[0]};
    });
    MixedFunction fine(h->space_ptr(1));
    transfer::prolong(coarse, fine);

    MixedFunction back(h->space_ptr(0));
    transfer::inject(fine, back);
    EXPECT_LT(max_difference(back.values(), coarse.values()), 1e-12);
}

// ============================================================================
// Continuity report
// ============================================================================

TEST(Prolong, ContinuityCheckFindsNoMismatch) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_square(2, 2, mgfem::SquareDiagonal::Left)), 2);
    auto h = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 3);

    TransferOptions options;
    options.check_continuity = true;

    Function coarse(h->space_ptr(0));
    fill_random(coarse, 17);
    Function fine(h->space_ptr(1));
    const TransferReport report = transfer::prolong(coarse, fine, options);

    EXPECT_EQ(report.dofs_written, fine.num_dofs());
    EXPECT_EQ(report.continuity_mismatches, 0);
    EXPECT_LT(report.max_mismatch, 1e-12);

    // Unshared DG nodes have no second evaluation to compare
    auto dg = FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, 2);
    Function dg_coarse(dg->space_ptr(0));
    fill_random(dg_coarse, 19);
    Function dg_fine(dg->space_ptr(1));
    const TransferReport dg_report = transfer::prolong(dg_coarse, dg_fine, options);
    EXPECT_EQ(dg_report.continuity_mismatches, 0);
    EXPECT_EQ(dg_report.max_mismatch, 0.0);
}

TEST(Prolong, RejectsInvalidContinuityTolerance) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 1);
    auto h = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 2);
    Function coarse(h->space_ptr(0));
    coarse.fill(1.0);
    Function fine(h->space_ptr(1));
    fine.fill(4.0);

    TransferOptions options;
    options.check_continuity = true;
    options.continuity_tolerance = -1.0;
    EXPECT_THROW(transfer::prolong(coarse, fine, options), InvalidArgumentException);
    options.continuity_tolerance = std::numeric_limits<Real>::quiet_NaN();
    EXPECT_THROW(transfer::prolong(coarse, fine, options), InvalidArgumentException);
    for (Real v : fine.values()) {
        EXPECT_EQ(v, 4.0);
    }

    options.continuity_tolerance = 0.0;
    EXPECT_NO_THROW(transfer::prolong(coarse, fine, options));
}

TEST(ContinuityAudit, CountsEachDofOnce) {
    ContinuityAudit audit(5, 1e-8);
    audit.observe(1, 1e-3);
    audit.observe(1, 2e-3);
    audit.observe(3, 5e-9);
    audit.observe(4, 0.5);
    EXPECT_EQ(audit.mismatches(), 2);
    EXPECT_EQ(audit.max_difference(), 0.5);

    EXPECT_THROW(audit.observe(5, 1.0), InvalidArgumentException);
    EXPECT_THROW(ContinuityAudit(5, -1.0), InvalidArgumentException);
}

TEST(ContinuityAudit, MismatchesReachReportAndLog) {
    WarningCapture capture;

    ContinuityAudit audit(81, 1e-10);
    for (GlobalIndex dof = 0; dof < 3; ++dof) {
        audit.observe(dof, 2.5e-7);
        audit.observe(dof, 1e-12);
    }
    audit.observe(10, 1e-12);

    TransferReport report;
    report.dofs_written = 81;
    audit.finish(2, report);
    EXPECT_EQ(report.dofs_written, 81);
    EXPECT_EQ(report.continuity_mismatches, 3);
    EXPECT_EQ(report.max_mismatch, 2.5e-7);

    ASSERT_EQ(capture.messages().size(), 1u);
    const std::string& msg = capture.messages().front();
    EXPECT_NE(msg.find("3 of 81 fine DOFs"), std::string::npos) << msg;
    EXPECT_NE(msg.find("level 2"), std::string::npos) << msg;
    EXPECT_NE(msg.find("2.500e-07"), std::string::npos) << msg;

    // A clean audit stays silent
    ContinuityAudit clean(4, 1e-10);
    clean.observe(0, 1e-14);
    TransferReport quiet;
    clean.finish(1, quiet);
    EXPECT_EQ(quiet.continuity_mismatches, 0);
    EXPECT_EQ(capture.messages().size(), 1u);
}

TEST(TransferReport, Accumulates) {
    TransferReport a;
    a.dofs_written = 4;
    a.continuity_mismatches = 1;
    a.max_mismatch = 0.5;
    TransferReport b;
    b.dofs_written = 6;
    b.max_mismatch = 0.25;
    a += b;
    EXPECT_EQ(a.dofs_written, 10);
    EXPECT_EQ(a.continuity_mismatches, 1);
    EXPECT_EQ(a.max_mismatch, 0.5);
}

// ============================================================================
// Rejected operands
// ============================================================================

TEST(LevelTransfer, RejectsNonAdjacentLevels) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 2);
    auto h = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 1);

    Function l0(h->space_ptr(0));
    Function l1(h->space_ptr(1));
    Function l2(h->space_ptr(2));
    l0.fill(1.0);
    l2.fill(7.0);

    EXPECT_THROW(transfer::prolong(l0, l2), ConfigurationException);
    EXPECT_THROW(transfer::prolong(l1, l0), ConfigurationException);
    EXPECT_THROW(transfer::restrict(l2, l0), ConfigurationException);
    EXPECT_THROW(transfer::inject(l1, l1), ConfigurationException);

    // Rejected calls leave the output untouched
    for (Real v : l2.values()) {
        EXPECT_EQ(v, 7.0);
    }
}

TEST(LevelTransfer, RejectsDifferentHierarchies) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 1);
    auto a = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 1);
    auto b = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 1);
    auto c = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 2);

    Function coarse(a->space_ptr(0));
    Function fine_b(b->space_ptr(1));
    Function fine_c(c->space_ptr(1));
    EXPECT_THROW(transfer::prolong(coarse, fine_b), ConfigurationException);
    EXPECT_THROW(transfer::prolong(coarse, fine_c), ConfigurationException);
    EXPECT_THROW(transfer::inject(fine_c, coarse), ConfigurationException);
}

TEST(LevelTransfer, RejectsSpacesWithoutHierarchy) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 1);
    auto h = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 1);

    auto standalone = std::make_shared<const FunctionSpace>(
        meshes->mesh_ptr(1), ElementDescriptor::scalar(ElementFamily::CG, 1));
    Function coarse(h->space_ptr(0));
    Function orphan(standalone);
    EXPECT_THROW(transfer::prolong(coarse, orphan), ConfigurationException);

    // Spaces outliving their hierarchy cannot be transferred either
    Function fine(h->space_ptr(1));
    h.reset();
    EXPECT_FALSE(fine.space().hierarchy());
    EXPECT_THROW(transfer::prolong(coarse, fine), ConfigurationException);
}

TEST(LevelTransfer, MixedRejectionLeavesEveryComponentUntouched) {
    auto meshes = MeshHierarchy::build(share(MeshBuilders::unit_interval(2)), 1);
    auto a = FunctionSpaceHierarchy::build(meshes, ElementFamily::CG, 1);
    auto b = FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, 0);
    auto other = FunctionSpaceHierarchy::build(meshes, ElementFamily::DG, 0);

    auto coarse_space = std::make_shared<MixedSpace>();
    coarse_space->add_component("a", a->space_ptr(0));
    coarse_space->add_component("b", b->space_ptr(0));
    auto fine_space = std::make_shared<MixedSpace>();
    fine_space->add_component("a", a->space_ptr(1));
    fine_space->add_component("b", other->space_ptr(1));

    MixedFunction coarse(coarse_space);
    coarse.sub(0).fill(1.0);
    MixedFunction fine(fine_space);
    fine.sub(0).fill(-2.0);
    fine.sub(1).fill(-2.0);

    // Component 0 is valid, component 1 belongs to another hierarchy
    EXPECT_THROW(transfer::prolong(coarse, fine), ConfigurationException);
    for (Real v : fine.values()) {
        EXPECT_EQ(v, -2.0);
    }

    auto short_space = std::make_shared<MixedSpace>();
    short_space->add_component("a", a->space_ptr(1));
    MixedFunction short_fine(short_space);
    EXPECT_THROW(transfer::prolong(coarse, short_fine), ConfigurationException);
}
