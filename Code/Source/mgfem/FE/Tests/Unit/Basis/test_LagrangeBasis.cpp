/**
 * @file test_LagrangeBasis.cpp
 * @brief Unit tests for nodal Lagrange bases on lines, triangles and quads
 */

#include <gtest/gtest.h>
#include "FE/Basis/LagrangeBasis.h"
#include "FE/Core/FEException.h"

#include <cmath>
#include <numeric>
#include <vector>

using mgfem::FE::ElementType;
using mgfem::FE::FEException;
using mgfem::FE::FEStatus;
using mgfem::FE::Real;
using mgfem::FE::basis::LagrangeBasis;
using mgfem::FE::basis::RefPoint;

namespace {

void expect_nodal(ElementType type, int order) {
    LagrangeBasis basis(type, order);
    const auto& nodes = basis.nodes();
    ASSERT_EQ(nodes.size(), basis.size());

    std::vector<Real> vals;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        basis.evaluate_values(nodes[i], vals);
        ASSERT_EQ(vals.size(), nodes.size());
        for (std::size_t j = 0; j < vals.size(); ++j) {
            const double expected = (i == j) ? 1.0 : 0.0;
            EXPECT_NEAR(vals[j], expected, 1e-12) << "order " << order << " node " << i;
        }
    }
}

// Interpolate f at the nodes and compare the expansion at xi against f(xi)
template <typename F>
Real interpolation_error(const LagrangeBasis& basis, F f, const RefPoint& xi) {
    std::vector<Real> vals;
    basis.evaluate_values(xi, vals);
    Real u = 0.0;
    for (std::size_t i = 0; i < vals.size(); ++i) {
        u += vals[i] * f(basis.nodes()[i]);
    }
    return std::abs(u - f(xi));
}

} // namespace

TEST(LagrangeBasis, SizeFormulasPerElement) {
    for (int order = 0; order <= 4; ++order) {
        const std::size_t p = static_cast<std::size_t>(order);
        EXPECT_EQ(LagrangeBasis(ElementType::Line2, order).size(), p + 1);
        EXPECT_EQ(LagrangeBasis(ElementType::Triangle3, order).size(), (p + 1) * (p + 2) / 2);
        EXPECT_EQ(LagrangeBasis(ElementType::Quad4, order).size(), (p + 1) * (p + 1));
    }
}

TEST(LagrangeBasis, NodalityOnAllCells) {
    for (int order = 0; order <= 4; ++order) {
        expect_nodal(ElementType::Line2, order);
        expect_nodal(ElementType::Triangle3, order);
        expect_nodal(ElementType::Quad4, order);
    }
}

TEST(LagrangeBasis, PartitionOfUnity) {
    const RefPoint xi_line{0.37, 0.0, 0.0};
    const RefPoint xi_tri{0.2, 0.3, 0.0};
    const RefPoint xi_quad{0.2, -0.3, 0.0};
    std::vector<Real> values;
    for (int order = 0; order <= 5; ++order) {
        LagrangeBasis(ElementType::Line2, order).evaluate_values(xi_line, values);
        EXPECT_NEAR(std::accumulate(values.begin(), values.end(), 0.0), 1.0, 1e-12);
        LagrangeBasis(ElementType::Triangle3, order).evaluate_values(xi_tri, values);
        EXPECT_NEAR(std::accumulate(values.begin(), values.end(), 0.0), 1.0, 1e-12);
        LagrangeBasis(ElementType::Quad4, order).evaluate_values(xi_quad, values);
        EXPECT_NEAR(std::accumulate(values.begin(), values.end(), 0.0), 1.0, 1e-12);
    }
}

TEST(LagrangeBasis, NodeLayout) {
    LagrangeBasis line(ElementType::Line2, 2);
    EXPECT_NEAR(line.nodes()[0][0], -1.0, 1e-15);
    EXPECT_NEAR(line.nodes()[1][0], 0.0, 1e-15);
    EXPECT_NEAR(line.nodes()[2][0], 1.0, 1e-15);

    LagrangeBasis quad(ElementType::Quad4, 1);
    // x runs fastest
    EXPECT_NEAR(quad.nodes()[1][0], 1.0, 1e-15);
    EXPECT_NEAR(quad.nodes()[1][1], -1.0, 1e-15);
    EXPECT_NEAR(quad.nodes()[2][0], -1.0, 1e-15);
    EXPECT_NEAR(quad.nodes()[2][1], 1.0, 1e-15);

    // Degree 0 nodes sit at the centroid
    EXPECT_NEAR(LagrangeBasis(ElementType::Line2, 0).nodes()[0][0], 0.0, 1e-15);
    const auto c = LagrangeBasis(ElementType::Triangle3, 0).nodes()[0];
    EXPECT_NEAR(c[0], 1.0 / 3.0, 1e-15);
    EXPECT_NEAR(c[1], 1.0 / 3.0, 1e-15);

    // Triangle nodes live on the barycentric grid
    LagrangeBasis tri(ElementType::Triangle3, 3);
    for (const auto& x : tri.nodes()) {
        EXPECT_GE(x[0], -1e-15);
        EXPECT_GE(x[1], -1e-15);
        EXPECT_LE(x[0] + x[1], 1.0 + 1e-15);
        EXPECT_NEAR(x[0] * 3.0, std::round(x[0] * 3.0), 1e-12);
        EXPECT_NEAR(x[1] * 3.0, std::round(x[1] * 3.0), 1e-12);
    }
}

TEST(LagrangeBasis, ReproducesPolynomialsOfItsDegree) {
    auto cubic_1d = [](const RefPoint& x) { return 1.0 - 2.0 * x[0] + 0.5 * x[0] * x[0] * x[0]; };
    EXPECT_LT(interpolation_error(LagrangeBasis(ElementType::Line2, 3), cubic_1d, {0.31, 0.0, 0.0}), 1e-12);

    auto quad_2d = [](const RefPoint& x) { return x[0] * x[0] + 3.0 * x[0] * x[1] - x[1] + 2.0; };
    EXPECT_LT(interpolation_error(LagrangeBasis(ElementType::Triangle3, 2), quad_2d, {0.15, 0.6, 0.0}), 1e-12);
    EXPECT_LT(interpolation_error(LagrangeBasis(ElementType::Quad4, 2), quad_2d, {-0.4, 0.7, 0.0}), 1e-12);

    // Bilinear is in Q1 but not P1
    auto bilinear = [](const RefPoint& x) { return x[0] * x[1]; };
    EXPECT_LT(interpolation_error(LagrangeBasis(ElementType::Quad4, 1), bilinear, {0.3, 0.6, 0.0}), 1e-14);
}

TEST(LagrangeBasis, RejectsInvalidConfiguration) {
    EXPECT_THROW(LagrangeBasis(ElementType::Line2, -1), FEException);
    EXPECT_THROW(LagrangeBasis(ElementType::Quad4, 11), FEException);

    try {
        LagrangeBasis basis(ElementType::Tetra4, 1);
        FAIL() << "expected an exception for Tetra4";
    } catch (const FEException& e) {
        EXPECT_EQ(e.status(), FEStatus::ConfigurationError);
    }

    try {
        LagrangeBasis basis(ElementType::Line2, -2);
        FAIL() << "expected an exception for a negative order";
    } catch (const FEException& e) {
        EXPECT_EQ(e.status(), FEStatus::InvalidArgument);
    }
}

TEST(LagrangeBasis, Metadata) {
    LagrangeBasis tri(ElementType::Triangle3, 2);
    EXPECT_EQ(tri.element_type(), ElementType::Triangle3);
    EXPECT_EQ(tri.dimension(), 2);
    EXPECT_EQ(tri.order(), 2);

    LagrangeBasis line(ElementType::Line2, 3);
    EXPECT_EQ(line.dimension(), 1);
}
