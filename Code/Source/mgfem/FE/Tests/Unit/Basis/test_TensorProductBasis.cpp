/**
 * @file test_TensorProductBasis.cpp
 * @brief Unit tests for horizontal x vertical product bases on extruded cells
 */

#include <gtest/gtest.h>
#include "FE/Basis/LagrangeBasis.h"
#include "FE/Basis/TensorProductBasis.h"
#include "FE/Core/FEException.h"

#include <memory>
#include <numeric>
#include <vector>

using mgfem::FE::ElementType;
using mgfem::FE::FEException;
using mgfem::FE::Real;
using mgfem::FE::basis::LagrangeBasis;
using mgfem::FE::basis::RefPoint;
using mgfem::FE::basis::TensorProductBasis;

namespace {

std::shared_ptr<const LagrangeBasis> lagrange(ElementType type, int order) {
    return std::make_shared<LagrangeBasis>(type, order);
}

} // namespace

TEST(TensorProductBasis, ExtrudedElementTypes) {
    TensorProductBasis q(lagrange(ElementType::Line2, 1), lagrange(ElementType::Line2, 1));
    EXPECT_EQ(q.element_type(), ElementType::Quad4);
    EXPECT_EQ(q.dimension(), 2);

    TensorProductBasis w(lagrange(ElementType::Triangle3, 2), lagrange(ElementType::Line2, 2));
    EXPECT_EQ(w.element_type(), ElementType::Wedge6);
    EXPECT_EQ(w.dimension(), 3);
    EXPECT_EQ(w.size(), 18u);
    EXPECT_EQ(w.order(), 2);

    TensorProductBasis h(lagrange(ElementType::Quad4, 1), lagrange(ElementType::Line2, 1));
    EXPECT_EQ(h.element_type(), ElementType::Hex8);
    EXPECT_EQ(h.size(), 8u);
}

TEST(TensorProductBasis, NodesAreHorizontalFastest) {
    TensorProductBasis b(lagrange(ElementType::Line2, 2), lagrange(ElementType::Line2, 1));
    ASSERT_EQ(b.size(), 6u);
    for (std::size_t l = 0; l < b.size(); ++l) {
        const std::size_t i = b.horizontal_index(l);
        const std::size_t j = b.vertical_index(l);
        EXPECT_EQ(l, j * 3 + i);
        EXPECT_NEAR(b.nodes()[l][0], b.horizontal().nodes()[i][0], 1e-15);
        // Vertical coordinate follows the horizontal ones
        EXPECT_NEAR(b.nodes()[l][1], b.vertical().nodes()[j][0], 1e-15);
    }
}

TEST(TensorProductBasis, NodalAndPartitionOfUnity) {
    TensorProductBasis b(lagrange(ElementType::Triangle3, 2), lagrange(ElementType::Line2, 2));
    std::vector<Real> vals;
    for (std::size_t l = 0; l < b.size(); ++l) {
        b.evaluate_values(b.nodes()[l], vals);
        ASSERT_EQ(vals.size(), b.size());
        for (std::size_t m = 0; m < vals.size(); ++m) {
            EXPECT_NEAR(vals[m], l == m ? 1.0 : 0.0, 1e-12);
        }
    }

    b.evaluate_values(RefPoint{0.1, 0.25, -0.4}, vals);
    EXPECT_NEAR(std::accumulate(vals.begin(), vals.end(), 0.0), 1.0, 1e-12);
}

TEST(TensorProductBasis, ValuesFactorize) {
    TensorProductBasis b(lagrange(ElementType::Quad4, 2), lagrange(ElementType::Line2, 2));
    const RefPoint xi{0.3, -0.7, 0.45};

    std::vector<Real> full, hv, vv;
    b.evaluate_values(xi, full);
    b.horizontal().evaluate_values(RefPoint{xi[0], xi[1], 0.0}, hv);
    b.vertical().evaluate_values(RefPoint{xi[2], 0.0, 0.0}, vv);

    for (std::size_t l = 0; l < b.size(); ++l) {
        EXPECT_NEAR(full[l], hv[b.horizontal_index(l)] * vv[b.vertical_index(l)], 1e-14);
    }
}

TEST(TensorProductBasis, DegreeZeroIsConstant) {
    TensorProductBasis b(lagrange(ElementType::Triangle3, 0), lagrange(ElementType::Line2, 0));
    ASSERT_EQ(b.size(), 1u);
    std::vector<Real> vals;
    b.evaluate_values(RefPoint{0.2, 0.1, 0.9}, vals);
    EXPECT_NEAR(vals[0], 1.0, 1e-15);
}

TEST(TensorProductBasis, RejectsInvalidFactors) {
    EXPECT_THROW(TensorProductBasis(lagrange(ElementType::Line2, 1), lagrange(ElementType::Quad4, 1)),
                 FEException);
    EXPECT_THROW(TensorProductBasis(nullptr, lagrange(ElementType::Line2, 1)), FEException);

    auto prism = std::make_shared<TensorProductBasis>(lagrange(ElementType::Triangle3, 1),
                                                      lagrange(ElementType::Line2, 1));
    EXPECT_THROW(TensorProductBasis(prism, lagrange(ElementType::Line2, 1)), FEException);
}
