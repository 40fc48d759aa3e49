/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_BASIS_LAGRANGEBASIS_H
#define MGFEM_FE_BASIS_LAGRANGEBASIS_H

/**
 * @file LagrangeBasis.h
 * @brief Equispaced nodal Lagrange basis on lines, triangles and quads
 */

#include "BasisFunction.h"

namespace mgfem {
namespace FE {
namespace basis {

/**
 * @brief Nodal Lagrange basis of arbitrary order on Line2, Triangle3 and Quad4
 *
 * Node layout:
 * - Line: p+1 equispaced nodes on [-1,1], ascending.
 * - Quad: tensor product of the line nodes, x running fastest.
 * - Triangle: barycentric lattice (j/p, k/p) for i + j + k = p, i outermost.
 *
 * Order 0 places a single node at the reference centroid.
 */
class LagrangeBasis : public BasisFunction {
public:
    LagrangeBasis(ElementType type, int order);

    ElementType element_type() const noexcept override { return element_type_; }
    int dimension() const noexcept override { return dimension_; }
    int order() const noexcept override { return order_; }
    std::size_t size() const noexcept override { return nodes_.size(); }

    const std::vector<RefPoint>& nodes() const noexcept override { return nodes_; }

    void evaluate_values(const RefPoint& xi,
                         std::vector<Real>& values) const override;

private:
    ElementType element_type_;
    int dimension_;
    int order_;

    // Integer node coordinates: (i, j) on the line grid for lines and quads,
    // barycentric multi-index for triangles
    std::vector<std::array<int, 3>> lattice_;
    std::vector<RefPoint> nodes_;
};

} // namespace basis
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_BASIS_LAGRANGEBASIS_H
