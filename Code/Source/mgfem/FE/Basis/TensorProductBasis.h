/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_BASIS_TENSORPRODUCTBASIS_H
#define MGFEM_FE_BASIS_TENSORPRODUCTBASIS_H

/**
 * @file TensorProductBasis.h
 * @brief Product of a horizontal cell basis and a vertical line basis
 */

#include "BasisFunction.h"
#include <memory>

namespace mgfem {
namespace FE {
namespace basis {

/**
 * @brief Basis on an extruded cell (horizontal cell x [-1,1])
 *
 * Function (i, j) with horizontal index i and vertical index j has local
 * index j * n_horizontal + i. The vertical reference coordinate is stored
 * at component horizontal().dimension() of the reference point.
 *
 * Element types: Line2 -> Quad4, Triangle3 -> Wedge6, Quad4 -> Hex8.
 */
class TensorProductBasis : public BasisFunction {
public:
    TensorProductBasis(std::shared_ptr<const BasisFunction> horizontal,
                       std::shared_ptr<const BasisFunction> vertical);

    ElementType element_type() const noexcept override { return element_type_; }
    int dimension() const noexcept override { return horizontal_->dimension() + 1; }
    int order() const noexcept override { return horizontal_->order(); }
    std::size_t size() const noexcept override { return nodes_.size(); }

    const std::vector<RefPoint>& nodes() const noexcept override { return nodes_; }

    void evaluate_values(const RefPoint& xi,
                         std::vector<Real>& values) const override;

    const BasisFunction& horizontal() const noexcept { return *horizontal_; }
    const BasisFunction& vertical() const noexcept { return *vertical_; }

    std::size_t horizontal_index(std::size_t local) const noexcept { return local % horizontal_->size(); }
    std::size_t vertical_index(std::size_t local) const noexcept { return local / horizontal_->size(); }

private:
    std::shared_ptr<const BasisFunction> horizontal_;
    std::shared_ptr<const BasisFunction> vertical_;
    ElementType element_type_;
    std::vector<RefPoint> nodes_;
};

} // namespace basis
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_BASIS_TENSORPRODUCTBASIS_H
