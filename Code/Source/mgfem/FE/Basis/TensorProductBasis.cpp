/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "TensorProductBasis.h"
#include <utility>

namespace mgfem {
namespace FE {
namespace basis {

namespace {

ElementType extruded_type(ElementType horizontal) {
    switch (horizontal) {
        case ElementType::Line2:     return ElementType::Quad4;
        case ElementType::Triangle3: return ElementType::Wedge6;
        case ElementType::Quad4:     return ElementType::Hex8;
        default:                     return ElementType::Unknown;
    }
}

} // namespace

TensorProductBasis::TensorProductBasis(std::shared_ptr<const BasisFunction> horizontal,
                                       std::shared_ptr<const BasisFunction> vertical)
    : horizontal_(std::move(horizontal)),
      vertical_(std::move(vertical)),
      element_type_(ElementType::Unknown) {
    FE_CHECK_NOT_NULL(horizontal_.get(), "TensorProductBasis: horizontal basis");
    FE_CHECK_NOT_NULL(vertical_.get(), "TensorProductBasis: vertical basis");
    FE_CHECK_ARG(vertical_->element_type() == ElementType::Line2,
                 "TensorProductBasis: vertical basis must live on a line");

    element_type_ = extruded_type(horizontal_->element_type());
    FE_THROW_IF(element_type_ == ElementType::Unknown, ConfigurationException,
                "TensorProductBasis: horizontal element cannot be extruded");

    const int hdim = horizontal_->dimension();
    for (const auto& zv : vertical_->nodes()) {
        for (const auto& xh : horizontal_->nodes()) {
            RefPoint p = xh;
            p[static_cast<std::size_t>(hdim)] = zv[0];
            nodes_.push_back(p);
        }
    }
}

void TensorProductBasis::evaluate_values(const RefPoint& xi,
                                         std::vector<Real>& values) const {
    const int hdim = horizontal_->dimension();

    RefPoint xh = xi;
    for (int d = hdim; d < 3; ++d) {
        xh[static_cast<std::size_t>(d)] = Real(0);
    }
    const RefPoint xv{xi[static_cast<std::size_t>(hdim)], Real(0), Real(0)};

    std::vector<Real> vh;
    std::vector<Real> vv;
    horizontal_->evaluate_values(xh, vh);
    vertical_->evaluate_values(xv, vv);

    values.assign(size(), Real(0));
    std::size_t idx = 0;
    for (std::size_t j = 0; j < vv.size(); ++j) {
        for (std::size_t i = 0; i < vh.size(); ++i) {
            values[idx++] = vh[i] * vv[j];
        }
    }
}

} // namespace basis
} // namespace FE
} // namespace mgfem
