/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "LagrangeBasis.h"
#include "Core/FEConfig.h"

#include <string>

namespace mgfem {
namespace FE {
namespace basis {

namespace {

// Lagrange polynomials through the p+1 equispaced points of [-1,1]
void line_factors(int p, Real x, std::vector<Real>& f) {
    f.assign(static_cast<std::size_t>(p + 1), Real(1));
    if (p == 0) {
        return;
    }
    const Real h = Real(2) / static_cast<Real>(p);
    for (int a = 0; a <= p; ++a) {
        const Real xa = Real(-1) + h * static_cast<Real>(a);
        for (int b = 0; b <= p; ++b) {
            if (b != a) {
                const Real xb = Real(-1) + h * static_cast<Real>(b);
                f[static_cast<std::size_t>(a)] *= (x - xb) / (xa - xb);
            }
        }
    }
}

// f[a] = prod_{m<a} (p*lambda - m) / (a - m), which is 1 at lambda = a/p and
// vanishes at lambda = m/p for m < a
void barycentric_factors(int p, Real lambda, std::vector<Real>& f) {
    f.assign(static_cast<std::size_t>(p + 1), Real(1));
    const Real t = static_cast<Real>(p) * lambda;
    for (int a = 1; a <= p; ++a) {
        f[static_cast<std::size_t>(a)] =
            f[static_cast<std::size_t>(a - 1)] * (t - static_cast<Real>(a - 1)) / static_cast<Real>(a);
    }
}

Real line_node(int i, int p) {
    return p == 0 ? Real(0) : Real(-1) + Real(2) * static_cast<Real>(i) / static_cast<Real>(p);
}

} // namespace

LagrangeBasis::LagrangeBasis(ElementType type, int order)
    : element_type_(type), dimension_(0), order_(order) {
    FE_CHECK_ARG(order_ >= 0 && order_ <= config::MAX_POLYNOMIAL_ORDER,
                 "LagrangeBasis order must lie in [0, " +
                     std::to_string(config::MAX_POLYNOMIAL_ORDER) + "]");

    const int p = order_;
    switch (element_type_) {
        case ElementType::Line2:
            dimension_ = 1;
            for (int i = 0; i <= p; ++i) {
                lattice_.push_back({i, 0, 0});
                nodes_.push_back(RefPoint{line_node(i, p), Real(0), Real(0)});
            }
            break;
        case ElementType::Quad4:
            dimension_ = 2;
            for (int j = 0; j <= p; ++j) {
                for (int i = 0; i <= p; ++i) {
                    lattice_.push_back({i, j, 0});
                    nodes_.push_back(RefPoint{line_node(i, p), line_node(j, p), Real(0)});
                }
            }
            break;
        case ElementType::Triangle3:
            dimension_ = 2;
            if (p == 0) {
                lattice_.push_back({0, 0, 0});
                nodes_.push_back(RefPoint{Real(1) / Real(3), Real(1) / Real(3), Real(0)});
                break;
            }
            // Barycentric multi-index (i, j, k) on (1 - x - y, x, y)
            for (int i = 0; i <= p; ++i) {
                for (int j = 0; j <= p - i; ++j) {
                    const int k = p - i - j;
                    lattice_.push_back({i, j, k});
                    nodes_.push_back(RefPoint{static_cast<Real>(j) / static_cast<Real>(p),
                                              static_cast<Real>(k) / static_cast<Real>(p),
                                              Real(0)});
                }
            }
            break;
        default:
            FE_THROW(ConfigurationException,
                     "LagrangeBasis supports Line2, Triangle3 and Quad4 reference cells");
    }
}

void LagrangeBasis::evaluate_values(const RefPoint& xi,
                                    std::vector<Real>& values) const {
    values.resize(nodes_.size());
    std::vector<Real> f0, f1, f2;

    if (element_type_ == ElementType::Triangle3) {
        barycentric_factors(order_, Real(1) - xi[0] - xi[1], f0);
        barycentric_factors(order_, xi[0], f1);
        barycentric_factors(order_, xi[1], f2);
        for (std::size_t n = 0; n < lattice_.size(); ++n) {
            const auto& m = lattice_[n];
            values[n] = f0[static_cast<std::size_t>(m[0])] *
                        f1[static_cast<std::size_t>(m[1])] *
                        f2[static_cast<std::size_t>(m[2])];
        }
        return;
    }

    line_factors(order_, xi[0], f0);
    if (dimension_ == 2) {
        line_factors(order_, xi[1], f1);
    }
    for (std::size_t n = 0; n < lattice_.size(); ++n) {
        const auto& m = lattice_[n];
        Real v = f0[static_cast<std::size_t>(m[0])];
        if (dimension_ == 2) {
            v *= f1[static_cast<std::size_t>(m[1])];
        }
        values[n] = v;
    }
}

} // namespace basis
} // namespace FE
} // namespace mgfem
