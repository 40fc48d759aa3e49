/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_BASIS_BASISFUNCTION_H
#define MGFEM_FE_BASIS_BASISFUNCTION_H

/**
 * @file BasisFunction.h
 * @brief Abstract interface for nodal basis evaluation on reference elements
 *
 * The Basis module operates purely on reference elements and is independent of
 * mesh-specific data structures. Implementations must not read mesh
 * connectivity or geometry.
 */

#include "Core/Types.h"
#include "Core/FEException.h"
#include <array>
#include <vector>

namespace mgfem {
namespace FE {
namespace basis {

using RefPoint = std::array<Real, 3>;

/**
 * @brief Base interface for nodal scalar basis families
 *
 * Every basis function is associated with one reference node; the value of
 * function i at node j is the Kronecker delta. Reference points always carry
 * three components, unused entries are ignored.
 */
class BasisFunction {
public:
    virtual ~BasisFunction() = default;

    /// Underlying element type on the reference domain
    virtual ElementType element_type() const noexcept = 0;

    /// Reference dimensionality (1, 2, or 3)
    virtual int dimension() const noexcept = 0;

    /// Polynomial order
    virtual int order() const noexcept = 0;

    /// Number of basis functions
    virtual std::size_t size() const noexcept = 0;

    /// Reference coordinates of the nodes, in basis order
    virtual const std::vector<RefPoint>& nodes() const noexcept = 0;

    /**
     * @brief Evaluate basis values at a reference point
     * @param xi Reference coordinates (unused entries are ignored)
     * @param[out] values Output array resized to size()
     */
    virtual void evaluate_values(const RefPoint& xi,
                                 std::vector<Real>& values) const = 0;
};

} // namespace basis
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_BASIS_BASISFUNCTION_H
