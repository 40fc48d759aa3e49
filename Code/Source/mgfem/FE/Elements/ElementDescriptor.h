/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_ELEMENTS_ELEMENTDESCRIPTOR_H
#define MGFEM_FE_ELEMENTS_ELEMENTDESCRIPTOR_H

/**
 * @file ElementDescriptor.h
 * @brief Family, degree and value size of a Lagrange element
 */

#include "Core/Types.h"
#include <string>

namespace mgfem {
namespace FE {
namespace elements {

/// Continuity family of a Lagrange element
enum class ElementFamily : std::uint8_t {
    CG,   ///< Continuous Galerkin: nodes shared at coincident entities
    DG    ///< Discontinuous Galerkin: nodes private to each cell
};

const char* family_name(ElementFamily family) noexcept;

/**
 * @brief Parse "CG" / "DG" (also "Lagrange" / "Discontinuous Lagrange")
 * @throws ConfigurationException for any other name
 */
ElementFamily parse_family(const std::string& name);

/**
 * @brief Element descriptor shared by all levels of a space hierarchy
 *
 * value_size is 1 for scalar elements and the number of components for
 * vector elements; every component uses the same scalar basis.
 */
struct ElementDescriptor {
    ElementFamily family = ElementFamily::CG;
    int degree = 1;
    int value_size = 1;

    static ElementDescriptor scalar(ElementFamily family, int degree) {
        return ElementDescriptor{family, degree, 1};
    }

    static ElementDescriptor vector(ElementFamily family, int degree, int components) {
        return ElementDescriptor{family, degree, components};
    }

    FieldType field_type() const noexcept {
        return value_size == 1 ? FieldType::Scalar : FieldType::Vector;
    }

    /**
     * @brief Check the family / degree / value size combination
     * @throws ConfigurationException if CG degree < 1, degree < 0,
     *         degree > MAX_POLYNOMIAL_ORDER or value_size < 1
     */
    void validate() const;

    /// e.g. "CG2", "DG0^2"
    std::string to_string() const;

    bool operator==(const ElementDescriptor& other) const noexcept {
        return family == other.family && degree == other.degree &&
               value_size == other.value_size;
    }
    bool operator!=(const ElementDescriptor& other) const noexcept { return !(*this == other); }
};

} // namespace elements
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_ELEMENTS_ELEMENTDESCRIPTOR_H
