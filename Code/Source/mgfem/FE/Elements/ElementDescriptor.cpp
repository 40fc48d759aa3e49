/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "ElementDescriptor.h"
#include "Core/FEConfig.h"
#include "Core/FEException.h"

namespace mgfem {
namespace FE {
namespace elements {

const char* family_name(ElementFamily family) noexcept {
    switch (family) {
        case ElementFamily::CG: return "CG";
        case ElementFamily::DG: return "DG";
        default:                return "Unknown";
    }
}

ElementFamily parse_family(const std::string& name) {
    if (name == "CG" || name == "Lagrange" || name == "P" || name == "Q") {
        return ElementFamily::CG;
    }
    if (name == "DG" || name == "Discontinuous Lagrange" || name == "DP" || name == "DQ") {
        return ElementFamily::DG;
    }
    FE_THROW(ConfigurationException, "Unknown element family '" + name + "'");
}

void ElementDescriptor::validate() const {
    FE_CHECK_CONFIG(degree >= 0, "Element degree must be non-negative, got " +
                                     std::to_string(degree));
    FE_CHECK_CONFIG(degree <= config::MAX_POLYNOMIAL_ORDER,
                    "Element degree " + std::to_string(degree) + " exceeds the maximum " +
                        std::to_string(config::MAX_POLYNOMIAL_ORDER));
    FE_CHECK_CONFIG(family != ElementFamily::CG || degree >= 1,
                    "CG elements require degree >= 1");
    FE_CHECK_CONFIG(value_size >= 1 && value_size <= config::MAX_SPATIAL_DIM,
                    "Element value size must lie in [1, " +
                        std::to_string(config::MAX_SPATIAL_DIM) + "], got " +
                        std::to_string(value_size));
}

std::string ElementDescriptor::to_string() const {
    std::string s = std::string(family_name(family)) + std::to_string(degree);
    if (value_size > 1) {
        s += "^" + std::to_string(value_size);
    }
    return s;
}

} // namespace elements
} // namespace FE
} // namespace mgfem
