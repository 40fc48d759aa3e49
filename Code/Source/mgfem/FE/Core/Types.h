/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */
#ifndef MGFEM_FE_TYPES_H
#define MGFEM_FE_TYPES_H

/**
 * @file Types.h
 * @brief Index, element and status types shared by the FE library
 *
 * Scalar and index widths follow the Mesh library so that cell and vertex
 * indices pass between the two without conversion.
 */

#include "Mesh/Core/MeshTypes.h"

#include <array>
#include <cstdint>
#include <limits>

namespace mgfem {
namespace FE {

/// Local node or DOF number within one cell
using LocalIndex = std::uint32_t;

/// Global DOF number within one function space
using GlobalIndex = std::int64_t;

using Real = mgfem::real_t;

constexpr LocalIndex INVALID_LOCAL_INDEX = std::numeric_limits<LocalIndex>::max();
constexpr GlobalIndex INVALID_GLOBAL_INDEX = -1;

/**
 * @brief Reference cells a Lagrange basis can live on
 *
 * The node counts in the names are those of the linear element. Wedge6 and
 * Hex8 only arise as tensor products of a base cell with an interval.
 */
enum class ElementType : std::uint8_t {
    Line2      = 0,
    Triangle3  = 1,
    Quad4      = 2,
    Tetra4     = 3,
    Hex8       = 4,
    Wedge6     = 5,
    Unknown    = 255
};

enum class FieldType : std::uint8_t {
    Scalar,
    Vector,
    Mixed
};

/// Carried by every FEException
enum class FEStatus : std::uint8_t {
    Success              = 0,
    InvalidArgument      = 1,
    ConfigurationError   = 2,
    GeometricConsistency = 3,
    DofError             = 4,
    Unknown              = 255
};

/// Physical coordinates, padded to three components
using PhysicalPoint = std::array<Real, 3>;

/// Linear element type on a mesh cell family (Unknown if there is none)
constexpr ElementType from_mesh_family(mgfem::CellFamily family) noexcept {
    switch(family) {
        case mgfem::CellFamily::Line:     return ElementType::Line2;
        case mgfem::CellFamily::Triangle: return ElementType::Triangle3;
        case mgfem::CellFamily::Quad:     return ElementType::Quad4;
        case mgfem::CellFamily::Tetra:    return ElementType::Tetra4;
        case mgfem::CellFamily::Hex:      return ElementType::Hex8;
        case mgfem::CellFamily::Wedge:    return ElementType::Wedge6;
        default:                          return ElementType::Unknown;
    }
}

inline const char* status_to_string(FEStatus status) noexcept {
    switch(status) {
        case FEStatus::Success:              return "Success";
        case FEStatus::InvalidArgument:      return "Invalid argument";
        case FEStatus::ConfigurationError:   return "Configuration error";
        case FEStatus::GeometricConsistency: return "Geometric consistency error";
        case FEStatus::DofError:             return "DOF error";
        default:                             return "Unknown error";
    }
}

} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_TYPES_H
