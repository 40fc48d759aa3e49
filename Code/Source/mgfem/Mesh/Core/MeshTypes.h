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

#ifndef MGFEM_MESH_TYPES_H
#define MGFEM_MESH_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace mgfem {

using index_t = int32_t;      // vertex, edge and cell numbers within one mesh
using gid_t   = int64_t;      // packed keys built from pairs of indices
using real_t  = double;

constexpr index_t INVALID_INDEX = -1;

enum class CellFamily {
  Point,
  Line,
  Triangle,
  Quad,
  Tetra,
  Hex,
  Wedge,
  Pyramid
};

inline constexpr int cell_dimension(CellFamily f) noexcept {
  switch (f) {
    case CellFamily::Point:    return 0;
    case CellFamily::Line:     return 1;
    case CellFamily::Triangle:
    case CellFamily::Quad:     return 2;
    case CellFamily::Tetra:
    case CellFamily::Hex:
    case CellFamily::Wedge:
    case CellFamily::Pyramid:  return 3;
  }
  return -1;
}

inline constexpr int cell_num_vertices(CellFamily f) noexcept {
  switch (f) {
    case CellFamily::Point:    return 1;
    case CellFamily::Line:     return 2;
    case CellFamily::Triangle: return 3;
    case CellFamily::Quad:     return 4;
    case CellFamily::Tetra:    return 4;
    case CellFamily::Hex:      return 8;
    case CellFamily::Wedge:    return 6;
    case CellFamily::Pyramid:  return 5;
  }
  return 0;
}

inline const char* cell_family_name(CellFamily f) noexcept {
  switch (f) {
    case CellFamily::Point:    return "Point";
    case CellFamily::Line:     return "Line";
    case CellFamily::Triangle: return "Triangle";
    case CellFamily::Quad:     return "Quad";
    case CellFamily::Tetra:    return "Tetra";
    case CellFamily::Hex:      return "Hex";
    case CellFamily::Wedge:    return "Wedge";
    case CellFamily::Pyramid:  return "Pyramid";
  }
  return "Unknown";
}

using Point3 = std::array<real_t,3>;

// Starts inverted so that the first point sets both corners
struct BoundingBox {
  std::array<real_t,3> min { {+1e300, +1e300, +1e300} };
  std::array<real_t,3> max { {-1e300, -1e300, -1e300} };
};

} // namespace mgfem

#endif // MGFEM_MESH_TYPES_H
