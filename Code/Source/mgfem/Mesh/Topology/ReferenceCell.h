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

#ifndef MGFEM_REFERENCE_CELL_H
#define MGFEM_REFERENCE_CELL_H

#include "../Core/MeshTypes.h"
#include <array>
#include <vector>

namespace mgfem {

/**
 * @brief Reference-cell geometry for the cell families the library meshes
 *
 * Conventions:
 * - Line:     [-1, 1]
 * - Triangle: (0,0), (1,0), (0,1)
 * - Quad:     [-1, 1]^2, vertices counter-clockwise from (-1,-1)
 * - Tetra:    (0,0,0), (1,0,0), (0,1,0), (0,0,1)
 *
 * Cells map reference coordinates to physical space through the vertex
 * interpolant returned by vertex_weights() (linear for simplices and
 * lines, bilinear for quads).
 */
class ReferenceCell {
public:
    struct EdgeListView {
        const index_t* pairs_flat = nullptr; // flattened [v0, v1, v0, v1, ...]
        int edge_count = 0;
    };

    /// True for families with a reference-cell table
    static bool is_supported(CellFamily family) noexcept;

    /**
     * @brief Reference vertex coordinates
     * @throws MeshConfigurationError if the family has no reference table
     */
    static const std::vector<Point3>& vertices(CellFamily family);

    /// Local edges as pairs of local vertex indices
    static EdgeListView edges_view(CellFamily family);
    static std::vector<std::array<index_t, 2>> edges(CellFamily family);

    /**
     * @brief Evaluate the vertex interpolant at a reference point
     *
     * @param family Cell family
     * @param xi Reference coordinates
     * @param w Output, one weight per vertex (sized by the caller)
     */
    static void vertex_weights(CellFamily family, const Point3& xi, real_t* w);

    static std::vector<real_t> vertex_weights(CellFamily family, const Point3& xi);

    /// Reference centroid
    static Point3 centroid(CellFamily family);

    /// Point-in-reference-cell test with tolerance
    static bool contains(CellFamily family, const Point3& xi, real_t tol = 1e-12);

    /// Reference-cell measure (length / area / volume)
    static real_t measure(CellFamily family);
};

} // namespace mgfem

#endif // MGFEM_REFERENCE_CELL_H
