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

#ifndef MGFEM_MESH_BUILDERS_H
#define MGFEM_MESH_BUILDERS_H

#include "../Core/MeshTypes.h"
#include <vector>

namespace mgfem {

// Forward declaration
class MeshBase;

/**
 * @brief Diagonal used to split each grid square of a triangulated square mesh
 *
 * Right: from the lower-left to the upper-right corner.
 * Left:  from the lower-right to the upper-left corner.
 */
enum class SquareDiagonal {
  Left,
  Right
};

/**
 * @brief Base mesh construction utilities
 *
 * All builders return finalized meshes with vertices numbered row by row
 * (x fastest) and cells counter-clockwise.
 */
class MeshBuilders {
public:
  /**
   * @brief Unit interval [0,1] split into n Line cells
   * @throws MeshConfigurationError if n <= 0
   */
  static MeshBase unit_interval(int n);

  /**
   * @brief Triangulated unit square, two triangles per grid square
   * @param nx, ny Number of grid squares in x, y directions
   * @param diagonal Diagonal splitting each grid square
   */
  static MeshBase unit_square(int nx, int ny, SquareDiagonal diagonal = SquareDiagonal::Right);

  /**
   * @brief Structured quadrilateral unit square
   */
  static MeshBase unit_square_quads(int nx, int ny);

  /**
   * @brief Build 2D Cartesian grid of quads
   * @param nx, ny Number of cells in x, y directions
   * @param origin Lower-left corner
   * @param spacing Cell size in each direction
   */
  static MeshBase build_cartesian_2d(int nx, int ny,
                                     const std::array<real_t,2>& origin,
                                     const std::array<real_t,2>& spacing);

  /**
   * @brief Arbitrary single-family mesh from flat arrays
   * @throws MeshConfigurationError on empty or inconsistent input
   */
  static MeshBase from_arrays(int spatial_dim,
                              CellFamily family,
                              const std::vector<real_t>& coords,
                              const std::vector<index_t>& connectivity);
};

} // namespace mgfem

#endif // MGFEM_MESH_BUILDERS_H
