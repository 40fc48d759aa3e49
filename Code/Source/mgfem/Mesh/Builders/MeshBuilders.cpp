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

#include "MeshBuilders.h"
#include "../Core/MeshBase.h"
#include "../Core/MeshExceptions.h"

#include <array>
#include <string>

namespace mgfem {

namespace {

// (nx+1) x (ny+1) lattice over origin + [0,extent], x running fastest
std::vector<real_t> lattice_coords(int nx, int ny,
                                   const std::array<real_t,2>& origin,
                                   const std::array<real_t,2>& extent) {
  std::vector<real_t> coords;
  coords.reserve(2 * static_cast<size_t>(nx + 1) * static_cast<size_t>(ny + 1));
  for (int j = 0; j <= ny; ++j) {
    for (int i = 0; i <= nx; ++i) {
      coords.push_back(origin[0] + extent[0] * static_cast<real_t>(i) / static_cast<real_t>(nx));
      coords.push_back(origin[1] + extent[1] * static_cast<real_t>(j) / static_cast<real_t>(ny));
    }
  }
  return coords;
}

// Corners of grid square (i, j), counter-clockwise from the lower left
std::array<index_t,4> square_corners(int i, int j, int nx) {
  const index_t lower = j * (nx + 1) + i;
  const index_t upper = lower + (nx + 1);
  return {lower, lower + 1, upper + 1, upper};
}

std::vector<index_t> quad_connectivity(int nx, int ny) {
  std::vector<index_t> connectivity;
  connectivity.reserve(4 * static_cast<size_t>(nx) * static_cast<size_t>(ny));
  for (int j = 0; j < ny; ++j) {
    for (int i = 0; i < nx; ++i) {
      const auto corners = square_corners(i, j, nx);
      connectivity.insert(connectivity.end(), corners.begin(), corners.end());
    }
  }
  return connectivity;
}

void check_grid(int nx, int ny, const char* builder) {
  if (nx <= 0 || ny <= 0) {
    throw MeshConfigurationError(std::string(builder) + ": grid dimensions must be positive");
  }
}

} // namespace

MeshBase MeshBuilders::unit_interval(int n) {
  if (n <= 0) {
    throw MeshConfigurationError("unit_interval: number of cells must be positive");
  }

  std::vector<real_t> coords(static_cast<size_t>(n) + 1);
  std::vector<index_t> connectivity;
  connectivity.reserve(2 * static_cast<size_t>(n));
  for (int i = 0; i <= n; ++i) {
    coords[static_cast<size_t>(i)] = static_cast<real_t>(i) / static_cast<real_t>(n);
    if (i < n) {
      connectivity.insert(connectivity.end(), {i, i + 1});
    }
  }
  return from_arrays(1, CellFamily::Line, coords, connectivity);
}

MeshBase MeshBuilders::unit_square(int nx, int ny, SquareDiagonal diagonal) {
  check_grid(nx, ny, "unit_square");

  std::vector<index_t> connectivity;
  connectivity.reserve(6 * static_cast<size_t>(nx) * static_cast<size_t>(ny));
  for (int j = 0; j < ny; ++j) {
    for (int i = 0; i < nx; ++i) {
      const auto [a, b, c, d] = square_corners(i, j, nx);
      if (diagonal == SquareDiagonal::Right) {
        connectivity.insert(connectivity.end(), {a, b, c, a, c, d});
      } else {
        connectivity.insert(connectivity.end(), {a, b, d, b, c, d});
      }
    }
  }

  return from_arrays(2, CellFamily::Triangle, lattice_coords(nx, ny, {0.0, 0.0}, {1.0, 1.0}),
                     connectivity);
}

MeshBase MeshBuilders::unit_square_quads(int nx, int ny) {
  check_grid(nx, ny, "unit_square_quads");
  return from_arrays(2, CellFamily::Quad, lattice_coords(nx, ny, {0.0, 0.0}, {1.0, 1.0}),
                     quad_connectivity(nx, ny));
}

MeshBase MeshBuilders::build_cartesian_2d(int nx, int ny,
                                          const std::array<real_t,2>& origin,
                                          const std::array<real_t,2>& spacing) {
  check_grid(nx, ny, "build_cartesian_2d");

  const std::array<real_t,2> extent{spacing[0] * static_cast<real_t>(nx),
                                    spacing[1] * static_cast<real_t>(ny)};
  return from_arrays(2, CellFamily::Quad, lattice_coords(nx, ny, origin, extent),
                     quad_connectivity(nx, ny));
}

MeshBase MeshBuilders::from_arrays(int spatial_dim,
                                   CellFamily family,
                                   const std::vector<real_t>& coords,
                                   const std::vector<index_t>& connectivity) {
  MeshBase mesh(spatial_dim);
  mesh.build_from_arrays(spatial_dim, family, coords, connectivity);
  mesh.finalize();
  return mesh;
}

} // namespace mgfem
