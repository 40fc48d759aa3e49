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

#include "AffineMap.h"
#include "../Core/MeshExceptions.h"

#include <cmath>

namespace mgfem {

AffineMap AffineMap::identity(int dim) {
  AffineMap m;
  m.dim = dim;
  return m;
}

Point3 AffineMap::apply(const Point3& x) const {
  Point3 y = x;
  for (int i = 0; i < dim; ++i) {
    real_t s = b[i];
    for (int j = 0; j < dim; ++j) s += A[i][j] * x[j];
    y[i] = s;
  }
  return y;
}

AffineMap AffineMap::compose(const AffineMap& inner) const {
  AffineMap out;
  out.dim = dim;
  for (int i = 0; i < dim; ++i) {
    real_t s = b[i];
    for (int k = 0; k < dim; ++k) s += A[i][k] * inner.b[k];
    out.b[i] = s;
    for (int j = 0; j < dim; ++j) {
      real_t a = 0.0;
      for (int k = 0; k < dim; ++k) a += A[i][k] * inner.A[k][j];
      out.A[i][j] = a;
    }
  }
  return out;
}

real_t AffineMap::determinant() const {
  switch (dim) {
    case 1:
      return A[0][0];
    case 2:
      return A[0][0] * A[1][1] - A[0][1] * A[1][0];
    case 3:
      return A[0][0] * (A[1][1] * A[2][2] - A[1][2] * A[2][1])
           - A[0][1] * (A[1][0] * A[2][2] - A[1][2] * A[2][0])
           + A[0][2] * (A[1][0] * A[2][1] - A[1][1] * A[2][0]);
    default:
      return 1.0;
  }
}

AffineMap AffineMap::inverse() const {
  const real_t det = determinant();
  if (std::abs(det) < 1e-300) {
    throw GeometricConsistencyError("AffineMap::inverse: singular map");
  }

  AffineMap inv;
  inv.dim = dim;
  const real_t r = 1.0 / det;
  if (dim == 1) {
    inv.A[0][0] = r;
  } else if (dim == 2) {
    inv.A[0][0] =  A[1][1] * r;
    inv.A[0][1] = -A[0][1] * r;
    inv.A[1][0] = -A[1][0] * r;
    inv.A[1][1] =  A[0][0] * r;
  } else if (dim == 3) {
    inv.A[0][0] = (A[1][1] * A[2][2] - A[1][2] * A[2][1]) * r;
    inv.A[0][1] = (A[0][2] * A[2][1] - A[0][1] * A[2][2]) * r;
    inv.A[0][2] = (A[0][1] * A[1][2] - A[0][2] * A[1][1]) * r;
    inv.A[1][0] = (A[1][2] * A[2][0] - A[1][0] * A[2][2]) * r;
    inv.A[1][1] = (A[0][0] * A[2][2] - A[0][2] * A[2][0]) * r;
    inv.A[1][2] = (A[0][2] * A[1][0] - A[0][0] * A[1][2]) * r;
    inv.A[2][0] = (A[1][0] * A[2][1] - A[1][1] * A[2][0]) * r;
    inv.A[2][1] = (A[0][1] * A[2][0] - A[0][0] * A[2][1]) * r;
    inv.A[2][2] = (A[0][0] * A[1][1] - A[0][1] * A[1][0]) * r;
  }

  // b_inv = -A^{-1} b
  for (int i = 0; i < dim; ++i) {
    real_t s = 0.0;
    for (int j = 0; j < dim; ++j) s += inv.A[i][j] * b[j];
    inv.b[i] = -s;
  }
  return inv;
}

AffineMap AffineMap::extended() const {
  if (dim >= 3) {
    throw MeshConfigurationError("AffineMap::extended: map is already three-dimensional");
  }
  AffineMap out = *this;
  out.dim = dim + 1;
  for (int j = 0; j < 3; ++j) {
    out.A[dim][j] = (j == dim) ? 1.0 : 0.0;
    out.A[j][dim] = (j == dim) ? 1.0 : 0.0;
  }
  out.b[dim] = 0.0;
  return out;
}

bool AffineMap::approx_equal(const AffineMap& other, real_t tol) const {
  if (dim != other.dim) return false;
  for (int i = 0; i < dim; ++i) {
    if (std::abs(b[i] - other.b[i]) > tol) return false;
    for (int j = 0; j < dim; ++j) {
      if (std::abs(A[i][j] - other.A[i][j]) > tol) return false;
    }
  }
  return true;
}

} // namespace mgfem
