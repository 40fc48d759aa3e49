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

#ifndef MGFEM_AFFINE_MAP_H
#define MGFEM_AFFINE_MAP_H

#include "../Core/MeshTypes.h"

namespace mgfem {

/**
 * @brief Affine map x -> A x + b between reference domains
 *
 * Only the leading dim x dim block of A and the first dim entries of b are
 * meaningful; the remaining components pass through unchanged.
 */
struct AffineMap {
  int dim = 0;
  std::array<std::array<real_t,3>,3> A = {{{1,0,0},{0,1,0},{0,0,1}}};
  std::array<real_t,3> b = {{0,0,0}};

  static AffineMap identity(int dim);

  Point3 apply(const Point3& x) const;

  /// (*this) o inner, i.e. x -> this->apply(inner.apply(x))
  AffineMap compose(const AffineMap& inner) const;

  /// @throws GeometricConsistencyError if A is singular
  AffineMap inverse() const;

  /// Same map acting on the leading coordinates, identity on one extra trailing coordinate
  AffineMap extended() const;

  real_t determinant() const;

  bool approx_equal(const AffineMap& other, real_t tol) const;
};

} // namespace mgfem

#endif // MGFEM_AFFINE_MAP_H
