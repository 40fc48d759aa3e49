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
#ifndef MGFEM_FE_CONFIG_H
#define MGFEM_FE_CONFIG_H

/**
 * @file FEConfig.h
 * @brief Build feature flags, compile-time limits and default tolerances
 *
 * The limits can be overridden with compiler definitions, e.g.
 * -DFE_MAX_POLYNOMIAL_ORDER=6 or -DFE_MAX_DIM=2.
 */

#include "Types.h"

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define FE_DEBUG_MODE 1
#else
    #define FE_DEBUG_MODE 0
#endif

// The build defines MGFEM_HAS_MPI when linking MPI; code tests `#if FE_HAS_MPI`
#ifdef FE_HAS_MPI
#  undef FE_HAS_MPI
#endif
#if defined(MGFEM_HAS_MPI)
#  define FE_HAS_MPI 1
#else
#  define FE_HAS_MPI 0
#endif

#ifdef _OPENMP
    #define FE_HAS_OPENMP 1
    #include <omp.h>
#else
    #define FE_HAS_OPENMP 0
#endif

namespace mgfem {
namespace FE {
namespace config {

/// Largest spatial dimension, and largest number of value components
#ifndef FE_MAX_DIM
    constexpr int MAX_SPATIAL_DIM = 3;
#else
    constexpr int MAX_SPATIAL_DIM = FE_MAX_DIM;
#endif

#ifndef FE_MAX_POLYNOMIAL_ORDER
    constexpr int MAX_POLYNOMIAL_ORDER = 10;
#else
    constexpr int MAX_POLYNOMIAL_ORDER = FE_MAX_POLYNOMIAL_ORDER;
#endif

/// Slack for reference-coordinate tests (node support, point location)
constexpr Real REFERENCE_TOLERANCE = 1e-10;

/// Default disagreement allowed between owning cells of a shared CG DOF
constexpr Real DEFAULT_CONTINUITY_TOLERANCE = 1e-10;

} // namespace config
} // namespace FE
} // namespace mgfem

#if defined(__GNUC__) || defined(__clang__)
    #define FE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define FE_UNLIKELY(x) (x)
#endif

#endif // MGFEM_FE_CONFIG_H
