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

#include "ReferenceCell.h"
#include "../Core/MeshExceptions.h"

#include <string>

namespace mgfem {

namespace {

constexpr index_t LINE_EDGES_FLAT[] = {
    0,1
};

// Triangle edges (3), oriented counter-clockwise
constexpr index_t TRI_EDGES_FLAT[] = {
    0,1, 1,2, 2,0
};

// Quad edges (4), oriented counter-clockwise
constexpr index_t QUAD_EDGES_FLAT[] = {
    0,1, 1,2, 2,3, 3,0
};

// Tetra edges (6)
constexpr index_t TET_EDGES_FLAT[] = {
    0,1, 1,2, 2,0, 0,3, 1,3, 2,3
};

const std::vector<Point3>& line_vertices() {
    static const std::vector<Point3> v = {
        {-1.0, 0.0, 0.0}, {1.0, 0.0, 0.0}};
    return v;
}

const std::vector<Point3>& triangle_vertices() {
    static const std::vector<Point3> v = {
        {0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}};
    return v;
}

const std::vector<Point3>& quad_vertices() {
    static const std::vector<Point3> v = {
        {-1.0, -1.0, 0.0}, {1.0, -1.0, 0.0}, {1.0, 1.0, 0.0}, {-1.0, 1.0, 0.0}};
    return v;
}

const std::vector<Point3>& tet_vertices() {
    static const std::vector<Point3> v = {
        {0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};
    return v;
}

[[noreturn]] void throw_unsupported(CellFamily family, const char* what) {
    throw MeshConfigurationError(std::string(what) + ": no reference cell for family " +
                                 cell_family_name(family));
}

} // namespace

bool ReferenceCell::is_supported(CellFamily family) noexcept {
    switch (family) {
        case CellFamily::Line:
        case CellFamily::Triangle:
        case CellFamily::Quad:
        case CellFamily::Tetra:
            return true;
        default:
            return false;
    }
}

const std::vector<Point3>& ReferenceCell::vertices(CellFamily family) {
    switch (family) {
        case CellFamily::Line:     return line_vertices();
        case CellFamily::Triangle: return triangle_vertices();
        case CellFamily::Quad:     return quad_vertices();
        case CellFamily::Tetra:    return tet_vertices();
        default:
            throw_unsupported(family, "ReferenceCell::vertices");
    }
}

ReferenceCell::EdgeListView ReferenceCell::edges_view(CellFamily family) {
    switch (family) {
        case CellFamily::Line:     return {LINE_EDGES_FLAT, 1};
        case CellFamily::Triangle: return {TRI_EDGES_FLAT, 3};
        case CellFamily::Quad:     return {QUAD_EDGES_FLAT, 4};
        case CellFamily::Tetra:    return {TET_EDGES_FLAT, 6};
        default:
            return {nullptr, 0};
    }
}

std::vector<std::array<index_t, 2>> ReferenceCell::edges(CellFamily family) {
    auto view = edges_view(family);
    if (!view.pairs_flat) {
        throw_unsupported(family, "ReferenceCell::edges");
    }
    std::vector<std::array<index_t, 2>> out(static_cast<size_t>(view.edge_count));
    for (int e = 0; e < view.edge_count; ++e) {
        out[e] = {view.pairs_flat[2 * e], view.pairs_flat[2 * e + 1]};
    }
    return out;
}

void ReferenceCell::vertex_weights(CellFamily family, const Point3& xi, real_t* w) {
    const real_t x = xi[0], y = xi[1], z = xi[2];
    switch (family) {
        case CellFamily::Line:
            w[0] = 0.5 * (1.0 - x);
            w[1] = 0.5 * (1.0 + x);
            return;
        case CellFamily::Triangle:
            w[0] = 1.0 - x - y;
            w[1] = x;
            w[2] = y;
            return;
        case CellFamily::Quad:
            w[0] = 0.25 * (1.0 - x) * (1.0 - y);
            w[1] = 0.25 * (1.0 + x) * (1.0 - y);
            w[2] = 0.25 * (1.0 + x) * (1.0 + y);
            w[3] = 0.25 * (1.0 - x) * (1.0 + y);
            return;
        case CellFamily::Tetra:
            w[0] = 1.0 - x - y - z;
            w[1] = x;
            w[2] = y;
            w[3] = z;
            return;
        default:
            throw_unsupported(family, "ReferenceCell::vertex_weights");
    }
}

std::vector<real_t> ReferenceCell::vertex_weights(CellFamily family, const Point3& xi) {
    std::vector<real_t> w(static_cast<size_t>(cell_num_vertices(family)), 0.0);
    vertex_weights(family, xi, w.data());
    return w;
}

Point3 ReferenceCell::centroid(CellFamily family) {
    const auto& v = vertices(family);
    Point3 c{0.0, 0.0, 0.0};
    for (const auto& p : v) {
        for (int d = 0; d < 3; ++d) c[d] += p[d];
    }
    const real_t inv = 1.0 / static_cast<real_t>(v.size());
    for (int d = 0; d < 3; ++d) c[d] *= inv;
    return c;
}

bool ReferenceCell::contains(CellFamily family, const Point3& xi, real_t tol) {
    const real_t x = xi[0], y = xi[1], z = xi[2];
    switch (family) {
        case CellFamily::Line:
            return x >= -1.0 - tol && x <= 1.0 + tol;
        case CellFamily::Triangle:
            return x >= -tol && y >= -tol && x + y <= 1.0 + tol;
        case CellFamily::Quad:
            return x >= -1.0 - tol && x <= 1.0 + tol &&
                   y >= -1.0 - tol && y <= 1.0 + tol;
        case CellFamily::Tetra:
            return x >= -tol && y >= -tol && z >= -tol && x + y + z <= 1.0 + tol;
        default:
            throw_unsupported(family, "ReferenceCell::contains");
    }
}

real_t ReferenceCell::measure(CellFamily family) {
    switch (family) {
        case CellFamily::Line:     return 2.0;
        case CellFamily::Triangle: return 0.5;
        case CellFamily::Quad:     return 4.0;
        case CellFamily::Tetra:    return 1.0 / 6.0;
        default:
            throw_unsupported(family, "ReferenceCell::measure");
    }
}

} // namespace mgfem
