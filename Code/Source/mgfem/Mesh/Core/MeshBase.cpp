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

#include "MeshBase.h"
#include "MeshExceptions.h"
#include "../Topology/ReferenceCell.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace mgfem {

MeshBase::MeshBase() = default;

MeshBase::MeshBase(int spatial_dim) : spatial_dim_(spatial_dim) {}

// Connectivity is stored flat with a fixed stride, e.g. for triangles
//   cell2vertex = [0,1,2,  1,3,2]
//   => cell 0 -> [0,1,2]
//      cell 1 -> [1,3,2]
void MeshBase::build_from_arrays(
    int spatial_dim,
    CellFamily family,
    const std::vector<real_t>& X_ref,
    const std::vector<index_t>& cell2vertex) {

    if (spatial_dim < 1 || spatial_dim > 3) {
        throw MeshConfigurationError("build_from_arrays: invalid spatial dimension");
    }

    if (!ReferenceCell::is_supported(family)) {
        throw MeshConfigurationError(std::string("build_from_arrays: unsupported cell family ") +
                                     cell_family_name(family));
    }

    if (cell_dimension(family) > spatial_dim) {
        throw MeshConfigurationError("build_from_arrays: cell dimension exceeds spatial dimension");
    }

    const size_t nv_cell = static_cast<size_t>(cell_num_vertices(family));
    if (cell2vertex.empty()) {
        throw MeshConfigurationError("build_from_arrays: mesh has no cells");
    }
    if (cell2vertex.size() % nv_cell != 0) {
        throw MeshConfigurationError("build_from_arrays: connectivity size is not a multiple of "
                                     "vertices per cell");
    }

    const size_t n_vertices = X_ref.size() / static_cast<size_t>(spatial_dim);
    if (X_ref.size() != n_vertices * static_cast<size_t>(spatial_dim)) {
        throw MeshConfigurationError("build_from_arrays: coordinate array size mismatch");
    }

    for (index_t v : cell2vertex) {
        if (v < 0 || static_cast<size_t>(v) >= n_vertices) {
            throw MeshConfigurationError("build_from_arrays: vertex index " + std::to_string(v) +
                                         " out of range");
        }
    }

    spatial_dim_ = spatial_dim;
    family_ = family;
    X_ref_ = X_ref;
    cell2vertex_ = cell2vertex;

    edge2vertex_.clear();
    edge_lookup_.clear();
    finalized_ = false;
}

void MeshBase::finalize() {
    if (cell2vertex_.empty()) {
        throw MeshConfigurationError("finalize: mesh has not been built");
    }

    edge2vertex_.clear();
    edge_lookup_.clear();

    // Edges are numbered in first-seen order over cells and local edges
    auto view = ReferenceCell::edges_view(family_);
    const index_t nc = static_cast<index_t>(n_cells());
    for (index_t c = 0; c < nc; ++c) {
        auto [verts, nv] = cell_vertices_span(c);
        (void)nv;
        for (int e = 0; e < view.edge_count; ++e) {
            const index_t a = verts[view.pairs_flat[2 * e]];
            const index_t b = verts[view.pairs_flat[2 * e + 1]];
            const gid_t key = edge_key(a, b);
            if (edge_lookup_.find(key) == edge_lookup_.end()) {
                edge_lookup_.emplace(key, static_cast<index_t>(edge2vertex_.size()));
                edge2vertex_.push_back({std::min(a, b), std::max(a, b)});
            }
        }
    }

    finalized_ = true;
}

// ==========================================
// Coordinates
// ==========================================

std::array<real_t,3> MeshBase::get_vertex_coords(index_t v) const {
    if (v < 0 || static_cast<size_t>(v) >= n_vertices()) {
        throw std::out_of_range("get_vertex_coords: invalid vertex index");
    }
    std::array<real_t,3> xyz = {{0.0, 0.0, 0.0}};
    const size_t base = static_cast<size_t>(v) * static_cast<size_t>(spatial_dim_);
    for (int d = 0; d < spatial_dim_; ++d) {
        xyz[d] = X_ref_[base + static_cast<size_t>(d)];
    }
    return xyz;
}

std::vector<std::array<real_t,3>> MeshBase::cell_vertex_coords(index_t c) const {
    auto [verts, nv] = cell_vertices_span(c);
    std::vector<std::array<real_t,3>> out;
    out.reserve(nv);
    for (size_t i = 0; i < nv; ++i) {
        out.push_back(get_vertex_coords(verts[i]));
    }
    return out;
}

BoundingBox MeshBase::bounding_box() const {
    BoundingBox box;
    for (index_t v = 0; v < static_cast<index_t>(n_vertices()); ++v) {
        const auto x = get_vertex_coords(v);
        for (int d = 0; d < 3; ++d) {
            box.min[d] = std::min(box.min[d], x[d]);
            box.max[d] = std::max(box.max[d], x[d]);
        }
    }
    return box;
}

// ==========================================
// Topology Access
// ==========================================

std::pair<const index_t*, size_t> MeshBase::cell_vertices_span(index_t c) const {
    if (c < 0 || static_cast<size_t>(c) >= n_cells()) {
        throw std::out_of_range("cell_vertices_span: invalid cell index");
    }
    const size_t nv = static_cast<size_t>(n_vertices_per_cell());
    return {&cell2vertex_[static_cast<size_t>(c) * nv], nv};
}

std::vector<index_t> MeshBase::cell_vertices(index_t c) const {
    auto [verts, nv] = cell_vertices_span(c);
    return std::vector<index_t>(verts, verts + nv);
}

gid_t MeshBase::edge_key(index_t a, index_t b) noexcept {
    const gid_t lo = std::min(a, b);
    const gid_t hi = std::max(a, b);
    return (lo << 32) | hi;
}

index_t MeshBase::find_edge(index_t a, index_t b) const {
    auto it = edge_lookup_.find(edge_key(a, b));
    return it == edge_lookup_.end() ? INVALID_INDEX : it->second;
}

// ==========================================
// Geometry
// ==========================================

std::array<real_t,3> MeshBase::map_to_physical(index_t c, const std::array<real_t,3>& xi) const {
    auto [verts, nv] = cell_vertices_span(c);
    real_t w[8];
    ReferenceCell::vertex_weights(family_, xi, w);

    std::array<real_t,3> x = {{0.0, 0.0, 0.0}};
    for (size_t i = 0; i < nv; ++i) {
        const auto xv = get_vertex_coords(verts[i]);
        for (int d = 0; d < 3; ++d) x[d] += w[i] * xv[d];
    }
    return x;
}

namespace {

std::array<real_t,3> sub(const std::array<real_t,3>& a, const std::array<real_t,3>& b) {
    return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

std::array<real_t,3> cross(const std::array<real_t,3>& a, const std::array<real_t,3>& b) {
    return {a[1] * b[2] - a[2] * b[1],
            a[2] * b[0] - a[0] * b[2],
            a[0] * b[1] - a[1] * b[0]};
}

real_t norm(const std::array<real_t,3>& a) {
    return std::sqrt(a[0] * a[0] + a[1] * a[1] + a[2] * a[2]);
}

real_t triangle_area(const std::array<real_t,3>& p0,
                     const std::array<real_t,3>& p1,
                     const std::array<real_t,3>& p2) {
    return 0.5 * norm(cross(sub(p1, p0), sub(p2, p0)));
}

} // namespace

real_t MeshBase::cell_measure(index_t c) const {
    const auto p = cell_vertex_coords(c);
    switch (family_) {
        case CellFamily::Line:
            return norm(sub(p[1], p[0]));
        case CellFamily::Triangle:
            return triangle_area(p[0], p[1], p[2]);
        case CellFamily::Quad:
            return triangle_area(p[0], p[1], p[2]) + triangle_area(p[0], p[2], p[3]);
        case CellFamily::Tetra: {
            const auto a = sub(p[1], p[0]);
            const auto b = sub(p[2], p[0]);
            const auto d = sub(p[3], p[0]);
            const auto n = cross(a, b);
            return std::abs(n[0] * d[0] + n[1] * d[1] + n[2] * d[2]) / 6.0;
        }
        default:
            throw MeshConfigurationError("cell_measure: unsupported cell family");
    }
}

} // namespace mgfem
