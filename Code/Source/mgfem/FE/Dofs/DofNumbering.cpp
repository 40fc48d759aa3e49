/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "DofNumbering.h"
#include "Core/FEConfig.h"
#include "Mesh/Topology/ReferenceCell.h"

#include <cmath>
#include <map>

namespace mgfem {
namespace FE {
namespace dofs {

namespace {

// {entity, a, b, c, vertical}
using EntityKey = std::array<GlobalIndex, 5>;

EntityKey horizontal_key(const NodeClassification& cls,
                         const index_t* cell_vertices,
                         GlobalIndex cell,
                         LocalIndex local,
                         int degree) {
    switch (cls.entity) {
        case NodeEntity::Vertex:
            return {0, cell_vertices[cls.local_a], 0, 0, 0};
        case NodeEntity::Edge: {
            GlobalIndex va = cell_vertices[cls.local_a];
            GlobalIndex vb = cell_vertices[cls.local_b];
            if (va < vb) {
                return {1, va, vb, cls.steps_from_a, 0};
            }
            return {1, vb, va, degree - cls.steps_from_a, 0};
        }
        case NodeEntity::Interior:
        default:
            return {2, cell, static_cast<GlobalIndex>(local), 0, 0};
    }
}

void check_basis(CellFamily family, const basis::BasisFunction& horizontal,
                 const elements::ElementDescriptor& element) {
    FE_CHECK_CONFIG(horizontal.element_type() == from_mesh_family(family),
                    "Basis element type does not match the mesh cell family " +
                        std::string(cell_family_name(family)));
    FE_CHECK_CONFIG(horizontal.order() == element.degree,
                    "Basis order does not match the element degree");
}

class KeyNumbering {
public:
    GlobalIndex lookup(const EntityKey& key) {
        auto [it, inserted] = ids_.emplace(key, next_);
        if (inserted) {
            ++next_;
        }
        return it->second;
    }

    GlobalIndex size() const noexcept { return next_; }

private:
    std::map<EntityKey, GlobalIndex> ids_;
    GlobalIndex next_ = 0;
};

} // namespace

NodeClassification classify_node(CellFamily family, const basis::RefPoint& xi, int degree) {
    const int nv = cell_num_vertices(family);
    std::vector<real_t> w(static_cast<std::size_t>(nv), 0.0);
    ReferenceCell::vertex_weights(family, xi, w.data());

    int support[2] = {-1, -1};
    int count = 0;
    for (int v = 0; v < nv; ++v) {
        if (std::abs(w[static_cast<std::size_t>(v)]) > config::REFERENCE_TOLERANCE) {
            if (count < 2) {
                support[count] = v;
            }
            ++count;
        }
    }

    NodeClassification cls;
    if (count == 1) {
        cls.entity = NodeEntity::Vertex;
        cls.local_a = support[0];
    } else if (count == 2) {
        cls.entity = NodeEntity::Edge;
        cls.local_a = support[0];
        cls.local_b = support[1];
        cls.steps_from_a = static_cast<int>(
            std::lround(w[static_cast<std::size_t>(support[1])] * static_cast<Real>(degree)));
    }
    return cls;
}

DofMap build_dof_map(const MeshBase& mesh,
                     const elements::ElementDescriptor& element,
                     const basis::BasisFunction& basis) {
    element.validate();
    check_basis(mesh.cell_family(), basis, element);

    const auto n_cells = static_cast<GlobalIndex>(mesh.n_cells());
    const auto n_local = static_cast<LocalIndex>(basis.size());

    DofMap map;
    map.reserve(n_cells, n_local);
    std::vector<GlobalIndex> cell_dofs(n_local);

    if (element.family == elements::ElementFamily::DG) {
        for (GlobalIndex c = 0; c < n_cells; ++c) {
            for (LocalIndex i = 0; i < n_local; ++i) {
                cell_dofs[i] = c * n_local + i;
            }
            map.setCellDofs(c, cell_dofs);
        }
        map.setNumDofs(n_cells * n_local);
        map.finalize();
        return map;
    }

    std::vector<NodeClassification> classes;
    classes.reserve(n_local);
    for (const auto& xi : basis.nodes()) {
        classes.push_back(classify_node(mesh.cell_family(), xi, element.degree));
    }

    KeyNumbering numbering;
    for (GlobalIndex c = 0; c < n_cells; ++c) {
        const index_t* verts = mesh.cell_vertices_span(static_cast<index_t>(c)).first;
        for (LocalIndex i = 0; i < n_local; ++i) {
            cell_dofs[i] = numbering.lookup(horizontal_key(classes[i], verts, c, i, element.degree));
        }
        map.setCellDofs(c, cell_dofs);
    }
    map.setNumDofs(numbering.size());
    map.finalize();
    return map;
}

DofMap build_dof_map(const ExtrudedMesh& mesh,
                     const elements::ElementDescriptor& element,
                     const basis::TensorProductBasis& basis) {
    element.validate();
    const MeshBase& base = mesh.base();
    check_basis(base.cell_family(), basis.horizontal(), element);
    FE_CHECK_CONFIG(basis.vertical().order() == element.degree,
                    "Vertical basis order does not match the element degree");

    const auto n_cells = static_cast<GlobalIndex>(mesh.n_cells());
    const auto n_local = static_cast<LocalIndex>(basis.size());
    const auto n_horizontal = static_cast<LocalIndex>(basis.horizontal().size());

    DofMap map;
    map.reserve(n_cells, n_local);
    std::vector<GlobalIndex> cell_dofs(n_local);

    if (element.family == elements::ElementFamily::DG) {
        for (GlobalIndex c = 0; c < n_cells; ++c) {
            for (LocalIndex i = 0; i < n_local; ++i) {
                cell_dofs[i] = c * n_local + i;
            }
            map.setCellDofs(c, cell_dofs);
        }
        map.setNumDofs(n_cells * n_local);
        map.finalize();
        return map;
    }

    std::vector<NodeClassification> classes;
    classes.reserve(n_horizontal);
    for (const auto& xi : basis.horizontal().nodes()) {
        classes.push_back(classify_node(base.cell_family(), xi, element.degree));
    }

    KeyNumbering numbering;
    for (GlobalIndex c = 0; c < n_cells; ++c) {
        const index_t bc = mesh.base_cell(static_cast<index_t>(c));
        const int layer = mesh.layer(static_cast<index_t>(c));
        const index_t* verts = base.cell_vertices_span(bc).first;
        for (LocalIndex l = 0; l < n_local; ++l) {
            const LocalIndex i = l % n_horizontal;
            const LocalIndex j = l / n_horizontal;
            EntityKey key = horizontal_key(classes[i], verts, bc, i, element.degree);
            key[4] = static_cast<GlobalIndex>(layer) * element.degree + j;
            cell_dofs[l] = numbering.lookup(key);
        }
        map.setCellDofs(c, cell_dofs);
    }
    map.setNumDofs(numbering.size());
    map.finalize();
    return map;
}

} // namespace dofs
} // namespace FE
} // namespace mgfem
