/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "FunctionSpace.h"
#include "Basis/LagrangeBasis.h"
#include "Basis/TensorProductBasis.h"
#include "Dofs/DofNumbering.h"

#include <string>
#include <utility>

namespace mgfem {
namespace FE {
namespace spaces {

std::shared_ptr<const basis::BasisFunction> make_cell_basis(CellFamily family, int degree) {
    switch (family) {
        case CellFamily::Line:
        case CellFamily::Triangle:
        case CellFamily::Quad:
            return std::make_shared<basis::LagrangeBasis>(from_mesh_family(family), degree);
        default:
            FE_THROW(ConfigurationException,
                     std::string("No Lagrange element on ") + cell_family_name(family) + " cells");
    }
}

FunctionSpace::FunctionSpace(std::shared_ptr<const MeshBase> mesh,
                             const elements::ElementDescriptor& element)
    : mesh_(std::move(mesh)), element_(element) {
    FE_CHECK_NOT_NULL(mesh_.get(), "FunctionSpace: mesh");
    FE_CHECK_ARG(mesh_->is_finalized(), "FunctionSpace: mesh must be finalized");
    element_.validate();

    basis_ = make_cell_basis(mesh_->cell_family(), element_.degree);
    dof_map_ = dofs::build_dof_map(*mesh_, element_, *basis_);
}

FunctionSpace::FunctionSpace(std::shared_ptr<const ExtrudedMesh> mesh,
                             const elements::ElementDescriptor& element)
    : extruded_(std::move(mesh)), element_(element) {
    FE_CHECK_NOT_NULL(extruded_.get(), "FunctionSpace: extruded mesh");
    mesh_ = extruded_->base_ptr();
    element_.validate();

    auto product = std::make_shared<basis::TensorProductBasis>(
        make_cell_basis(mesh_->cell_family(), element_.degree),
        make_cell_basis(CellFamily::Line, element_.degree));
    dof_map_ = dofs::build_dof_map(*extruded_, element_, *product);
    basis_ = std::move(product);
}

const void* FunctionSpace::mesh_identity() const noexcept {
    if (extruded_) {
        return extruded_.get();
    }
    return mesh_.get();
}

int FunctionSpace::geometric_dimension() const noexcept {
    return extruded_ ? extruded_->dim() : mesh_->dim();
}

std::size_t FunctionSpace::num_cells() const noexcept {
    return extruded_ ? extruded_->n_cells() : mesh_->n_cells();
}

PhysicalPoint FunctionSpace::map_to_physical(GlobalIndex cell, const basis::RefPoint& xi) const {
    if (extruded_) {
        return extruded_->map_to_physical(static_cast<index_t>(cell), xi);
    }
    return mesh_->map_to_physical(static_cast<index_t>(cell), xi);
}

std::vector<PhysicalPoint> FunctionSpace::node_coordinates() const {
    const auto& nodes = basis_->nodes();
    std::vector<PhysicalPoint> coords(static_cast<std::size_t>(num_nodes()));
    for (GlobalIndex n = 0; n < num_nodes(); ++n) {
        const auto& owner = dof_map_.getDofOwner(n);
        coords[static_cast<std::size_t>(n)] = map_to_physical(owner.cell, nodes[owner.local]);
    }
    return coords;
}

bool FunctionSpace::is_compatible(const FunctionSpace& other) const noexcept {
    if (this == &other) {
        return true;
    }
    return mesh_identity() == other.mesh_identity() && element_ == other.element_;
}

} // namespace spaces
} // namespace FE
} // namespace mgfem
