/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_SPACES_FUNCTIONSPACE_H
#define MGFEM_FE_SPACES_FUNCTIONSPACE_H

/**
 * @file FunctionSpace.h
 * @brief Lagrange function space on a plain or extruded mesh
 *
 * A FunctionSpace combines:
 *  - a mesh (MeshBase, or ExtrudedMesh for layered meshes),
 *  - an element descriptor (family, degree, value size),
 *  - the nodal basis on the reference cell,
 *  - the global node numbering (DofMap).
 *
 * Spaces are immutable after construction and shared through
 * std::shared_ptr<const FunctionSpace>. Spaces created by a
 * FunctionSpaceHierarchy additionally know their hierarchy and level.
 */

#include "Core/Types.h"
#include "Core/FEException.h"
#include "Basis/BasisFunction.h"
#include "Dofs/DofMap.h"
#include "Elements/ElementDescriptor.h"

#include "Mesh/Core/MeshBase.h"
#include "Mesh/Hierarchy/ExtrudedMesh.h"

#include <memory>
#include <vector>

namespace mgfem {
namespace FE {
namespace spaces {

class FunctionSpaceHierarchy;

class FunctionSpace {
public:
    /**
     * @brief Space on a plain mesh
     * @throws ConfigurationException for unsupported cells or elements
     */
    FunctionSpace(std::shared_ptr<const MeshBase> mesh,
                  const elements::ElementDescriptor& element);

    /**
     * @brief Space on an extruded mesh (tensor-product basis)
     * @throws ConfigurationException for unsupported cells or elements
     */
    FunctionSpace(std::shared_ptr<const ExtrudedMesh> mesh,
                  const elements::ElementDescriptor& element);

    FunctionSpace(const FunctionSpace&) = delete;
    FunctionSpace& operator=(const FunctionSpace&) = delete;

    // ---- element -------------------------------------------------------------

    const elements::ElementDescriptor& element() const noexcept { return element_; }
    elements::ElementFamily family() const noexcept { return element_.family; }
    int degree() const noexcept { return element_.degree; }
    int value_size() const noexcept { return element_.value_size; }
    FieldType field_type() const noexcept { return element_.field_type(); }

    const basis::BasisFunction& basis() const noexcept { return *basis_; }
    const std::shared_ptr<const basis::BasisFunction>& basis_ptr() const noexcept { return basis_; }

    // ---- mesh ----------------------------------------------------------------

    bool is_extruded() const noexcept { return static_cast<bool>(extruded_); }

    /// Plain mesh, or the base mesh of an extruded mesh
    const MeshBase& base_mesh() const noexcept { return *mesh_; }

    /// Extruded mesh, or nullptr for plain spaces
    const ExtrudedMesh* extruded_mesh() const noexcept { return extruded_.get(); }

    /// Identity of the underlying mesh object
    const void* mesh_identity() const noexcept;

    int geometric_dimension() const noexcept;
    std::size_t num_cells() const noexcept;

    /// Physical coordinates of a reference point of cell `cell`
    PhysicalPoint map_to_physical(GlobalIndex cell, const basis::RefPoint& xi) const;

    // ---- DOFs ----------------------------------------------------------------

    const dofs::DofMap& dof_map() const noexcept { return dof_map_; }

    /// Number of scalar nodes
    GlobalIndex num_nodes() const noexcept { return dof_map_.getNumDofs(); }

    /// Number of DOFs, num_nodes() * value_size()
    GlobalIndex num_dofs() const noexcept { return num_nodes() * value_size(); }

    LocalIndex nodes_per_cell() const noexcept { return static_cast<LocalIndex>(basis_->size()); }

    /// Physical coordinates of every global node
    std::vector<PhysicalPoint> node_coordinates() const;

    // ---- hierarchy membership ------------------------------------------------

    /// Owning hierarchy, or nullptr if the space is standalone (or the hierarchy is gone)
    std::shared_ptr<const FunctionSpaceHierarchy> hierarchy() const noexcept { return hierarchy_.lock(); }

    /// Level within the owning hierarchy
    std::size_t level() const noexcept { return level_; }

    /// Same mesh object and same element
    bool is_compatible(const FunctionSpace& other) const noexcept;

private:
    friend class FunctionSpaceHierarchy;

    std::shared_ptr<const MeshBase> mesh_;
    std::shared_ptr<const ExtrudedMesh> extruded_;
    elements::ElementDescriptor element_;
    std::shared_ptr<const basis::BasisFunction> basis_;
    dofs::DofMap dof_map_;

    std::weak_ptr<const FunctionSpaceHierarchy> hierarchy_;
    std::size_t level_ = 0;
};

/// Scalar nodal basis of a given degree on a mesh cell family
std::shared_ptr<const basis::BasisFunction> make_cell_basis(CellFamily family, int degree);

} // namespace spaces
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_SPACES_FUNCTIONSPACE_H
