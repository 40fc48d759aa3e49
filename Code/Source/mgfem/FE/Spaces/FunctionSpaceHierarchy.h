/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_SPACES_FUNCTIONSPACEHIERARCHY_H
#define MGFEM_FE_SPACES_FUNCTIONSPACEHIERARCHY_H

/**
 * @file FunctionSpaceHierarchy.h
 * @brief Function spaces over every level of a mesh hierarchy
 *
 * A FunctionSpaceHierarchy owns one FunctionSpace per mesh level, all with
 * the same element. It is the object that relates spaces of adjacent
 * levels: it answers parent / child queries in terms of space cells and
 * caches the local transfer matrices between adjacent levels.
 *
 * Vector spaces use VectorFunctionSpaceHierarchy (value size equal to the
 * geometric dimension). Mixed spaces use MixedFunctionSpaceHierarchy, which
 * holds one FunctionSpaceHierarchy per component.
 */

#include "Spaces/FunctionSpace.h"
#include "Spaces/MixedSpace.h"

#include "Mesh/Hierarchy/MeshHierarchy.h"
#include "Mesh/Hierarchy/ExtrudedMeshHierarchy.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mgfem {
namespace FE {
namespace spaces {

/**
 * @brief Local transfer data between level L and level L + 1
 *
 * prolongation[c][i * n_coarse + j] is coarse basis function j evaluated at
 * fine node i mapped through composite child map c.
 *
 * injection_child[j] is the composite child whose image contains coarse node
 * j and injection_weights[j] holds the fine basis values at that node.
 */
struct LevelTransferData {
    std::size_t num_children = 0;
    LocalIndex fine_nodes_per_cell = 0;
    LocalIndex coarse_nodes_per_cell = 0;

    std::vector<std::vector<Real>> prolongation;

    std::vector<std::size_t> injection_child;
    std::vector<std::vector<Real>> injection_weights;

    Real weight(std::size_t child, LocalIndex fine_local, LocalIndex coarse_local) const noexcept {
        return prolongation[child][static_cast<std::size_t>(fine_local) * coarse_nodes_per_cell + coarse_local];
    }
};

class FunctionSpaceHierarchy {
public:
    /**
     * @brief Build spaces on every level of a mesh hierarchy
     * @throws ConfigurationException for unsupported cells or elements
     */
    static std::shared_ptr<const FunctionSpaceHierarchy> build(
        std::shared_ptr<const MeshHierarchy> meshes,
        const elements::ElementDescriptor& element);

    static std::shared_ptr<const FunctionSpaceHierarchy> build(
        std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
        const elements::ElementDescriptor& element);

    /// Scalar convenience overloads
    static std::shared_ptr<const FunctionSpaceHierarchy> build(
        std::shared_ptr<const MeshHierarchy> meshes,
        elements::ElementFamily family, int degree);

    static std::shared_ptr<const FunctionSpaceHierarchy> build(
        std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
        elements::ElementFamily family, int degree);

    FunctionSpaceHierarchy(const FunctionSpaceHierarchy&) = delete;
    FunctionSpaceHierarchy& operator=(const FunctionSpaceHierarchy&) = delete;

    std::size_t num_levels() const noexcept { return spaces_.size(); }

    const FunctionSpace& space(std::size_t level) const { return *space_ptr(level); }
    std::shared_ptr<const FunctionSpace> space_ptr(std::size_t level) const;
    const std::vector<std::shared_ptr<const FunctionSpace>>& spaces() const noexcept { return spaces_; }

    const elements::ElementDescriptor& element() const noexcept { return element_; }

    bool is_extruded() const noexcept { return static_cast<bool>(extruded_); }
    const MeshHierarchy& mesh_hierarchy() const noexcept;
    const ExtrudedMeshHierarchy* extruded_hierarchy() const noexcept { return extruded_.get(); }

    /// Composite children per coarse cell
    std::size_t num_children() const noexcept;

    /// Parent of a cell of level `fine_level` (>= 1)
    ParentRef parent(std::size_t fine_level, GlobalIndex fine_cell) const;

    /// Cells of level coarse_level + 1 refining `coarse_cell`
    std::vector<index_t> children(std::size_t coarse_level, GlobalIndex coarse_cell) const;

    /// Child-to-parent reference map between coarse_level and coarse_level + 1
    const AffineMap& composite_child_map(std::size_t coarse_level, std::size_t child) const;

    /**
     * @brief Local transfer matrices between fine_level - 1 and fine_level
     *
     * Computed on first use and cached; safe to call concurrently.
     *
     * @throws GeometricConsistencyException if a coarse node is not covered
     *         by any child
     */
    const LevelTransferData& transfer_data(std::size_t fine_level) const;

    /// e.g. "CG2 on 3 levels (DOFs 21 -> 41 -> 81)"
    std::string summary() const;

private:
    FunctionSpaceHierarchy(std::shared_ptr<const MeshHierarchy> meshes,
                           std::shared_ptr<const ExtrudedMeshHierarchy> extruded,
                           const elements::ElementDescriptor& element);

    int locate_child(const basis::RefPoint& xi, basis::RefPoint& xi_child) const;
    std::unique_ptr<LevelTransferData> compute_transfer_data(std::size_t fine_level) const;

    std::shared_ptr<const MeshHierarchy> meshes_;
    std::shared_ptr<const ExtrudedMeshHierarchy> extruded_;
    elements::ElementDescriptor element_;
    std::vector<std::shared_ptr<const FunctionSpace>> spaces_;

    mutable std::mutex cache_mutex_;
    mutable std::vector<std::unique_ptr<LevelTransferData>> transfer_cache_;
};

/**
 * @brief Vector-valued spaces with one component per geometric dimension
 */
struct VectorFunctionSpaceHierarchy {
    /// @param components Number of components; 0 selects the geometric dimension
    static std::shared_ptr<const FunctionSpaceHierarchy> build(
        std::shared_ptr<const MeshHierarchy> meshes,
        elements::ElementFamily family, int degree, int components = 0);

    static std::shared_ptr<const FunctionSpaceHierarchy> build(
        std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
        elements::ElementFamily family, int degree, int components = 0);
};

/**
 * @brief Mixed spaces: one FunctionSpaceHierarchy per component
 */
class MixedFunctionSpaceHierarchy {
public:
    static std::shared_ptr<const MixedFunctionSpaceHierarchy> build(
        std::shared_ptr<const MeshHierarchy> meshes,
        const std::vector<elements::ElementDescriptor>& components);

    static std::shared_ptr<const MixedFunctionSpaceHierarchy> build(
        std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
        const std::vector<elements::ElementDescriptor>& components);

    MixedFunctionSpaceHierarchy(const MixedFunctionSpaceHierarchy&) = delete;
    MixedFunctionSpaceHierarchy& operator=(const MixedFunctionSpaceHierarchy&) = delete;

    std::size_t num_levels() const noexcept { return spaces_.size(); }
    std::size_t num_components() const noexcept { return components_.size(); }

    const FunctionSpaceHierarchy& component(std::size_t i) const { return *components_.at(i); }
    const std::shared_ptr<const FunctionSpaceHierarchy>& component_ptr(std::size_t i) const {
        return components_.at(i);
    }

    const MixedSpace& space(std::size_t level) const { return *space_ptr(level); }
    std::shared_ptr<const MixedSpace> space_ptr(std::size_t level) const;

private:
    MixedFunctionSpaceHierarchy() = default;

    static std::shared_ptr<const MixedFunctionSpaceHierarchy> assemble(
        std::vector<std::shared_ptr<const FunctionSpaceHierarchy>> components);

    std::vector<std::shared_ptr<const FunctionSpaceHierarchy>> components_;
    std::vector<std::shared_ptr<const MixedSpace>> spaces_;
};

} // namespace spaces
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_SPACES_FUNCTIONSPACEHIERARCHY_H
