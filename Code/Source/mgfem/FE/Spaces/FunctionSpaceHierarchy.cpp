/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "FunctionSpaceHierarchy.h"
#include "Core/Logger.h"

#include <algorithm>
#include <utility>

namespace mgfem {
namespace FE {
namespace spaces {

FunctionSpaceHierarchy::FunctionSpaceHierarchy(std::shared_ptr<const MeshHierarchy> meshes,
                                               std::shared_ptr<const ExtrudedMeshHierarchy> extruded,
                                               const elements::ElementDescriptor& element)
    : meshes_(std::move(meshes)), extruded_(std::move(extruded)), element_(element) {}

std::shared_ptr<const FunctionSpaceHierarchy> FunctionSpaceHierarchy::build(
    std::shared_ptr<const MeshHierarchy> meshes,
    const elements::ElementDescriptor& element) {
    FE_CHECK_NOT_NULL(meshes.get(), "FunctionSpaceHierarchy::build: mesh hierarchy");
    element.validate();

    std::shared_ptr<FunctionSpaceHierarchy> h(new FunctionSpaceHierarchy(meshes, nullptr, element));
    for (std::size_t level = 0; level < meshes->num_levels(); ++level) {
        auto space = std::make_shared<FunctionSpace>(meshes->mesh_ptr(level), element);
        space->hierarchy_ = h;
        space->level_ = level;
        h->spaces_.push_back(std::move(space));
    }
    h->transfer_cache_.resize(h->spaces_.size());

    FE_LOG_INFO("FunctionSpaceHierarchy: " + h->summary());
    return h;
}

std::shared_ptr<const FunctionSpaceHierarchy> FunctionSpaceHierarchy::build(
    std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
    const elements::ElementDescriptor& element) {
    FE_CHECK_NOT_NULL(meshes.get(), "FunctionSpaceHierarchy::build: extruded mesh hierarchy");
    element.validate();

    std::shared_ptr<FunctionSpaceHierarchy> h(
        new FunctionSpaceHierarchy(meshes->base_hierarchy_ptr(), meshes, element));
    for (std::size_t level = 0; level < meshes->num_levels(); ++level) {
        auto space = std::make_shared<FunctionSpace>(meshes->mesh_ptr(level), element);
        space->hierarchy_ = h;
        space->level_ = level;
        h->spaces_.push_back(std::move(space));
    }
    h->transfer_cache_.resize(h->spaces_.size());

    FE_LOG_INFO("FunctionSpaceHierarchy: " + h->summary());
    return h;
}

std::shared_ptr<const FunctionSpaceHierarchy> FunctionSpaceHierarchy::build(
    std::shared_ptr<const MeshHierarchy> meshes,
    elements::ElementFamily family, int degree) {
    return build(std::move(meshes), elements::ElementDescriptor::scalar(family, degree));
}

std::shared_ptr<const FunctionSpaceHierarchy> FunctionSpaceHierarchy::build(
    std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
    elements::ElementFamily family, int degree) {
    return build(std::move(meshes), elements::ElementDescriptor::scalar(family, degree));
}

std::shared_ptr<const FunctionSpace> FunctionSpaceHierarchy::space_ptr(std::size_t level) const {
    FE_CHECK_INDEX(static_cast<GlobalIndex>(level), static_cast<GlobalIndex>(spaces_.size()));
    return spaces_[level];
}

const MeshHierarchy& FunctionSpaceHierarchy::mesh_hierarchy() const noexcept {
    return *meshes_;
}

std::size_t FunctionSpaceHierarchy::num_children() const noexcept {
    return meshes_->num_children();
}

ParentRef FunctionSpaceHierarchy::parent(std::size_t fine_level, GlobalIndex fine_cell) const {
    FE_CHECK_ARG(fine_level >= 1 && fine_level < num_levels(),
                 "FunctionSpaceHierarchy::parent: invalid fine level " + std::to_string(fine_level));
    FE_CHECK_INDEX(fine_cell, static_cast<GlobalIndex>(spaces_[fine_level]->num_cells()));
    if (extruded_) {
        return extruded_->parent(fine_level, static_cast<index_t>(fine_cell));
    }
    return meshes_->parent(fine_level, static_cast<index_t>(fine_cell));
}

std::vector<index_t> FunctionSpaceHierarchy::children(std::size_t coarse_level,
                                                      GlobalIndex coarse_cell) const {
    FE_CHECK_ARG(coarse_level + 1 < num_levels(),
                 "FunctionSpaceHierarchy::children: invalid coarse level " + std::to_string(coarse_level));
    FE_CHECK_INDEX(coarse_cell, static_cast<GlobalIndex>(spaces_[coarse_level]->num_cells()));
    if (extruded_) {
        return extruded_->children(coarse_level, static_cast<index_t>(coarse_cell));
    }
    return meshes_->children(coarse_level, static_cast<index_t>(coarse_cell));
}

const AffineMap& FunctionSpaceHierarchy::composite_child_map(std::size_t coarse_level,
                                                             std::size_t child) const {
    FE_CHECK_ARG(coarse_level + 1 < num_levels(),
                 "FunctionSpaceHierarchy::composite_child_map: invalid coarse level " +
                     std::to_string(coarse_level));
    FE_CHECK_ARG(child < num_children(),
                 "FunctionSpaceHierarchy::composite_child_map: invalid child " + std::to_string(child));
    if (extruded_) {
        return extruded_->composite_child_map(coarse_level, child);
    }
    return meshes_->composite_child_map(coarse_level, child);
}

int FunctionSpaceHierarchy::locate_child(const basis::RefPoint& xi, basis::RefPoint& xi_child) const {
    if (extruded_) {
        return extruded_->locate_child(xi, xi_child, config::REFERENCE_TOLERANCE);
    }
    return meshes_->locate_child(xi, xi_child, config::REFERENCE_TOLERANCE);
}

std::unique_ptr<LevelTransferData> FunctionSpaceHierarchy::compute_transfer_data(std::size_t fine_level) const {
    FE_TIMED_SCOPE_LEVEL("transfer matrices for level " + std::to_string(fine_level), LogLevel::DEBUG);
    const basis::BasisFunction& fine_basis = spaces_[fine_level]->basis();
    const basis::BasisFunction& coarse_basis = spaces_[fine_level - 1]->basis();

    auto data = std::make_unique<LevelTransferData>();
    data->num_children = num_children();
    data->fine_nodes_per_cell = static_cast<LocalIndex>(fine_basis.size());
    data->coarse_nodes_per_cell = static_cast<LocalIndex>(coarse_basis.size());

    const std::size_t nf = fine_basis.size();
    const std::size_t nc = coarse_basis.size();
    std::vector<Real> vals;

    data->prolongation.resize(data->num_children);
    for (std::size_t c = 0; c < data->num_children; ++c) {
        const AffineMap& to_parent = composite_child_map(fine_level - 1, c);
        auto& matrix = data->prolongation[c];
        matrix.resize(nf * nc);
        for (std::size_t i = 0; i < nf; ++i) {
            coarse_basis.evaluate_values(to_parent.apply(fine_basis.nodes()[i]), vals);
            std::copy(vals.begin(), vals.end(), matrix.begin() + static_cast<std::ptrdiff_t>(i * nc));
        }
    }

    data->injection_child.resize(nc);
    data->injection_weights.resize(nc);
    for (std::size_t j = 0; j < nc; ++j) {
        basis::RefPoint xi_child{};
        const int c = locate_child(coarse_basis.nodes()[j], xi_child);
        if (c < 0) {
            FE_THROW(GeometricConsistencyException,
                     "Coarse node " + std::to_string(j) + " is not covered by any child cell");
        }
        data->injection_child[j] = static_cast<std::size_t>(c);
        fine_basis.evaluate_values(xi_child, data->injection_weights[j]);
    }

    return data;
}

const LevelTransferData& FunctionSpaceHierarchy::transfer_data(std::size_t fine_level) const {
    FE_CHECK_ARG(fine_level >= 1 && fine_level < num_levels(),
                 "FunctionSpaceHierarchy::transfer_data: invalid fine level " + std::to_string(fine_level));

    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto& slot = transfer_cache_[fine_level];
    if (!slot) {
        slot = compute_transfer_data(fine_level);
        FE_LOG_DEBUG("FunctionSpaceHierarchy: cached transfer matrices for levels " +
                     std::to_string(fine_level - 1) + " -> " + std::to_string(fine_level));
    }
    return *slot;
}

std::string FunctionSpaceHierarchy::summary() const {
    std::string s = element_.to_string() + " on " + std::to_string(num_levels()) + " levels of " +
                    cell_family_name(meshes_->cell_family()) + " cells";
    if (extruded_) {
        s += " extruded by " + std::to_string(extruded_->layers()) + " layers";
    }
    s += " (DOFs";
    for (std::size_t level = 0; level < spaces_.size(); ++level) {
        s += (level == 0 ? " " : " -> ") + std::to_string(spaces_[level]->num_dofs());
    }
    s += ")";
    return s;
}

// ---------------------------------------------------------------------------
// VectorFunctionSpaceHierarchy
// ---------------------------------------------------------------------------

std::shared_ptr<const FunctionSpaceHierarchy> VectorFunctionSpaceHierarchy::build(
    std::shared_ptr<const MeshHierarchy> meshes,
    elements::ElementFamily family, int degree, int components) {
    FE_CHECK_NOT_NULL(meshes.get(), "VectorFunctionSpaceHierarchy::build: mesh hierarchy");
    const int n = components > 0 ? components : meshes->mesh(0).dim();
    return FunctionSpaceHierarchy::build(std::move(meshes),
                                         elements::ElementDescriptor::vector(family, degree, n));
}

std::shared_ptr<const FunctionSpaceHierarchy> VectorFunctionSpaceHierarchy::build(
    std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
    elements::ElementFamily family, int degree, int components) {
    FE_CHECK_NOT_NULL(meshes.get(), "VectorFunctionSpaceHierarchy::build: extruded mesh hierarchy");
    const int n = components > 0 ? components : meshes->mesh(0).dim();
    return FunctionSpaceHierarchy::build(std::move(meshes),
                                         elements::ElementDescriptor::vector(family, degree, n));
}

// ---------------------------------------------------------------------------
// MixedFunctionSpaceHierarchy
// ---------------------------------------------------------------------------

std::shared_ptr<const MixedFunctionSpaceHierarchy> MixedFunctionSpaceHierarchy::build(
    std::shared_ptr<const MeshHierarchy> meshes,
    const std::vector<elements::ElementDescriptor>& components) {
    FE_CHECK_CONFIG(!components.empty(), "MixedFunctionSpaceHierarchy::build: no components");
    std::vector<std::shared_ptr<const FunctionSpaceHierarchy>> parts;
    for (const auto& element : components) {
        parts.push_back(FunctionSpaceHierarchy::build(meshes, element));
    }
    return assemble(std::move(parts));
}

std::shared_ptr<const MixedFunctionSpaceHierarchy> MixedFunctionSpaceHierarchy::build(
    std::shared_ptr<const ExtrudedMeshHierarchy> meshes,
    const std::vector<elements::ElementDescriptor>& components) {
    FE_CHECK_CONFIG(!components.empty(), "MixedFunctionSpaceHierarchy::build: no components");
    std::vector<std::shared_ptr<const FunctionSpaceHierarchy>> parts;
    for (const auto& element : components) {
        parts.push_back(FunctionSpaceHierarchy::build(meshes, element));
    }
    return assemble(std::move(parts));
}

std::shared_ptr<const MixedFunctionSpaceHierarchy> MixedFunctionSpaceHierarchy::assemble(
    std::vector<std::shared_ptr<const FunctionSpaceHierarchy>> components) {
    std::shared_ptr<MixedFunctionSpaceHierarchy> h(new MixedFunctionSpaceHierarchy());
    h->components_ = std::move(components);

    const std::size_t levels = h->components_.front()->num_levels();
    for (std::size_t level = 0; level < levels; ++level) {
        auto mixed = std::make_shared<MixedSpace>();
        for (std::size_t i = 0; i < h->components_.size(); ++i) {
            mixed->add_component(std::to_string(i), h->components_[i]->space_ptr(level));
        }
        h->spaces_.push_back(std::move(mixed));
    }
    return h;
}

std::shared_ptr<const MixedSpace> MixedFunctionSpaceHierarchy::space_ptr(std::size_t level) const {
    FE_CHECK_INDEX(static_cast<GlobalIndex>(level), static_cast<GlobalIndex>(spaces_.size()));
    return spaces_[level];
}

} // namespace spaces
} // namespace FE
} // namespace mgfem
