/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "DofMap.h"

#include <algorithm>
#include <new>

namespace mgfem {
namespace FE {
namespace dofs {

namespace {

std::string range_text(GlobalIndex n) {
    return "[0, " + std::to_string(n) + ")";
}

} // namespace

void DofMap::reserve(GlobalIndex n_cells, LocalIndex dofs_per_cell) {
    requireBuilding("reserve");
    cell_dof_offsets_.reserve(static_cast<std::size_t>(n_cells) + 1);
    cell_dofs_.reserve(static_cast<std::size_t>(n_cells) * dofs_per_cell);
}

void DofMap::setCellDofs(GlobalIndex cell_id, std::span<const GlobalIndex> dof_ids) {
    requireBuilding("setCellDofs");
    if (cell_id != n_cells_) {
        throw DofException("DofMap::setCellDofs: expected cell " + std::to_string(n_cells_) +
                           " next, got cell " + std::to_string(cell_id));
    }
    cell_dofs_.insert(cell_dofs_.end(), dof_ids.begin(), dof_ids.end());
    cell_dof_offsets_.push_back(static_cast<GlobalIndex>(cell_dofs_.size()));
    ++n_cells_;
}

void DofMap::setNumDofs(GlobalIndex n_dofs) {
    requireBuilding("setNumDofs");
    n_dofs_total_ = n_dofs;
}

void DofMap::finalize() {
    requireBuilding("finalize");
    if (const auto error = validationError(); !error.empty()) {
        throw DofException("DofMap::finalize: " + error);
    }

    // Walking cells in order makes the lowest (cell, local) pair the owner
    owners_.assign(static_cast<std::size_t>(n_dofs_total_), DofOwner{});
    for (GlobalIndex c = 0; c < n_cells_; ++c) {
        const auto dofs = cellRange(c);
        for (std::size_t i = 0; i < dofs.size(); ++i) {
            auto& owner = owners_[static_cast<std::size_t>(dofs[i])];
            if (owner.cell == INVALID_GLOBAL_INDEX) {
                owner = DofOwner{c, static_cast<LocalIndex>(i)};
            }
        }
    }

    const auto orphan = std::find_if(owners_.begin(), owners_.end(), [](const DofOwner& o) {
        return o.cell == INVALID_GLOBAL_INDEX;
    });
    if (orphan != owners_.end()) {
        throw DofException("DofMap::finalize: no cell references this DOF",
                           static_cast<GlobalIndex>(orphan - owners_.begin()), __FILE__, __LINE__);
    }

    state_ = DofMapState::Finalized;
}

std::span<const GlobalIndex> DofMap::getCellDofs(GlobalIndex cell_id) const {
    if (cell_id < 0 || cell_id >= n_cells_) {
        throw DofException("DofMap: cell " + std::to_string(cell_id) + " outside " +
                           range_text(n_cells_));
    }
    return cellRange(cell_id);
}

GlobalIndex DofMap::localToGlobal(GlobalIndex cell_id, LocalIndex local_dof) const {
    const auto dofs = getCellDofs(cell_id);
    if (local_dof >= dofs.size()) {
        throw DofException("DofMap::localToGlobal: cell " + std::to_string(cell_id) + " has " +
                           std::to_string(dofs.size()) + " DOFs, asked for local " +
                           std::to_string(local_dof));
    }
    return dofs[local_dof];
}

LocalIndex DofMap::getNumCellDofs(GlobalIndex cell_id) const {
    return static_cast<LocalIndex>(getCellDofs(cell_id).size());
}

LocalIndex DofMap::getMaxDofsPerCell() const noexcept {
    LocalIndex widest = 0;
    for (GlobalIndex c = 0; c < n_cells_; ++c) {
        widest = std::max(widest, static_cast<LocalIndex>(cellRange(c).size()));
    }
    return widest;
}

const DofOwner& DofMap::getDofOwner(GlobalIndex global_dof) const {
    if (!isFinalized()) {
        throw DofException("DofMap::getDofOwner: owners exist only after finalize()");
    }
    if (global_dof < 0 || global_dof >= n_dofs_total_) {
        throw DofException("DofMap::getDofOwner: DOF outside " + range_text(n_dofs_total_),
                           global_dof, __FILE__, __LINE__);
    }
    return owners_[static_cast<std::size_t>(global_dof)];
}

std::vector<LocalIndex> DofMap::getDofMultiplicity() const {
    std::vector<LocalIndex> count(static_cast<std::size_t>(n_dofs_total_), 0);
    for (const GlobalIndex d : cell_dofs_) {
        if (d >= 0 && d < n_dofs_total_) {
            ++count[static_cast<std::size_t>(d)];
        }
    }
    return count;
}

bool DofMap::validate() const noexcept {
    try {
        return validationError().empty();
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::string DofMap::validationError() const {
    for (GlobalIndex c = 0; c < n_cells_; ++c) {
        if (cellRange(c).empty()) {
            return "cell " + std::to_string(c) + " has no DOFs";
        }
    }
    for (std::size_t k = 0; k < cell_dofs_.size(); ++k) {
        const GlobalIndex d = cell_dofs_[k];
        if (d < 0 || d >= n_dofs_total_) {
            return "DOF index " + std::to_string(d) + " (entry " + std::to_string(k) +
                   ") outside " + range_text(n_dofs_total_);
        }
    }
    return {};
}

std::span<const GlobalIndex> DofMap::cellRange(GlobalIndex cell_id) const {
    const auto c = static_cast<std::size_t>(cell_id);
    const auto begin = static_cast<std::size_t>(cell_dof_offsets_[c]);
    const auto end = static_cast<std::size_t>(cell_dof_offsets_[c + 1]);
    return {cell_dofs_.data() + begin, end - begin};
}

void DofMap::requireBuilding(const char* operation) const {
    if (isFinalized()) {
        throw DofException(std::string("DofMap::") + operation + ": map is already finalized");
    }
}

} // namespace dofs
} // namespace FE
} // namespace mgfem
