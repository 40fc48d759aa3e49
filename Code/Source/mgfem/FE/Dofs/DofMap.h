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
#ifndef MGFEM_FE_DOFS_DOFMAP_H
#define MGFEM_FE_DOFS_DOFMAP_H

/**
 * @file DofMap.h
 * @brief Cell to global node mapping for Lagrange function spaces
 *
 * Vector-valued spaces share one DofMap across components; the component
 * index is applied on top of the node index by the function storage.
 */

#include "Core/Types.h"
#include "Core/FEException.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mgfem {
namespace FE {
namespace dofs {

/// A DofMap is filled while Building and read-only (and thread-safe) once Finalized
enum class DofMapState : std::uint8_t {
    Building,
    Finalized
};

/// First (cell, local index) pair that references a global DOF
struct DofOwner {
    GlobalIndex cell{INVALID_GLOBAL_INDEX};
    LocalIndex local{INVALID_LOCAL_INDEX};
};

/**
 * @brief Cell-major table of global DOF indices in CSR layout
 *
 * Cells are appended in increasing order with setCellDofs(). finalize()
 * checks the table and fixes one owner per DOF: the lowest cell, then the
 * lowest local index, that references it. Interpolation and the level
 * transfers evaluate each DOF through its owner.
 *
 * Every failure is reported as a DofException.
 */
class DofMap {
public:
    DofMap() = default;

    void reserve(GlobalIndex n_cells, LocalIndex dofs_per_cell = 0);

    /// @p cell_id must equal the number of cells set so far
    void setCellDofs(GlobalIndex cell_id, std::span<const GlobalIndex> dof_ids);

    void setNumDofs(GlobalIndex n_dofs);

    /// @throws DofException if validationError() is non-empty or a DOF has no cell
    void finalize();

    [[nodiscard]] bool isFinalized() const noexcept {
        return state_ == DofMapState::Finalized;
    }

    [[nodiscard]] DofMapState state() const noexcept { return state_; }

    [[nodiscard]] std::span<const GlobalIndex> getCellDofs(GlobalIndex cell_id) const;

    [[nodiscard]] GlobalIndex localToGlobal(GlobalIndex cell_id, LocalIndex local_dof) const;

    [[nodiscard]] LocalIndex getNumCellDofs(GlobalIndex cell_id) const;

    [[nodiscard]] GlobalIndex getNumDofs() const noexcept { return n_dofs_total_; }

    [[nodiscard]] GlobalIndex getNumCells() const noexcept { return n_cells_; }

    [[nodiscard]] LocalIndex getMaxDofsPerCell() const noexcept;

    /// Requires finalize()
    [[nodiscard]] const DofOwner& getDofOwner(GlobalIndex global_dof) const;

    /// Indexed by global DOF; empty before finalize()
    [[nodiscard]] std::span<const DofOwner> getDofOwners() const noexcept {
        return {owners_.data(), owners_.size()};
    }

    /// Number of cells referencing each DOF (1 for every DG DOF)
    [[nodiscard]] std::vector<LocalIndex> getDofMultiplicity() const;

    /// CSR offsets, getNumCells() + 1 entries starting at 0
    [[nodiscard]] std::span<const GlobalIndex> getOffsets() const noexcept {
        return {cell_dof_offsets_.data(), cell_dof_offsets_.size()};
    }

    [[nodiscard]] std::span<const GlobalIndex> getDofIndices() const noexcept {
        return {cell_dofs_.data(), cell_dofs_.size()};
    }

    [[nodiscard]] bool validate() const noexcept;

    /**
     * @brief Describe the first problem in the table
     *
     * Reports a cell with no DOFs or a DOF index outside [0, getNumDofs()).
     * Empty when the table is consistent.
     */
    [[nodiscard]] std::string validationError() const;

private:
    std::span<const GlobalIndex> cellRange(GlobalIndex cell_id) const;
    void requireBuilding(const char* operation) const;

    std::vector<GlobalIndex> cell_dof_offsets_{0};
    std::vector<GlobalIndex> cell_dofs_;
    std::vector<DofOwner> owners_;

    GlobalIndex n_cells_{0};
    GlobalIndex n_dofs_total_{0};

    DofMapState state_{DofMapState::Building};
};

} // namespace dofs
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_DOFS_DOFMAP_H
