/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_TRANSFER_LEVELTRANSFER_H
#define MGFEM_FE_TRANSFER_LEVELTRANSFER_H

/**
 * @file LevelTransfer.h
 * @brief Grid transfer between adjacent levels of a function space hierarchy
 *
 * Three operators act on functions living on levels L and L + 1 of one
 * FunctionSpaceHierarchy (or of the component hierarchies of one
 * MixedFunctionSpaceHierarchy):
 *
 *  - prolong:  coarse -> fine, exact re-expansion of the coarse field in
 *              the fine basis (coarse basis evaluated at fine nodes),
 *  - restrict: fine -> coarse, transpose of prolong,
 *  - inject:   fine -> coarse, fine field sampled at coarse nodes.
 *
 * Every operand check runs before the output array is touched; a rejected
 * call leaves the output unchanged.
 */

#include "Core/FEConfig.h"
#include "Function/Function.h"

#include <vector>

namespace mgfem {
namespace FE {
namespace transfer {

/// Options for level transfers
struct TransferOptions {
    /// Re-evaluate shared CG nodes from every owning cell and compare
    bool check_continuity = false;

    /// Disagreement tolerated before a DOF counts as a mismatch; must be >= 0
    Real continuity_tolerance = config::DEFAULT_CONTINUITY_TOLERANCE;
};

/// Outcome of a level transfer
struct TransferReport {
    GlobalIndex dofs_written = 0;
    /// Distinct fine DOFs whose non-owning evaluations disagree with the written value
    GlobalIndex continuity_mismatches = 0;
    Real max_mismatch = 0.0;

    TransferReport& operator+=(const TransferReport& other) noexcept;
};

/**
 * @brief Collects disagreements between evaluations of shared CG DOFs
 *
 * prolong writes each fine DOF from its owning cell. With check_continuity
 * set, every other cell holding the DOF evaluates it again and reports the
 * difference here.
 */
class ContinuityAudit {
public:
    /// @throws InvalidArgumentException if tolerance is negative or not finite
    ContinuityAudit(GlobalIndex num_dofs, Real tolerance);

    /// Difference seen for `dof` from one non-owning cell
    void observe(GlobalIndex dof, Real difference);

    GlobalIndex mismatches() const noexcept { return mismatches_; }
    Real max_difference() const noexcept { return max_difference_; }

    /**
     * @brief Copy the counts into `report` and log a WARNING if any DOF
     *        exceeded the tolerance
     */
    void finish(std::size_t fine_level, TransferReport& report) const;

private:
    Real tolerance_;
    std::vector<char> flagged_;
    GlobalIndex mismatches_ = 0;
    Real max_difference_ = 0.0;
};

/**
 * @brief Prolong a coarse function onto the next finer level
 *
 * @param coarse Function on level L
 * @param fine   Function on level L + 1 of the same hierarchy; overwritten
 * @throws ConfigurationException if the operands are not adjacent levels
 *         of one hierarchy
 * @throws InvalidArgumentException for a negative continuity tolerance
 */
TransferReport prolong(const functions::Function& coarse,
                       functions::Function& fine,
                       const TransferOptions& options = {});

TransferReport prolong(const functions::MixedFunction& coarse,
                       functions::MixedFunction& fine,
                       const TransferOptions& options = {});

/**
 * @brief Transpose of prolong
 *
 * coarse[j] = sum over fine DOFs i of P(i, j) * fine[i], where row i of P
 * is taken from the owning cell of fine DOF i. Overwrites `coarse`.
 */
TransferReport restrict(const functions::Function& fine,
                        functions::Function& coarse);

TransferReport restrict(const functions::MixedFunction& fine,
                        functions::MixedFunction& coarse);

/**
 * @brief Sample the fine function at the coarse nodes
 *
 * Exact for fine functions that lie in the coarse space.
 */
TransferReport inject(const functions::Function& fine,
                      functions::Function& coarse);

TransferReport inject(const functions::MixedFunction& fine,
                      functions::MixedFunction& coarse);

} // namespace transfer
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_TRANSFER_LEVELTRANSFER_H
