/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "LevelTransfer.h"
#include "Core/Logger.h"
#include "Spaces/FunctionSpaceHierarchy.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace mgfem {
namespace FE {
namespace transfer {

using functions::Function;
using functions::MixedFunction;
using spaces::FunctionSpace;
using spaces::FunctionSpaceHierarchy;
using spaces::LevelTransferData;

namespace {

struct LevelPair {
    std::shared_ptr<const FunctionSpaceHierarchy> hierarchy;
    std::size_t fine_level = 0;
};

LevelPair check_levels(const FunctionSpace& coarse, const FunctionSpace& fine, const std::string& op) {
    auto coarse_h = coarse.hierarchy();
    auto fine_h = fine.hierarchy();
    FE_CHECK_CONFIG(coarse_h && fine_h,
                    op + ": both functions must live on spaces of a FunctionSpaceHierarchy");
    FE_CHECK_CONFIG(coarse_h == fine_h, op + ": functions belong to different hierarchies");
    FE_CHECK_CONFIG(coarse.element() == fine.element(),
                    op + ": element mismatch (" + coarse.element().to_string() + " vs " +
                        fine.element().to_string() + ")");
    FE_CHECK_CONFIG(fine.level() == coarse.level() + 1,
                    op + ": levels must be adjacent (coarse " + std::to_string(coarse.level()) +
                        ", fine " + std::to_string(fine.level()) + ")");
    return {coarse_h, fine.level()};
}

std::vector<LevelPair> check_mixed_levels(const MixedFunction& coarse,
                                          const MixedFunction& fine,
                                          const std::string& op) {
    FE_CHECK_CONFIG(coarse.num_components() == fine.num_components(),
                    op + ": component count mismatch (" + std::to_string(coarse.num_components()) +
                        " vs " + std::to_string(fine.num_components()) + ")");
    std::vector<LevelPair> pairs;
    for (std::size_t i = 0; i < coarse.num_components(); ++i) {
        pairs.push_back(check_levels(coarse.sub(i).space(), fine.sub(i).space(),
                                     op + " (component " + std::to_string(i) + ")"));
    }
    // Build every component's local matrices before the first component is written.
    for (const auto& pair : pairs) {
        (void)pair.hierarchy->transfer_data(pair.fine_level);
    }
    return pairs;
}

void check_options(const TransferOptions& options) {
    FE_CHECK_ARG(std::isfinite(options.continuity_tolerance) && options.continuity_tolerance >= 0.0,
                 "prolong: continuity_tolerance must be a non-negative number");
}

std::vector<ParentRef> cell_parents(const FunctionSpaceHierarchy& h, std::size_t fine_level) {
    const auto n_cells = static_cast<GlobalIndex>(h.space(fine_level).num_cells());
    std::vector<ParentRef> parents(static_cast<std::size_t>(n_cells));
    for (GlobalIndex c = 0; c < n_cells; ++c) {
        parents[static_cast<std::size_t>(c)] = h.parent(fine_level, c);
    }
    return parents;
}

/// Coarse field of the parent cell evaluated at a fine cell node
class ParentEvaluator {
public:
    ParentEvaluator(const LevelTransferData& data,
                    const std::vector<ParentRef>& parents,
                    const dofs::DofMap& coarse_map,
                    std::span<const Real> coarse_values,
                    std::size_t value_size)
        : data_(data),
          parents_(parents),
          offsets_(coarse_map.getOffsets()),
          dofs_(coarse_map.getDofIndices()),
          values_(coarse_values),
          value_size_(value_size) {}

    Real operator()(GlobalIndex fine_cell, LocalIndex fine_local, std::size_t component) const noexcept {
        const ParentRef& p = parents_[static_cast<std::size_t>(fine_cell)];
        const std::size_t nc = data_.coarse_nodes_per_cell;
        const Real* w = data_.prolongation[static_cast<std::size_t>(p.child)].data() +
                        static_cast<std::size_t>(fine_local) * nc;
        const GlobalIndex* nodes = dofs_.data() + offsets_[static_cast<std::size_t>(p.cell)];
        Real sum = 0.0;
        for (std::size_t j = 0; j < nc; ++j) {
            sum += w[j] * values_[static_cast<std::size_t>(nodes[j]) * value_size_ + component];
        }
        return sum;
    }

private:
    const LevelTransferData& data_;
    const std::vector<ParentRef>& parents_;
    std::span<const GlobalIndex> offsets_;
    std::span<const GlobalIndex> dofs_;
    std::span<const Real> values_;
    std::size_t value_size_;
};

TransferReport prolong_checked(const Function& coarse, Function& fine,
                               const LevelPair& pair, const TransferOptions& options) {
    const FunctionSpaceHierarchy& h = *pair.hierarchy;
    const std::size_t level = pair.fine_level;
    const LevelTransferData& data = h.transfer_data(level);
    const auto parents = cell_parents(h, level);

    const auto& fine_map = fine.space().dof_map();
    const auto owners = fine_map.getDofOwners();
    const auto vs = static_cast<std::size_t>(fine.value_size());
    const ParentEvaluator eval(data, parents, coarse.space().dof_map(), coarse.values(), vs);

    auto out = fine.values();
    const GlobalIndex n_nodes = fine.space().num_nodes();

#if FE_HAS_OPENMP
#pragma omp parallel for schedule(static)
#endif
    for (GlobalIndex n = 0; n < n_nodes; ++n) {
        const auto& owner = owners[static_cast<std::size_t>(n)];
        for (std::size_t k = 0; k < vs; ++k) {
            out[static_cast<std::size_t>(n) * vs + k] = eval(owner.cell, owner.local, k);
        }
    }

    TransferReport report;
    report.dofs_written = fine.num_dofs();

    if (options.check_continuity && fine.space().family() == elements::ElementFamily::CG) {
        ContinuityAudit audit(fine.num_dofs(), options.continuity_tolerance);
        const auto offsets = fine_map.getOffsets();
        const auto cell_dofs = fine_map.getDofIndices();
        const auto n_cells = fine_map.getNumCells();
        for (GlobalIndex c = 0; c < n_cells; ++c) {
            const auto begin = offsets[static_cast<std::size_t>(c)];
            const auto end = offsets[static_cast<std::size_t>(c) + 1];
            for (GlobalIndex k = begin; k < end; ++k) {
                const auto node = static_cast<std::size_t>(cell_dofs[static_cast<std::size_t>(k)]);
                const auto local = static_cast<LocalIndex>(k - begin);
                const auto& owner = owners[node];
                if (owner.cell == c && owner.local == local) {
                    continue;
                }
                for (std::size_t comp = 0; comp < vs; ++comp) {
                    const std::size_t dof = node * vs + comp;
                    audit.observe(static_cast<GlobalIndex>(dof), std::abs(eval(c, local, comp) - out[dof]));
                }
            }
        }
        audit.finish(level, report);
    }

    FE_LOG_DEBUG("prolong: level " + std::to_string(level - 1) + " -> " + std::to_string(level) +
                 ", " + std::to_string(report.dofs_written) + " DOFs written");
    return report;
}

TransferReport restrict_checked(const Function& fine, Function& coarse, const LevelPair& pair) {
    const FunctionSpaceHierarchy& h = *pair.hierarchy;
    const std::size_t level = pair.fine_level;
    const LevelTransferData& data = h.transfer_data(level);
    const auto parents = cell_parents(h, level);

    const auto owners = fine.space().dof_map().getDofOwners();
    const auto& coarse_map = coarse.space().dof_map();
    const auto offsets = coarse_map.getOffsets();
    const auto coarse_dofs = coarse_map.getDofIndices();
    const auto vs = static_cast<std::size_t>(fine.value_size());
    const std::size_t nc = data.coarse_nodes_per_cell;
    const auto in = fine.values();

    std::vector<Real> acc(static_cast<std::size_t>(coarse.num_dofs()), Real(0));
    const GlobalIndex n_nodes = fine.space().num_nodes();
    for (GlobalIndex n = 0; n < n_nodes; ++n) {
        const auto& owner = owners[static_cast<std::size_t>(n)];
        const ParentRef& p = parents[static_cast<std::size_t>(owner.cell)];
        const Real* w = data.prolongation[static_cast<std::size_t>(p.child)].data() +
                        static_cast<std::size_t>(owner.local) * nc;
        const GlobalIndex* nodes = coarse_dofs.data() + offsets[static_cast<std::size_t>(p.cell)];
        for (std::size_t j = 0; j < nc; ++j) {
            for (std::size_t k = 0; k < vs; ++k) {
                acc[static_cast<std::size_t>(nodes[j]) * vs + k] +=
                    w[j] * in[static_cast<std::size_t>(n) * vs + k];
            }
        }
    }
    coarse.set_values(acc);

    FE_LOG_DEBUG("restrict: level " + std::to_string(level) + " -> " + std::to_string(level - 1));

    TransferReport report;
    report.dofs_written = coarse.num_dofs();
    return report;
}

TransferReport inject_checked(const Function& fine, Function& coarse, const LevelPair& pair) {
    const FunctionSpaceHierarchy& h = *pair.hierarchy;
    const std::size_t level = pair.fine_level;
    const LevelTransferData& data = h.transfer_data(level);

    const auto& coarse_map = coarse.space().dof_map();
    const auto owners = coarse_map.getDofOwners();
    const GlobalIndex n_coarse_nodes = coarse.space().num_nodes();

    // Fine cell sampled by each coarse node
    std::vector<GlobalIndex> sample_cell(static_cast<std::size_t>(n_coarse_nodes));
    {
        const auto n_cells = coarse_map.getNumCells();
        const std::size_t n_children = h.num_children();
        std::vector<index_t> kids_flat;
        kids_flat.reserve(static_cast<std::size_t>(n_cells) * n_children);
        for (GlobalIndex c = 0; c < n_cells; ++c) {
            const auto kids = h.children(level - 1, c);
            kids_flat.insert(kids_flat.end(), kids.begin(), kids.end());
        }
        for (GlobalIndex n = 0; n < n_coarse_nodes; ++n) {
            const auto& owner = owners[static_cast<std::size_t>(n)];
            const std::size_t child = data.injection_child[owner.local];
            sample_cell[static_cast<std::size_t>(n)] =
                kids_flat[static_cast<std::size_t>(owner.cell) * n_children + child];
        }
    }

    const auto& fine_map = fine.space().dof_map();
    const auto fine_offsets = fine_map.getOffsets();
    const auto fine_dofs = fine_map.getDofIndices();
    const auto vs = static_cast<std::size_t>(fine.value_size());
    const std::size_t nf = data.fine_nodes_per_cell;
    const auto in = fine.values();

    std::vector<Real> out(static_cast<std::size_t>(coarse.num_dofs()), Real(0));

#if FE_HAS_OPENMP
#pragma omp parallel for schedule(static)
#endif
    for (GlobalIndex n = 0; n < n_coarse_nodes; ++n) {
        const auto& owner = owners[static_cast<std::size_t>(n)];
        const auto& w = data.injection_weights[owner.local];
        const GlobalIndex* nodes = fine_dofs.data() +
                                   fine_offsets[static_cast<std::size_t>(sample_cell[static_cast<std::size_t>(n)])];
        for (std::size_t k = 0; k < vs; ++k) {
            Real sum = 0.0;
            for (std::size_t i = 0; i < nf; ++i) {
                sum += w[i] * in[static_cast<std::size_t>(nodes[i]) * vs + k];
            }
            out[static_cast<std::size_t>(n) * vs + k] = sum;
        }
    }
    coarse.set_values(out);

    FE_LOG_DEBUG("inject: level " + std::to_string(level) + " -> " + std::to_string(level - 1));

    TransferReport report;
    report.dofs_written = coarse.num_dofs();
    return report;
}

} // namespace

TransferReport& TransferReport::operator+=(const TransferReport& other) noexcept {
    dofs_written += other.dofs_written;
    continuity_mismatches += other.continuity_mismatches;
    max_mismatch = std::max(max_mismatch, other.max_mismatch);
    return *this;
}

ContinuityAudit::ContinuityAudit(GlobalIndex num_dofs, Real tolerance)
    : tolerance_(tolerance) {
    FE_CHECK_ARG(num_dofs >= 0, "ContinuityAudit: negative DOF count");
    FE_CHECK_ARG(std::isfinite(tolerance) && tolerance >= 0.0,
                 "ContinuityAudit: tolerance must be a non-negative number");
    flagged_.assign(static_cast<std::size_t>(num_dofs), 0);
}

void ContinuityAudit::observe(GlobalIndex dof, Real difference) {
    FE_CHECK_INDEX(dof, static_cast<GlobalIndex>(flagged_.size()));
    max_difference_ = std::max(max_difference_, difference);
    char& flag = flagged_[static_cast<std::size_t>(dof)];
    if (difference > tolerance_ && !flag) {
        flag = 1;
        ++mismatches_;
    }
}

void ContinuityAudit::finish(std::size_t fine_level, TransferReport& report) const {
    report.continuity_mismatches += mismatches_;
    report.max_mismatch = std::max(report.max_mismatch, max_difference_);
    if (mismatches_ == 0) {
        return;
    }
    std::ostringstream msg;
    msg << "prolong: " << mismatches_ << " of " << flagged_.size()
        << " fine DOFs disagree between owning cells on level " << fine_level
        << " (max mismatch " << std::scientific << std::setprecision(3) << max_difference_
        << ", tolerance " << tolerance_ << ")";
    FE_LOG_WARNING(msg.str());
}

TransferReport prolong(const Function& coarse, Function& fine, const TransferOptions& options) {
    check_options(options);
    const LevelPair pair = check_levels(coarse.space(), fine.space(), "prolong");
    return prolong_checked(coarse, fine, pair, options);
}

TransferReport prolong(const MixedFunction& coarse, MixedFunction& fine, const TransferOptions& options) {
    check_options(options);
    const auto pairs = check_mixed_levels(coarse, fine, "prolong");
    TransferReport report;
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        report += prolong_checked(coarse.sub(i), fine.sub(i), pairs[i], options);
    }
    return report;
}

TransferReport restrict(const Function& fine, Function& coarse) {
    const LevelPair pair = check_levels(coarse.space(), fine.space(), "restrict");
    return restrict_checked(fine, coarse, pair);
}

TransferReport restrict(const MixedFunction& fine, MixedFunction& coarse) {
    const auto pairs = check_mixed_levels(coarse, fine, "restrict");
    TransferReport report;
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        report += restrict_checked(fine.sub(i), coarse.sub(i), pairs[i]);
    }
    return report;
}

TransferReport inject(const Function& fine, Function& coarse) {
    const LevelPair pair = check_levels(coarse.space(), fine.space(), "inject");
    return inject_checked(fine, coarse, pair);
}

TransferReport inject(const MixedFunction& fine, MixedFunction& coarse) {
    const auto pairs = check_mixed_levels(coarse, fine, "inject");
    TransferReport report;
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        report += inject_checked(fine.sub(i), coarse.sub(i), pairs[i]);
    }
    return report;
}

} // namespace transfer
} // namespace FE
} // namespace mgfem
