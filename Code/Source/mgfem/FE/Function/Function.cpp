/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Function.h"

#include <algorithm>
#include <string>
#include <utility>

namespace mgfem {
namespace FE {
namespace functions {

// ---------------------------------------------------------------------------
// Function
// ---------------------------------------------------------------------------

Function::Function(std::shared_ptr<const spaces::FunctionSpace> space)
    : space_(std::move(space)) {
    FE_CHECK_NOT_NULL(space_.get(), "Function: space");
    owned_.assign(static_cast<std::size_t>(space_->num_dofs()), Real(0));
    values_ = owned_;
}

Function::Function(std::shared_ptr<const spaces::FunctionSpace> space, std::span<Real> storage)
    : space_(std::move(space)), values_(storage) {
    FE_CHECK_NOT_NULL(space_.get(), "Function: space");
    FE_CHECK_ARG(static_cast<GlobalIndex>(storage.size()) == space_->num_dofs(),
                 "Function: storage holds " + std::to_string(storage.size()) +
                     " values, space has " + std::to_string(space_->num_dofs()) + " DOFs");
}

Function::Function(const Function& other)
    : space_(other.space_),
      owned_(other.values_.begin(), other.values_.end()),
      values_(owned_) {}

Function::Function(Function&& other) noexcept
    : space_(std::move(other.space_)) {
    const bool view = other.is_view();
    owned_ = std::move(other.owned_);
    values_ = view ? other.values_ : std::span<Real>(owned_);
    other.values_ = {};
}

void Function::assign(const Function& other) {
    FE_CHECK_CONFIG(space_->is_compatible(other.space()) && other.values_.size() == values_.size(),
                    "Function::assign: functions live on incompatible spaces");
    std::copy(other.values_.begin(), other.values_.end(), values_.begin());
}

void Function::set_values(std::span<const Real> values) {
    FE_CHECK_ARG(values.size() == values_.size(),
                 "Function::set_values: expected " + std::to_string(values_.size()) +
                     " values, got " + std::to_string(values.size()));
    std::copy(values.begin(), values.end(), values_.begin());
}

void Function::fill(Real value) {
    std::fill(values_.begin(), values_.end(), value);
}

void Function::interpolate(const FieldFunction& f) {
    const auto vs = static_cast<std::size_t>(value_size());
    const auto coords = space_->node_coordinates();

    std::vector<Real> result(values_.size());
    for (std::size_t n = 0; n < coords.size(); ++n) {
        const std::vector<Real> v = f(coords[n]);
        FE_CHECK_ARG(v.size() == vs,
                     "Function::interpolate: field returned " + std::to_string(v.size()) +
                         " values, expected " + std::to_string(vs));
        std::copy(v.begin(), v.end(), result.begin() + static_cast<std::ptrdiff_t>(n * vs));
    }
    std::copy(result.begin(), result.end(), values_.begin());
}

void Function::interpolate(const ScalarFieldFunction& f) {
    const auto vs = static_cast<std::size_t>(value_size());
    interpolate(FieldFunction([&f, vs](const PhysicalPoint& x) {
        return std::vector<Real>(vs, f(x));
    }));
}

std::vector<Real> Function::evaluate(GlobalIndex cell, const basis::RefPoint& xi) const {
    const auto vs = static_cast<std::size_t>(value_size());
    const auto nodes = space_->dof_map().getCellDofs(cell);

    std::vector<Real> phi;
    space_->basis().evaluate_values(xi, phi);

    std::vector<Real> out(vs, Real(0));
    for (std::size_t j = 0; j < nodes.size(); ++j) {
        const auto base = static_cast<std::size_t>(nodes[j]) * vs;
        for (std::size_t k = 0; k < vs; ++k) {
            out[k] += phi[j] * values_[base + k];
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// MixedFunction
// ---------------------------------------------------------------------------

MixedFunction::MixedFunction(std::shared_ptr<const spaces::MixedSpace> space)
    : space_(std::move(space)) {
    FE_CHECK_NOT_NULL(space_.get(), "MixedFunction: space");
    values_.assign(static_cast<std::size_t>(space_->num_dofs()), Real(0));
    make_components();
}

MixedFunction::MixedFunction(const MixedFunction& other)
    : space_(other.space_), values_(other.values_) {
    make_components();
}

void MixedFunction::make_components() {
    components_.reserve(space_->num_components());
    const std::span<Real> all(values_);
    for (std::size_t i = 0; i < space_->num_components(); ++i) {
        const auto& sub_space = space_->space_ptr(i);
        components_.push_back(Function(sub_space,
                                       all.subspan(static_cast<std::size_t>(space_->component_offset(i)),
                                                   static_cast<std::size_t>(sub_space->num_dofs()))));
    }
}

std::vector<Function> MixedFunction::split() const {
    return std::vector<Function>(components_.begin(), components_.end());
}

void MixedFunction::set_values(std::span<const Real> values) {
    FE_CHECK_ARG(values.size() == values_.size(),
                 "MixedFunction::set_values: expected " + std::to_string(values_.size()) +
                     " values, got " + std::to_string(values.size()));
    std::copy(values.begin(), values.end(), values_.begin());
}

void MixedFunction::assign(const MixedFunction& other) {
    FE_CHECK_CONFIG(other.num_components() == num_components(),
                    "MixedFunction::assign: component count mismatch");
    for (std::size_t i = 0; i < components_.size(); ++i) {
        FE_CHECK_CONFIG(components_[i].space().is_compatible(other.components_[i].space()),
                        "MixedFunction::assign: component " + std::to_string(i) +
                            " lives on an incompatible space");
    }
    FE_CHECK_CONFIG(other.values_.size() == values_.size(),
                    "MixedFunction::assign: DOF count mismatch");
    std::copy(other.values_.begin(), other.values_.end(), values_.begin());
}

void MixedFunction::interpolate(const FieldFunction& f) {
    const auto total = static_cast<std::size_t>(space_->value_size());

    // Each component samples the full field at its own nodes and keeps its
    // slice; nothing is written until every component has succeeded.
    std::vector<Real> staged(values_.size());
    std::size_t first = 0;
    for (std::size_t i = 0; i < components_.size(); ++i) {
        Function c(space_->space_ptr(i));
        const auto vs = static_cast<std::size_t>(c.value_size());
        c.interpolate(FieldFunction([&f, first, vs, total](const PhysicalPoint& x) {
            const std::vector<Real> all = f(x);
            FE_CHECK_ARG(all.size() == total,
                         "MixedFunction::interpolate: field returned " + std::to_string(all.size()) +
                             " values, expected " + std::to_string(total));
            return std::vector<Real>(all.begin() + static_cast<std::ptrdiff_t>(first),
                                     all.begin() + static_cast<std::ptrdiff_t>(first + vs));
        }));
        std::copy(c.values().begin(), c.values().end(),
                  staged.begin() + static_cast<std::ptrdiff_t>(space_->component_offset(i)));
        first += vs;
    }
    std::copy(staged.begin(), staged.end(), values_.begin());
}

} // namespace functions
} // namespace FE
} // namespace mgfem
