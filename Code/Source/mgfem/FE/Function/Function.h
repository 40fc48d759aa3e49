/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_FUNCTION_FUNCTION_H
#define MGFEM_FE_FUNCTION_FUNCTION_H

/**
 * @file Function.h
 * @brief Finite element functions on Lagrange spaces
 *
 * DOF values are stored node-major: value of component k at global node n
 * is values()[n * value_size + k].
 */

#include "Spaces/FunctionSpace.h"
#include "Spaces/MixedSpace.h"

#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace mgfem {
namespace FE {
namespace functions {

/// Pointwise field: physical point -> one value per component
using FieldFunction = std::function<std::vector<Real>(const PhysicalPoint&)>;

/// Pointwise scalar field
using ScalarFieldFunction = std::function<Real(const PhysicalPoint&)>;

class MixedFunction;

/**
 * @brief Nodal values of a field on a FunctionSpace
 *
 * A Function either owns its values or, as a component of a MixedFunction,
 * views a slice of the mixed array. Copies always own their values.
 */
class Function {
public:
    /// Zero-initialised function on `space`
    explicit Function(std::shared_ptr<const spaces::FunctionSpace> space);

    Function(const Function& other);
    Function(Function&& other) noexcept;
    Function& operator=(const Function&) = delete;
    Function& operator=(Function&&) = delete;

    const spaces::FunctionSpace& space() const noexcept { return *space_; }
    const std::shared_ptr<const spaces::FunctionSpace>& space_ptr() const noexcept { return space_; }

    GlobalIndex num_dofs() const noexcept { return static_cast<GlobalIndex>(values_.size()); }
    int value_size() const noexcept { return space_->value_size(); }

    std::span<Real> values() noexcept { return values_; }
    std::span<const Real> values() const noexcept { return values_; }

    /// True for a component of a MixedFunction
    bool is_view() const noexcept { return values_.data() != owned_.data(); }

    Real& operator[](GlobalIndex dof) { return values_[static_cast<std::size_t>(dof)]; }
    Real operator[](GlobalIndex dof) const { return values_[static_cast<std::size_t>(dof)]; }

    /**
     * @brief Copy the values of another function
     * @throws ConfigurationException unless other lives on a compatible space
     */
    void assign(const Function& other);

    /// Overwrite all values with an array of num_dofs() entries
    void set_values(std::span<const Real> values);

    void fill(Real value);

    /**
     * @brief Nodal interpolation of a pointwise field
     * @throws InvalidArgumentException if f does not return value_size() entries
     */
    void interpolate(const FieldFunction& f);

    /// Scalar convenience: the same value for every component
    void interpolate(const ScalarFieldFunction& f);

    /**
     * @brief Evaluate the function at a reference point of a cell
     * @return One value per component
     */
    std::vector<Real> evaluate(GlobalIndex cell, const basis::RefPoint& xi) const;

private:
    friend class MixedFunction;

    /// View of `storage`, which must hold space->num_dofs() values
    Function(std::shared_ptr<const spaces::FunctionSpace> space, std::span<Real> storage);

    std::shared_ptr<const spaces::FunctionSpace> space_;
    std::vector<Real> owned_;
    std::span<Real> values_;
};

/**
 * @brief Function on a MixedSpace
 *
 * Owns one DOF array, the concatenation of the component arrays in
 * MixedSpace::component_offset order. sub(i) is a Function viewing block i.
 */
class MixedFunction {
public:
    explicit MixedFunction(std::shared_ptr<const spaces::MixedSpace> space);

    MixedFunction(const MixedFunction& other);
    MixedFunction(MixedFunction&&) noexcept = default;
    MixedFunction& operator=(const MixedFunction&) = delete;
    MixedFunction& operator=(MixedFunction&&) = delete;

    const spaces::MixedSpace& space() const noexcept { return *space_; }
    const std::shared_ptr<const spaces::MixedSpace>& space_ptr() const noexcept { return space_; }

    std::size_t num_components() const noexcept { return components_.size(); }
    GlobalIndex num_dofs() const noexcept { return static_cast<GlobalIndex>(values_.size()); }

    /// Read/write access to component i
    Function& sub(std::size_t i) { return components_.at(i); }
    const Function& sub(std::size_t i) const { return components_.at(i); }

    /// Independent copies of the components
    std::vector<Function> split() const;

    /// Concatenated DOF array
    std::span<Real> values() noexcept { return values_; }
    std::span<const Real> values() const noexcept { return values_; }

    /// Overwrite from a concatenated DOF array
    void set_values(std::span<const Real> values);

    /**
     * @brief Copy the values of another mixed function
     * @throws ConfigurationException unless the component spaces are compatible
     */
    void assign(const MixedFunction& other);

    /**
     * @brief Interpolate a field returning all component values in order
     *
     * The first value_size(0) entries of f(x) go to component 0, the next
     * value_size(1) to component 1, and so on.
     */
    void interpolate(const FieldFunction& f);

private:
    void make_components();

    std::shared_ptr<const spaces::MixedSpace> space_;
    std::vector<Real> values_;
    std::vector<Function> components_;
};

} // namespace functions
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_FUNCTION_FUNCTION_H
