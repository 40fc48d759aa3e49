/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef MGFEM_FE_SPACES_MIXEDSPACE_H
#define MGFEM_FE_SPACES_MIXEDSPACE_H

/**
 * @file MixedSpace.h
 * @brief Mixed function spaces combining multiple component spaces
 */

#include "Spaces/FunctionSpace.h"

#include <memory>
#include <string>
#include <vector>

namespace mgfem {
namespace FE {
namespace spaces {

/**
 * @brief Mixed function space composed of several subspaces on one mesh
 *
 * MixedSpace encodes block structure only: the DOF vector of a mixed field
 * is the concatenation of the component DOF vectors in the order the
 * components were added. Interpolation, evaluation and level transfer are
 * delegated to the component spaces.
 */
class MixedSpace {
public:
    /// Description of a component field within a mixed space
    struct Component {
        std::string name;
        std::shared_ptr<const FunctionSpace> space;
    };

    MixedSpace() = default;

    /**
     * @brief Add a component space with an optional name
     * @throws ConfigurationException if the space lives on a different mesh
     */
    void add_component(const std::string& name,
                       std::shared_ptr<const FunctionSpace> space);

    /// Number of component fields
    std::size_t num_components() const noexcept { return components_.size(); }

    /// Access component description
    const Component& component(std::size_t i) const { return components_.at(i); }

    const FunctionSpace& space(std::size_t i) const { return *components_.at(i).space; }
    const std::shared_ptr<const FunctionSpace>& space_ptr(std::size_t i) const { return components_.at(i).space; }

    /// Total DOFs (sum over components)
    GlobalIndex num_dofs() const noexcept;

    /// Block offset (starting DOF index) of component within concatenated vector
    GlobalIndex component_offset(std::size_t i) const;

    /// Sum of component value sizes
    int value_size() const noexcept;

    FieldType field_type() const noexcept { return FieldType::Mixed; }

private:
    std::vector<Component> components_;
};

} // namespace spaces
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_SPACES_MIXEDSPACE_H
