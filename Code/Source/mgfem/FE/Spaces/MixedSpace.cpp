/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "MixedSpace.h"

#include <utility>

namespace mgfem {
namespace FE {
namespace spaces {

void MixedSpace::add_component(const std::string& name,
                               std::shared_ptr<const FunctionSpace> space) {
    FE_CHECK_NOT_NULL(space.get(), "MixedSpace::add_component: space");
    if (!components_.empty()) {
        FE_CHECK_CONFIG(space->mesh_identity() == components_.front().space->mesh_identity(),
                        "MixedSpace::add_component: component '" + name +
                            "' lives on a different mesh");
    }
    components_.push_back(Component{name, std::move(space)});
}

GlobalIndex MixedSpace::num_dofs() const noexcept {
    GlobalIndex total = 0;
    for (const auto& c : components_) {
        total += c.space->num_dofs();
    }
    return total;
}

GlobalIndex MixedSpace::component_offset(std::size_t i) const {
    FE_CHECK_ARG(i < components_.size(), "MixedSpace::component_offset: index out of range");
    GlobalIndex offset = 0;
    for (std::size_t k = 0; k < i; ++k) {
        offset += components_[k].space->num_dofs();
    }
    return offset;
}

int MixedSpace::value_size() const noexcept {
    int total = 0;
    for (const auto& c : components_) {
        total += c.space->value_size();
    }
    return total;
}

} // namespace spaces
} // namespace FE
} // namespace mgfem
