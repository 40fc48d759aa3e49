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

#ifndef MGFEM_FE_DOFS_DOFNUMBERING_H
#define MGFEM_FE_DOFS_DOFNUMBERING_H

/**
 * @file DofNumbering.h
 * @brief Global node numbering for CG and DG Lagrange spaces
 *
 * CG nodes are identified by the mesh entity they sit on:
 *  - a vertex (global vertex id),
 *  - an edge (sorted global vertex pair plus the lattice position measured
 *    from the lower vertex id),
 *  - the cell interior (cell id plus local node index).
 * Ids are handed out in first-seen order over cells and local nodes, so two
 * cells that see the same entity key share the node. On extruded meshes the
 * key of the horizontal node is combined with the global vertical lattice
 * index layer * degree + j.
 *
 * DG nodes are numbered cell * nodes_per_cell + local.
 */

#include "Dofs/DofMap.h"
#include "Elements/ElementDescriptor.h"
#include "Basis/BasisFunction.h"
#include "Basis/TensorProductBasis.h"

#include "Mesh/Core/MeshBase.h"
#include "Mesh/Hierarchy/ExtrudedMesh.h"

namespace mgfem {
namespace FE {
namespace dofs {

/// Mesh entity a reference node belongs to
enum class NodeEntity : std::uint8_t {
    Vertex,
    Edge,
    Interior
};

/**
 * @brief Classification of one reference node
 *
 * For Vertex, local_a is the local vertex. For Edge, (local_a, local_b) are
 * the local edge vertices with local_a < local_b and steps_from_a is the
 * lattice distance from local_a in units of 1/degree.
 */
struct NodeClassification {
    NodeEntity entity = NodeEntity::Interior;
    int local_a = -1;
    int local_b = -1;
    int steps_from_a = 0;
};

/**
 * @brief Classify a reference node of a degree-p lattice
 *
 * Uses the support of the vertex interpolant at xi: one vertex for vertex
 * nodes, two for edge nodes, more for interior nodes.
 */
NodeClassification classify_node(CellFamily family, const basis::RefPoint& xi, int degree);

/**
 * @brief Number the nodes of a space on a plain mesh
 * @throws ConfigurationException if the basis does not match the mesh cells
 */
DofMap build_dof_map(const MeshBase& mesh,
                     const elements::ElementDescriptor& element,
                     const basis::BasisFunction& basis);

/**
 * @brief Number the nodes of a space on an extruded mesh
 * @throws ConfigurationException if the basis does not match the mesh cells
 */
DofMap build_dof_map(const ExtrudedMesh& mesh,
                     const elements::ElementDescriptor& element,
                     const basis::TensorProductBasis& basis);

} // namespace dofs
} // namespace FE
} // namespace mgfem

#endif // MGFEM_FE_DOFS_DOFNUMBERING_H
