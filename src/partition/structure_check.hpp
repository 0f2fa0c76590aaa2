#pragma once

/**
 * @file structure_check.hpp
 * @brief Validation of packed adjacency arrays before they reach METIS.
 *
 * A graph or a mesh is given to METIS as two arrays: an offsets array of
 * N+1 non-decreasing entries and an items array of length offsets[N]. Run i,
 * items[offsets[i] .. offsets[i+1]), lists the neighbours of vertex i (graph)
 * or the nodes of element i (mesh).
 *
 * The checks are pure: they read the arrays once and allocate nothing.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"
#include "errors.hpp"

namespace mpart {

/**
 * @brief Outcome of a structural check.
 *
 * On success, entityCount holds the number of vertices (graph) or elements
 * (mesh) and nodeCount the number of mesh nodes.
 */
struct StructureCheck {
    StructureError error = StructureError::None;
    Idx entityCount = 0;
    Idx nodeCount = 0;

    bool ok() const { return error == StructureError::None; }
};

/**
 * @brief Checks the adjacency structure of a graph.
 *
 * Checks run in this order: constraint count, part count, offsets not
 * empty, last offset against items length, offsets sorted, offsets length
 * fits Idx, every item in [0, N).
 *
 * @param ncon Number of balancing constraints
 * @param nparts Number of parts
 * @param xadj Offsets array (N+1 entries)
 * @param adjncy Items array
 * @return The vertex count, or the first violation found
 */
MPART_API StructureCheck checkGraph(Idx ncon, Idx nparts, ConstIdxView xadj,
                                    ConstIdxView adjncy);

/**
 * @brief Checks the element-node structure of a mesh.
 *
 * Node indices have no a-priori upper bound; the node count is derived as
 * the largest node index plus one (zero for an empty items array).
 *
 * @param eptr Offsets array (ne+1 entries)
 * @param eind Items array of node indices
 * @return The element and node counts, or the first violation found
 */
MPART_API StructureCheck checkMeshStructure(ConstIdxView eptr, ConstIdxView eind);

/**
 * @brief Checks the part count, then the element-node structure of a mesh.
 * @see checkMeshStructure
 */
MPART_API StructureCheck checkMesh(Idx nparts, ConstIdxView eptr, ConstIdxView eind);

}  // namespace mpart
