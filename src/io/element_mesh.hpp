#pragma once

/**
 * @file element_mesh.hpp
 * @brief Owning element-node storage for mesh partitioning.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"

#include <cstddef>
#include <vector>

namespace mpart {

/**
 * @brief Element-node connectivity in the packed layout METIS expects.
 *
 * Element i is made of nodes eind[eptr[i] .. eptr[i+1]). Node indices are
 * zero-based.
 */
struct MPART_API ElementMesh {
    std::vector<Idx> eptr{0};           // Element offsets (size: ne + 1)
    std::vector<Idx> eind;              // Element nodes
    std::vector<std::size_t> nodeTags;  // Original node tags (empty if generated)

    Idx elementCount() const { return static_cast<Idx>(eptr.size()) - 1; }

    /// Largest node index plus one
    Idx nodeCount() const;

    /// Appends an element made of the given nodes
    void addElement(const std::vector<Idx>& nodes);

    /// Builds a mesh from per-element node lists
    static ElementMesh fromCells(const std::vector<std::vector<Idx>>& cells);

    /**
     * @brief Creates a structured nx-by-ny quadrilateral mesh.
     *
     * Nodes are numbered row by row, (nx+1)*(ny+1) in total; cells are
     * numbered row by row and listed counter-clockwise.
     */
    static ElementMesh structuredQuad(int nx, int ny);
};

}  // namespace mpart
