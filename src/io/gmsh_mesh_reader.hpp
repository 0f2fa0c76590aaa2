#pragma once

/**
 * @file gmsh_mesh_reader.hpp
 * @brief Loads the element connectivity of a Gmsh mesh file.
 */

#include "common/mpart_export.hpp"
#include "element_mesh.hpp"

#include <string>

namespace mpart {

/**
 * @brief Reads the top-dimension elements of a Gmsh .msh file.
 *
 * Only primary (corner) nodes are kept, so higher-order elements are
 * partitioned by their vertices. Node indices are renumbered compactly in
 * order of first use; the original Gmsh tags are stored in nodeTags.
 *
 * gmsh::initialize() must have been called before and gmsh::finalize()
 * is left to the caller.
 *
 * @param mshFile Path to the mesh file
 * @param gmshVerbose Gmsh verbosity level
 * @throws std::runtime_error if the file contains no elements
 */
MPART_API ElementMesh readGmshMesh(const std::string& mshFile, int gmshVerbose = 0);

}  // namespace mpart
