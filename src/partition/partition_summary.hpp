#pragma once

/**
 * @file partition_summary.hpp
 * @brief Statistics on a computed partition.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"

#include <iostream>
#include <vector>

namespace mpart {

/**
 * @brief Counts the entities assigned to each part.
 * @param parts Part of each entity
 * @return counts[p] is the number of entities in part p; the vector has
 *         max(parts)+1 entries
 */
MPART_API std::vector<Idx> countPartSizes(ConstIdxView parts);

/**
 * @brief Sum of the weights of the edges whose endpoints lie in different parts.
 *
 * Each undirected edge appears twice in a symmetric adjacency structure and
 * is counted once.
 *
 * @param xadj Offsets of the adjacency structure
 * @param adjncy Adjacency lists
 * @param adjwgt Edge weights (empty for unit weights)
 * @param parts Part of each vertex
 */
MPART_API Idx computeEdgeCut(ConstIdxView xadj, ConstIdxView adjncy,
                             ConstIdxView adjwgt, ConstIdxView parts);

/**
 * @brief Prints a summary of the entity distribution across partitions.
 * @param parts The partition assignment vector
 * @param os Output stream
 */
MPART_API void printPartitionSummary(ConstIdxView parts, std::ostream& os = std::cout);

}  // namespace mpart
