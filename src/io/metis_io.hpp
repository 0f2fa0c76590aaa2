#pragma once

/**
 * @file metis_io.hpp
 * @brief Reading METIS graph files and writing partition files.
 *
 * Graph file layout (as read by the METIS command line tools):
 * - Lines starting with '%' are comments.
 * - Header: "n m [fmt [ncon]]" with n vertices and m undirected edges. fmt
 *   is a three digit flag: hundreds = vertex sizes present, tens = vertex
 *   weights present, ones = edge weights present.
 * - One line per vertex: [size] [w_1 .. w_ncon] followed by neighbours
 *   (1-based), each followed by its edge weight when present.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"

#include <istream>
#include <string>
#include <vector>

namespace mpart {

/**
 * @brief Owning storage for a graph read from a file, zero-based.
 */
struct MPART_API GraphData {
    Idx ncon = 1;
    std::vector<Idx> xadj{0};
    std::vector<Idx> adjncy;
    std::vector<Idx> vwgt;    // ncon per vertex, empty if absent
    std::vector<Idx> vsize;   // One per vertex, empty if absent
    std::vector<Idx> adjwgt;  // One per adjncy entry, empty if absent

    Idx vertexCount() const { return static_cast<Idx>(xadj.size()) - 1; }
    Idx edgeCount() const { return static_cast<Idx>(adjncy.size()) / 2; }
};

/**
 * @brief Parses a graph in METIS format.
 * @param is Input stream
 * @param source Name used in error messages
 * @throws std::runtime_error if the content is malformed
 */
MPART_API GraphData parseMetisGraph(std::istream& is, const std::string& source = "<stream>");

/**
 * @brief Reads a graph file in METIS format.
 * @throws std::runtime_error if the file cannot be read or is malformed
 */
MPART_API GraphData readMetisGraph(const std::string& filepath);

/**
 * @brief Writes one part id per line, the layout of METIS ".part.N" files.
 * @throws std::runtime_error if the file cannot be written
 */
MPART_API void writePartitionFile(const std::string& filepath, ConstIdxView parts);

}  // namespace mpart
