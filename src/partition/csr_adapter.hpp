#pragma once

/**
 * @file csr_adapter.hpp
 * @brief Partitioning a graph stored as a sparse adjacency matrix.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"
#include "graph.hpp"

#include <utility>
#include <vector>

namespace mpart {

/**
 * @brief Square sparse matrix in CSR (Compressed Sparse Row) format.
 *
 * Row i lists the neighbours of vertex i; values, when present, are the
 * edge weights.
 */
struct MPART_API CsrMatrix {
    Idx nRows = 0;
    std::vector<Idx> rowPtr;  // Row pointers (size: nRows + 1)
    std::vector<Idx> colIdx;  // Column indices
    std::vector<Idx> values;  // Edge weights (empty or size colIdx.size())

    CsrMatrix() = default;
    explicit CsrMatrix(Idx n) : nRows(n), rowPtr(n + 1, 0) {}

    /**
     * @brief Builds a matrix from an undirected edge list.
     *
     * Each edge is stored in both directions. Self loops are dropped.
     *
     * @param n Number of vertices
     * @param edges Pairs of zero-based vertex indices
     * @param weights Optional weight of each edge (empty for unweighted)
     */
    static CsrMatrix fromEdges(Idx n, const std::vector<std::pair<Idx, Idx>>& edges,
                               const std::vector<Idx>& weights = {});
};

/**
 * @brief Sets up a partition of the graph stored in a matrix.
 *
 * The matrix storage is used as is, diagonal entries included. fromEdges
 * never stores one.
 *
 * The request has one constraint and borrows rowPtr and colIdx as the
 * adjacency structure and values (when present) as the edge weights. The
 * matrix must outlive the request.
 *
 * @throws InvalidStructureError if the matrix is not a valid adjacency structure
 */
MPART_API Graph setupPartition(CsrMatrix& matrix, Idx nparts);

}  // namespace mpart
