#include "csr_adapter.hpp"

#include <stdexcept>

namespace mpart
{

    CsrMatrix CsrMatrix::fromEdges(Idx n, const std::vector<std::pair<Idx, Idx>> &edges,
                                   const std::vector<Idx> &weights)
    {
        if (!weights.empty() && weights.size() != edges.size())
        {
            throw std::invalid_argument("edge weights must match the number of edges");
        }

        // First pass: count neighbors for each vertex
        std::vector<Idx> neighborCounts(n, 0);
        for (const auto &[a, b] : edges)
        {
            if (a < 0 || a >= n || b < 0 || b >= n)
            {
                throw std::out_of_range("edge endpoint outside [0, n)");
            }
            if (a != b)
            {
                neighborCounts[a]++;
                neighborCounts[b]++;
            }
        }

        // Build CSR structure
        CsrMatrix mat(n);
        for (Idx i = 0; i < n; ++i)
        {
            mat.rowPtr[i + 1] = mat.rowPtr[i] + neighborCounts[i];
        }

        mat.colIdx.resize(mat.rowPtr[n]);
        if (!weights.empty())
        {
            mat.values.resize(mat.rowPtr[n]);
        }
        std::vector<Idx> currentPos(mat.rowPtr.begin(), mat.rowPtr.end() - 1);

        for (std::size_t e = 0; e < edges.size(); ++e)
        {
            Idx a = edges[e].first;
            Idx b = edges[e].second;
            if (a == b)
                continue;

            Idx pa = currentPos[a]++;
            Idx pb = currentPos[b]++;
            mat.colIdx[pa] = b;
            mat.colIdx[pb] = a;
            if (!weights.empty())
            {
                mat.values[pa] = weights[e];
                mat.values[pb] = weights[e];
            }
        }

        return mat;
    }

    Graph setupPartition(CsrMatrix &matrix, Idx nparts)
    {
        Graph graph = Graph::create(1, nparts, matrix.rowPtr, matrix.colIdx);
        if (!matrix.values.empty())
        {
            graph.setEdgeWeights(matrix.values);
        }
        return graph;
    }

} // namespace mpart
