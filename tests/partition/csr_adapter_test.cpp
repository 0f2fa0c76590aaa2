#include <gtest/gtest.h>
#include "partition/csr_adapter.hpp"
#include "partition/partition_summary.hpp"
#include "fake_backend.hpp"

#include <set>
#include <vector>

namespace mpart
{
    namespace testing
    {

        // =============================================================================
        // CsrMatrix Tests
        // =============================================================================

        TEST(CsrMatrixTest, DefaultConstruction)
        {
            CsrMatrix mat;
            EXPECT_EQ(mat.nRows, 0);
            EXPECT_TRUE(mat.rowPtr.empty());
        }

        TEST(CsrMatrixTest, ConstructionWithSize)
        {
            CsrMatrix mat(5);
            EXPECT_EQ(mat.nRows, 5);
            EXPECT_EQ(mat.rowPtr, std::vector<Idx>(6, 0));
        }

        TEST(CsrMatrixTest, FromEdgesIsSymmetric)
        {
            CsrMatrix mat = CsrMatrix::fromEdges(4, {{0, 1}, {1, 2}, {2, 3}});

            EXPECT_EQ(mat.rowPtr, std::vector<Idx>({0, 1, 3, 5, 6}));
            std::set<Idx> nbrs(mat.colIdx.begin() + mat.rowPtr[1],
                               mat.colIdx.begin() + mat.rowPtr[2]);
            EXPECT_EQ(nbrs, std::set<Idx>({0, 2}));
        }

        TEST(CsrMatrixTest, FromEdgesDropsSelfLoops)
        {
            CsrMatrix mat = CsrMatrix::fromEdges(2, {{0, 0}, {0, 1}});
            EXPECT_EQ(mat.colIdx.size(), 2u);
        }

        TEST(CsrMatrixTest, FromEdgesCopiesWeights)
        {
            CsrMatrix mat = CsrMatrix::fromEdges(3, {{0, 1}, {1, 2}}, {5, 7});
            ASSERT_EQ(mat.values.size(), 4u);
            EXPECT_EQ(mat.values[0], 5);  // 0 -> 1
            EXPECT_EQ(mat.values[3], 7);  // 2 -> 1
        }

        TEST(CsrMatrixTest, FromEdgesRejectsBadInput)
        {
            EXPECT_THROW(CsrMatrix::fromEdges(2, {{0, 2}}), std::out_of_range);
            EXPECT_THROW(CsrMatrix::fromEdges(2, {{0, 1}}, {1, 2}), std::invalid_argument);
        }

        // =============================================================================
        // setupPartition Tests
        // =============================================================================

        TEST(SetupPartitionTest, UsesMatrixAsAdjacency)
        {
            CsrMatrix mat = CsrMatrix::fromEdges(4, {{0, 1}, {1, 2}, {2, 3}, {3, 0}});
            Graph graph = setupPartition(mat, 2);

            EXPECT_EQ(graph.vertexCount(), 4);
            EXPECT_EQ(graph.edgeEntryCount(), 8);
            EXPECT_EQ(graph.constraintCount(), 1);
            EXPECT_FALSE(graph.hasEdgeWeights());
        }

        TEST(SetupPartitionTest, PassesValuesAsEdgeWeights)
        {
            CsrMatrix mat = CsrMatrix::fromEdges(3, {{0, 1}, {1, 2}}, {4, 4});
            FakeBackend backend;
            std::vector<Idx> part(3);

            Graph graph = setupPartition(mat, 2);
            EXPECT_TRUE(graph.hasEdgeWeights());
            graph.setBackend(backend).partKway(part);
            EXPECT_TRUE(backend.lastHadEdgeWeights);
        }

        TEST(SetupPartitionTest, RejectsInvalidMatrix)
        {
            CsrMatrix mat(2);
            mat.rowPtr = {0, 1, 2};
            mat.colIdx = {1, 2};
            EXPECT_THROW(setupPartition(mat, 2), InvalidStructureError);
        }

        TEST(SetupPartitionMetisTest, PartitionsRing)
        {
            std::vector<std::pair<Idx, Idx>> edges;
            for (Idx i = 0; i < 8; ++i)
            {
                edges.emplace_back(i, (i + 1) % 8);
            }
            CsrMatrix mat = CsrMatrix::fromEdges(8, edges);
            std::vector<Idx> part(8, -1);

            Idx objval = setupPartition(mat, 2).partKway(part);

            std::set<Idx> used(part.begin(), part.end());
            EXPECT_EQ(used, std::set<Idx>({0, 1}));
            EXPECT_EQ(objval, computeEdgeCut(mat.rowPtr, mat.colIdx, {}, part));
        }

    } // namespace testing
} // namespace mpart
