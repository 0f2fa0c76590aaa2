#include <gtest/gtest.h>
#include "io/element_mesh.hpp"
#include "partition/structure_check.hpp"

#include <vector>

namespace mpart
{
    namespace testing
    {

        TEST(ElementMeshTest, DefaultIsEmpty)
        {
            ElementMesh mesh;
            EXPECT_EQ(mesh.elementCount(), 0);
            EXPECT_EQ(mesh.nodeCount(), 0);
            EXPECT_EQ(mesh.eptr, std::vector<Idx>({0}));
        }

        TEST(ElementMeshTest, FromCellsPacksConnectivity)
        {
            ElementMesh mesh = ElementMesh::fromCells({{0, 1, 2}, {1, 3, 4, 2}});

            EXPECT_EQ(mesh.elementCount(), 2);
            EXPECT_EQ(mesh.nodeCount(), 5);
            EXPECT_EQ(mesh.eptr, std::vector<Idx>({0, 3, 7}));
            EXPECT_EQ(mesh.eind, std::vector<Idx>({0, 1, 2, 1, 3, 4, 2}));
        }

        TEST(ElementMeshTest, StructuredQuadCounts)
        {
            ElementMesh mesh = ElementMesh::structuredQuad(3, 2);

            EXPECT_EQ(mesh.elementCount(), 6);
            EXPECT_EQ(mesh.nodeCount(), 12);
            EXPECT_EQ(mesh.eind.size(), 24u);
            EXPECT_TRUE(checkMeshStructure(mesh.eptr, mesh.eind).ok());
        }

        TEST(ElementMeshTest, StructuredQuadCornerCells)
        {
            ElementMesh mesh = ElementMesh::structuredQuad(2, 2);

            // First cell: nodes 0, 1, 4, 3 (counter-clockwise)
            std::vector<Idx> first(mesh.eind.begin(), mesh.eind.begin() + 4);
            EXPECT_EQ(first, std::vector<Idx>({0, 1, 4, 3}));

            // Last cell: nodes 4, 5, 8, 7
            std::vector<Idx> last(mesh.eind.end() - 4, mesh.eind.end());
            EXPECT_EQ(last, std::vector<Idx>({4, 5, 8, 7}));
        }

        TEST(ElementMeshTest, StructuredQuadRejectsBadSize)
        {
            EXPECT_THROW(ElementMesh::structuredQuad(0, 3), std::invalid_argument);
            EXPECT_THROW(ElementMesh::structuredQuad(2, -1), std::invalid_argument);
        }

    } // namespace testing
} // namespace mpart
