#include <gtest/gtest.h>
#include "io/metis_io.hpp"
#include "partition/structure_check.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace mpart
{
    namespace testing
    {

        // =============================================================================
        // Helper Functions
        // =============================================================================

        GraphData parse(const std::string &content)
        {
            std::istringstream is(content);
            return parseMetisGraph(is, "test.graph");
        }

        std::string tempPath(const std::string &name)
        {
            return (std::filesystem::temp_directory_path() / name).string();
        }

        // =============================================================================
        // Graph Reader Tests
        // =============================================================================

        TEST(MetisGraphReaderTest, ReadsUnweightedGraph)
        {
            GraphData g = parse(
                "% triangle plus a pendant vertex\n"
                "4 4\n"
                "2 3\n"
                "1 3 4\n"
                "1 2\n"
                "2\n");

            EXPECT_EQ(g.vertexCount(), 4);
            EXPECT_EQ(g.edgeCount(), 4);
            EXPECT_EQ(g.ncon, 1);
            EXPECT_EQ(g.xadj, std::vector<Idx>({0, 2, 5, 7, 8}));
            EXPECT_EQ(g.adjncy, std::vector<Idx>({1, 2, 0, 2, 3, 0, 1, 1}));
            EXPECT_TRUE(g.vwgt.empty());
            EXPECT_TRUE(g.adjwgt.empty());
            EXPECT_TRUE(checkGraph(g.ncon, 2, g.xadj, g.adjncy).ok());
        }

        TEST(MetisGraphReaderTest, ReadsEdgeWeights)
        {
            GraphData g = parse(
                "2 1 1\n"
                "2 7\n"
                "1 7\n");

            EXPECT_EQ(g.adjncy, std::vector<Idx>({1, 0}));
            EXPECT_EQ(g.adjwgt, std::vector<Idx>({7, 7}));
        }

        TEST(MetisGraphReaderTest, ReadsMultiConstraintWeightsAndSizes)
        {
            GraphData g = parse(
                "3 2 111 2\n"
                "5 1 2 2 3\n"
                "6 3 4 1 3 3 1\n"
                "7 5 6 2 1\n");

            EXPECT_EQ(g.ncon, 2);
            EXPECT_EQ(g.vsize, std::vector<Idx>({5, 6, 7}));
            EXPECT_EQ(g.vwgt, std::vector<Idx>({1, 2, 3, 4, 5, 6}));
            EXPECT_EQ(g.adjncy, std::vector<Idx>({1, 0, 2, 1}));
            EXPECT_EQ(g.adjwgt, std::vector<Idx>({3, 3, 1, 1}));
        }

        TEST(MetisGraphReaderTest, KeepsIsolatedVertices)
        {
            GraphData g = parse(
                "3 1\n"
                "2\n"
                "1\n"
                "\n");

            EXPECT_EQ(g.xadj, std::vector<Idx>({0, 1, 2, 2}));
        }

        TEST(MetisGraphReaderTest, RejectsEdgeCountMismatch)
        {
            EXPECT_THROW(parse("2 2\n2\n1\n"), std::runtime_error);
        }

        TEST(MetisGraphReaderTest, RejectsNeighbourOutOfRange)
        {
            try
            {
                parse("2 1\n3\n1\n");
                FAIL() << "expected std::runtime_error";
            }
            catch (const std::runtime_error &e)
            {
                EXPECT_NE(std::string(e.what()).find("test.graph:2"), std::string::npos);
            }
        }

        TEST(MetisGraphReaderTest, RejectsMissingVertexLines)
        {
            EXPECT_THROW(parse("3 1\n2\n1\n"), std::runtime_error);
        }

        TEST(MetisGraphReaderTest, RejectsBadFormatFlag)
        {
            EXPECT_THROW(parse("2 1 2\n2\n1\n"), std::runtime_error);
        }

        TEST(MetisGraphReaderTest, RejectsEdgeCountBeyondIndexRange)
        {
            try
            {
                parse("2 5000000000000000000\n2\n1\n");
                FAIL() << "expected std::runtime_error";
            }
            catch (const std::runtime_error &e)
            {
                EXPECT_NE(std::string(e.what()).find("too large"), std::string::npos);
            }
        }

        TEST(MetisGraphReaderTest, RejectsConstraintCountBeyondIndexRange)
        {
            EXPECT_THROW(parse("2 1 010 4294967297\n7 2\n9 1\n"), std::runtime_error);
            EXPECT_THROW(parse("2 1 010 9223372036854775807\n7 2\n9 1\n"), std::runtime_error);
        }

        TEST(MetisGraphReaderTest, RejectsWeightBeyondIndexRange)
        {
            const std::string tooBig =
                sizeof(Idx) < sizeof(long long)
                    ? std::to_string(static_cast<long long>(std::numeric_limits<Idx>::max()) + 1)
                    : std::string("9223372036854775808");
            EXPECT_THROW(parse("2 1 001\n2 " + tooBig + "\n1 1\n"), std::runtime_error);
            EXPECT_THROW(parse("2 1 100\n" + tooBig + " 2\n1 1\n"), std::runtime_error);
        }

        TEST(MetisGraphReaderTest, RejectsEmptyInput)
        {
            EXPECT_THROW(parse("% only a comment\n"), std::runtime_error);
        }

        TEST(MetisGraphReaderTest, MissingFileThrows)
        {
            EXPECT_THROW(readMetisGraph(tempPath("mpart_does_not_exist.graph")), std::runtime_error);
        }

        TEST(MetisGraphReaderTest, ReadsFile)
        {
            std::string path = tempPath("mpart_reader_test.graph");
            {
                std::ofstream out(path);
                out << "2 1\n2\n1\n";
            }

            GraphData g = readMetisGraph(path);
            EXPECT_EQ(g.vertexCount(), 2);
            std::filesystem::remove(path);
        }

        // =============================================================================
        // Partition File Tests
        // =============================================================================

        TEST(PartitionFileTest, WritesOnePartPerLine)
        {
            std::string path = tempPath("mpart_parts_test.txt");
            std::vector<Idx> parts = {0, 1, 1, 0};
            writePartitionFile(path, parts);

            std::ifstream in(path);
            std::vector<Idx> read;
            Idx p;
            while (in >> p)
            {
                read.push_back(p);
            }
            EXPECT_EQ(read, parts);
            in.close();
            std::filesystem::remove(path);
        }

    } // namespace testing
} // namespace mpart
