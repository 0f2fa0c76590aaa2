/**
 * @file graph_example_main.cpp
 * @brief Splits the 3x5 grid graph from the METIS manual into two parts.
 */

#include "common/mpart_types.hpp"
#include "partition/graph.hpp"
#include "partition/partition_summary.hpp"

#include <iostream>
#include <vector>

int main()
{
    // Vertices numbered row by row:
    //   0 -  1 -  2 -  3 -  4
    //   5 -  6 -  7 -  8 -  9
    //  10 - 11 - 12 - 13 - 14
    std::vector<mpart::Idx> xadj = {0, 2, 5, 8, 11, 13, 16, 20, 24, 28, 31, 33, 36, 39, 42, 44};
    std::vector<mpart::Idx> adjncy = {
        1, 5,
        0, 2, 6,
        1, 3, 7,
        2, 4, 8,
        3, 9,
        0, 6, 10,
        1, 5, 7, 11,
        2, 6, 8, 12,
        3, 7, 9, 13,
        4, 8, 14,
        5, 11,
        6, 10, 12,
        7, 11, 13,
        8, 12, 14,
        9, 13,
    };
    std::vector<mpart::Idx> part(15, 0);

    try
    {
        mpart::Idx edgeCut = mpart::Graph::create(1, 2, xadj, adjncy).partRecursive(part);

        std::cout << "Parts:";
        for (mpart::Idx p : part)
        {
            std::cout << " " << p;
        }
        std::cout << "\nEdge cut: " << edgeCut << "\n\n";
        mpart::printPartitionSummary(part);
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
