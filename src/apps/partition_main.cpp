/**
 * @file partition_main.cpp
 * @brief Runs a partitioning job described by a YAML file.
 */

#include "common/mpart_types.hpp"
#include "input/job_parser.hpp"
#include "io/element_mesh.hpp"
#include "io/gmsh_mesh_reader.hpp"
#include "io/metis_io.hpp"
#include "partition/graph.hpp"
#include "partition/mesh.hpp"
#include "partition/partition_summary.hpp"
#include <gmsh.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

    mpart::GraphData loadGraph(const mpart::InputConfig &input)
    {
        if (!input.isInline())
        {
            return mpart::readMetisGraph(input.file);
        }

        mpart::GraphData graph;
        graph.xadj = input.xadj;
        graph.adjncy = input.adjncy;
        graph.vwgt = input.vwgt;
        graph.adjwgt = input.adjwgt;

        mpart::Idx nvtxs = graph.vertexCount();
        if (!graph.vwgt.empty() && nvtxs > 0)
        {
            if (graph.vwgt.size() % static_cast<std::size_t>(nvtxs) != 0)
            {
                throw std::runtime_error("input.vwgt must hold ncon weights per vertex");
            }
            graph.ncon = static_cast<mpart::Idx>(graph.vwgt.size()) / nvtxs;
        }
        return graph;
    }

    mpart::ElementMesh loadMesh(const mpart::InputConfig &input)
    {
        if (input.isInline())
        {
            mpart::ElementMesh mesh;
            mesh.eptr = input.eptr;
            mesh.eind = input.eind;
            return mesh;
        }

        gmsh::initialize();
        try
        {
            mpart::ElementMesh mesh = mpart::readGmshMesh(input.file);
            gmsh::finalize();
            return mesh;
        }
        catch (...)
        {
            gmsh::finalize();
            throw;
        }
    }

    std::vector<mpart::Idx> partitionGraph(const mpart::JobConfig &config)
    {
        mpart::GraphData data = loadGraph(config.input);
        std::cout << "  Vertices: " << data.vertexCount() << "\n";
        std::cout << "  Edges: " << data.edgeCount() << "\n";
        std::cout << "  Constraints: " << data.ncon << "\n";

        std::vector<mpart::Idx> parts(static_cast<std::size_t>(std::max<mpart::Idx>(data.vertexCount(), 0)));

        mpart::Graph graph = mpart::Graph::create(data.ncon, config.partition.numParts,
                                                  data.xadj, data.adjncy);
        if (!data.vwgt.empty())
            graph.setVertexWeights(data.vwgt);
        if (!data.vsize.empty())
            graph.setVertexSizes(data.vsize);
        if (!data.adjwgt.empty())
            graph.setEdgeWeights(data.adjwgt);
        graph.setOptions(config.partition.options.values());

        std::string method = config.partition.resolvedMethod(config.input.type);
        mpart::Idx objval = (method == "recursive") ? graph.partRecursive(parts)
                                                    : graph.partKway(parts);
        std::cout << "  Objective value: " << objval << "\n";
        std::cout << "  Edge cut: "
                  << mpart::computeEdgeCut(data.xadj, data.adjncy, data.adjwgt, parts) << "\n";
        return parts;
    }

    std::vector<mpart::Idx> partitionMesh(const mpart::JobConfig &config)
    {
        mpart::ElementMesh data = loadMesh(config.input);

        mpart::Mesh mesh = mpart::Mesh::create(config.partition.numParts, data.eptr, data.eind);
        std::cout << "  Elements: " << mesh.elementCount() << "\n";
        std::cout << "  Nodes: " << mesh.nodeCount() << "\n";

        std::vector<mpart::Idx> epart(static_cast<std::size_t>(mesh.elementCount()));
        std::vector<mpart::Idx> npart(static_cast<std::size_t>(mesh.nodeCount()));

        mesh.setSharedNodeThreshold(config.partition.ncommon);
        mesh.setOptions(config.partition.options.values());

        std::string method = config.partition.resolvedMethod(config.input.type);
        mpart::Idx objval = (method == "nodal") ? mesh.partNodal(epart, npart)
                                                : mesh.partDual(epart, npart);
        std::cout << "  Objective value: " << objval << "\n";
        return epart;
    }

} // namespace

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <job.yaml>\n";
        return 1;
    }

    std::string jobFile = argv[1];

    try
    {
        mpart::JobConfig config = mpart::parseYamlFile(jobFile);

        std::string errorMessage;
        if (!config.validate(errorMessage))
        {
            std::cerr << "Error: invalid job file " << jobFile << ":\n" << errorMessage;
            return 1;
        }

        std::cout << "METIS Partitioner\n";
        std::cout << "=================\n";
        std::cout << "Parameters:\n";
        std::cout << "  Project: " << config.projectName << "\n";
        std::cout << "  Input: " << (config.input.isInline() ? "inline " + config.input.type
                                                             : config.input.file)
                  << "\n";
        std::cout << "  Partitions: " << config.partition.numParts << "\n";
        std::cout << "  Method: " << config.partition.resolvedMethod(config.input.type) << "\n\n";

        std::cout << "1. Partitioning...\n";
        std::vector<mpart::Idx> parts = config.input.isGraph() ? partitionGraph(config)
                                                               : partitionMesh(config);
        std::cout << "Partitioning complete.\n\n";

        if (config.output.printSummary)
        {
            mpart::printPartitionSummary(parts);
            std::cout << "\n";
        }

        if (!config.output.file.empty())
        {
            mpart::writePartitionFile(config.output.file, parts);
            std::cout << "Partition written to " << config.output.file << "\n";
        }

        std::cout << "Done!\n";
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
