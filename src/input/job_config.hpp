#pragma once

/**
 * @file job_config.hpp
 * @brief Configuration data structures for a partitioning job.
 *
 * A job names its input (a graph or an element mesh, read from a file or
 * given inline), the partitioning method with its METIS options, and where
 * the result goes.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"
#include "partition/options.hpp"

#include <string>
#include <vector>

namespace mpart
{

    // =============================================================================
    // Input Configuration
    // =============================================================================

    /**
     * @brief Source of the structure to partition.
     *
     * When file is empty the inline arrays are used: xadj/adjncy for a graph,
     * eptr/eind for a mesh.
     */
    struct MPART_API InputConfig
    {
        std::string type = "graph"; ///< graph or mesh
        std::string file;           ///< METIS .graph file (graph) or Gmsh .msh file (mesh)

        std::vector<Idx> xadj;   ///< Inline graph offsets
        std::vector<Idx> adjncy; ///< Inline graph adjacency
        std::vector<Idx> vwgt;   ///< Inline vertex weights (optional)
        std::vector<Idx> adjwgt; ///< Inline edge weights (optional)

        std::vector<Idx> eptr; ///< Inline element offsets
        std::vector<Idx> eind; ///< Inline element nodes

        bool isGraph() const { return type == "graph"; }
        bool isMesh() const { return type == "mesh"; }
        bool isInline() const { return file.empty(); }
    };

    // =============================================================================
    // Partition Configuration
    // =============================================================================

    /**
     * @brief Partitioning method and tuning.
     */
    struct MPART_API PartitionConfig
    {
        int numParts = 2;   ///< Number of parts
        std::string method; ///< recursive, kway (graph) or dual, nodal (mesh); empty picks the default
        int ncommon = 1;    ///< Nodes shared by two elements to be dual neighbours
        Options options;    ///< METIS options from the options block

        /// Method after applying the default for the given input type
        std::string resolvedMethod(const std::string &inputType) const;
    };

    // =============================================================================
    // Output Configuration
    // =============================================================================

    struct MPART_API OutputConfig
    {
        std::string file;         ///< Partition file, one part id per line (empty for none)
        bool printSummary = true; ///< Print part sizes and balance
    };

    // =============================================================================
    // Complete Job Configuration
    // =============================================================================

    /**
     * @brief Complete configuration for one partitioning run.
     */
    struct MPART_API JobConfig
    {
        std::string projectName;
        std::string projectDescription;

        InputConfig input;
        PartitionConfig partition;
        OutputConfig output;

        /**
         * @brief Validate the configuration.
         * @param errorMessage Output parameter for error description
         * @return true if configuration is valid, false otherwise
         */
        bool validate(std::string &errorMessage) const;
    };

} // namespace mpart
