#pragma once

/**
 * @file job_parser.hpp
 * @brief YAML parser for partitioning job files.
 *
 * This module provides functions to parse YAML job files into JobConfig
 * structures. METIS options are given by their short names (niter, ufactor,
 * ptype, ...); enumerated options take their METIS names (rb, kway, cut, vol,
 * rm, shem, grow, random, edge, node, fm, greedy, sep2sided, sep1sided) and
 * dbglvl takes a list of flag names or a raw bitmask.
 */

#include "common/mpart_export.hpp"
#include "job_config.hpp"

#include <string>

namespace mpart
{

    /**
     * @brief Parse a YAML job file.
     * @param filepath Path to the YAML file
     * @return Parsed JobConfig structure
     * @throws std::runtime_error if file cannot be read or parsed
     */
    MPART_API JobConfig parseYamlFile(const std::string &filepath);

    /**
     * @brief Parse YAML content from a string.
     * @param yamlContent YAML content as string
     * @return Parsed JobConfig structure
     * @throws std::runtime_error if content cannot be parsed
     */
    MPART_API JobConfig parseYamlString(const std::string &yamlContent);

    /**
     * @brief Parse a debug flag list such as "info" or "connInfo".
     * @throws std::invalid_argument if the name is unknown
     */
    MPART_API DebugLevel debugLevelFromNames(const std::vector<std::string> &names);

} // namespace mpart
