/**
 * @file job_config.cpp
 * @brief Implementation of job configuration validation.
 */

#include "job_config.hpp"

#include <set>
#include <sstream>

namespace mpart
{

    std::string PartitionConfig::resolvedMethod(const std::string &inputType) const
    {
        if (!method.empty())
        {
            return method;
        }
        return inputType == "mesh" ? "dual" : "kway";
    }

    bool JobConfig::validate(std::string &errorMessage) const
    {
        std::ostringstream errors;
        bool valid = true;

        // Validate project name
        if (projectName.empty())
        {
            errors << "- project.name is required\n";
            valid = false;
        }

        // Validate input
        if (!input.isGraph() && !input.isMesh())
        {
            errors << "- input.type must be 'graph' or 'mesh'\n";
            valid = false;
        }
        else if (input.isInline())
        {
            if (input.isGraph() && input.xadj.empty())
            {
                errors << "- input: either file or inline xadj/adjncy is required\n";
                valid = false;
            }
            if (input.isMesh() && input.eptr.empty())
            {
                errors << "- input: either file or inline eptr/eind is required\n";
                valid = false;
            }
        }
        else
        {
            bool hasInline = !input.xadj.empty() || !input.adjncy.empty() ||
                             !input.eptr.empty() || !input.eind.empty();
            if (hasInline)
            {
                errors << "- input: file and inline arrays are mutually exclusive\n";
                valid = false;
            }
        }

        // Validate partition settings
        if (partition.numParts < 1)
        {
            errors << "- partition.numParts must be at least 1\n";
            valid = false;
        }

        static const std::set<std::string> graphMethods = {"recursive", "kway"};
        static const std::set<std::string> meshMethods = {"dual", "nodal"};

        std::string method = partition.resolvedMethod(input.type);
        if (input.isGraph() && graphMethods.find(method) == graphMethods.end())
        {
            errors << "- partition.method '" << method
                   << "' is not valid for a graph (recursive, kway)\n";
            valid = false;
        }
        if (input.isMesh() && meshMethods.find(method) == meshMethods.end())
        {
            errors << "- partition.method '" << method
                   << "' is not valid for a mesh (dual, nodal)\n";
            valid = false;
        }
        if (partition.ncommon < 1)
        {
            errors << "- partition.ncommon must be at least 1\n";
            valid = false;
        }

        errorMessage = errors.str();
        return valid;
    }

} // namespace mpart
