/**
 * @file job_parser.cpp
 * @brief Implementation of YAML parsing for partitioning jobs.
 */

#include "job_parser.hpp"
#include "job_config.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace mpart
{

    namespace
    {

        // Helper to get a value with default
        template <typename T>
        T getWithDefault(const YAML::Node &node, const std::string &key, const T &defaultValue)
        {
            if (node[key])
            {
                return node[key].as<T>();
            }
            return defaultValue;
        }

        std::vector<Idx> getIndexList(const YAML::Node &node, const std::string &key)
        {
            std::vector<Idx> values;
            if (node[key])
            {
                if (!node[key].IsSequence())
                {
                    throw std::runtime_error("'" + key + "' must be a list of integers");
                }
                for (const auto &item : node[key])
                {
                    values.push_back(item.as<Idx>());
                }
            }
            return values;
        }

        [[noreturn]] void badValue(const std::string &key, const std::string &value,
                                   const std::string &allowed)
        {
            throw std::runtime_error("partition.options." + key + ": invalid value '" + value +
                                     "' (expected " + allowed + ")");
        }

        // Enumerated options accept the names METIS prints
        Option parseEnumOption(OptionKey key, const std::string &name, const std::string &value)
        {
            switch (key)
            {
            case OptionKey::PartitionMethod:
                if (value == "rb")
                    return Option::partitionMethod(PartitionMethod::RecursiveBisection);
                if (value == "kway")
                    return Option::partitionMethod(PartitionMethod::Kway);
                badValue(name, value, "rb or kway");
            case OptionKey::Objective:
                if (value == "cut")
                    return Option::objective(Objective::Cut);
                if (value == "vol")
                    return Option::objective(Objective::Volume);
                badValue(name, value, "cut or vol");
            case OptionKey::Coarsening:
                if (value == "rm")
                    return Option::coarsening(Coarsening::Random);
                if (value == "shem")
                    return Option::coarsening(Coarsening::SortedHeavyEdge);
                badValue(name, value, "rm or shem");
            case OptionKey::InitialPartitioning:
                if (value == "grow")
                    return Option::initialPartitioning(InitialPartitioning::Grow);
                if (value == "random")
                    return Option::initialPartitioning(InitialPartitioning::Random);
                if (value == "edge")
                    return Option::initialPartitioning(InitialPartitioning::Edge);
                if (value == "node")
                    return Option::initialPartitioning(InitialPartitioning::Node);
                badValue(name, value, "grow, random, edge or node");
            case OptionKey::Refinement:
                if (value == "fm")
                    return Option::refinement(Refinement::Fm);
                if (value == "greedy")
                    return Option::refinement(Refinement::Greedy);
                if (value == "sep2sided")
                    return Option::refinement(Refinement::Sep2Sided);
                if (value == "sep1sided")
                    return Option::refinement(Refinement::Sep1Sided);
                badValue(name, value, "fm, greedy, sep2sided or sep1sided");
            case OptionKey::Numbering:
                if (value == "c" || value == "0")
                    return Option::numbering(Numbering::C);
                if (value == "fortran" || value == "1")
                    return Option::numbering(Numbering::Fortran);
                badValue(name, value, "c or fortran");
            default:
                break;
            }
            throw std::logic_error("option '" + name + "' is not enumerated");
        }

        Option parseOption(const std::string &name, const YAML::Node &value)
        {
            OptionKey key;
            try
            {
                key = optionKeyFromName(name);
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error(std::string("partition.options: ") + e.what());
            }

            switch (key)
            {
            case OptionKey::PartitionMethod:
            case OptionKey::Objective:
            case OptionKey::Coarsening:
            case OptionKey::InitialPartitioning:
            case OptionKey::Refinement:
            case OptionKey::Numbering:
                return parseEnumOption(key, name, value.as<std::string>());
            case OptionKey::NumCuts:
                return Option::numCuts(value.as<Idx>());
            case OptionKey::NumSeparators:
                return Option::numSeparators(value.as<Idx>());
            case OptionKey::NumIterations:
                return Option::numIterations(value.as<Idx>());
            case OptionKey::Seed:
                return Option::seed(value.as<Idx>());
            case OptionKey::MinConnectivity:
                return Option::minConnectivity(value.as<bool>());
            case OptionKey::NoTwoHop:
                return Option::noTwoHop(value.as<bool>());
            case OptionKey::Contiguous:
                return Option::contiguous(value.as<bool>());
            case OptionKey::Compress:
                return Option::compress(value.as<bool>());
            case OptionKey::ComponentOrder:
                return Option::componentOrder(value.as<bool>());
            case OptionKey::PruningFactor:
                return Option::pruningFactor(value.as<Idx>());
            case OptionKey::ImbalanceFactor:
                return Option::imbalanceFactor(value.as<Idx>());
            case OptionKey::DebugLevel:
                if (value.IsSequence())
                {
                    try
                    {
                        return Option::debugLevel(
                            debugLevelFromNames(value.as<std::vector<std::string>>()));
                    }
                    catch (const std::invalid_argument &e)
                    {
                        throw std::runtime_error(std::string("partition.options.dbglvl: ") + e.what());
                    }
                }
                return Option::debugLevel(DebugLevel::decode(value.as<Idx>()));
            }
            throw std::logic_error("unhandled option '" + name + "'");
        }

        // Parse input configuration
        InputConfig parseInput(const YAML::Node &node)
        {
            InputConfig input;

            input.type = getWithDefault<std::string>(node, "type", "graph");
            input.file = getWithDefault<std::string>(node, "file", "");

            input.xadj = getIndexList(node, "xadj");
            input.adjncy = getIndexList(node, "adjncy");
            input.vwgt = getIndexList(node, "vwgt");
            input.adjwgt = getIndexList(node, "adjwgt");
            input.eptr = getIndexList(node, "eptr");
            input.eind = getIndexList(node, "eind");

            return input;
        }

        // Parse partition configuration
        PartitionConfig parsePartition(const YAML::Node &node)
        {
            PartitionConfig partition;

            partition.numParts = getWithDefault<int>(node, "numParts", 2);
            partition.method = getWithDefault<std::string>(node, "method", "");
            partition.ncommon = getWithDefault<int>(node, "ncommon", 1);

            if (node["options"])
            {
                if (!node["options"].IsMap())
                {
                    throw std::runtime_error("partition.options must be a mapping");
                }
                for (const auto &entry : node["options"])
                {
                    partition.options.set(parseOption(entry.first.as<std::string>(), entry.second));
                }
            }

            return partition;
        }

        // Parse output configuration
        OutputConfig parseOutput(const YAML::Node &node)
        {
            OutputConfig output;

            output.file = getWithDefault<std::string>(node, "file", "");
            output.printSummary = getWithDefault<bool>(node, "printSummary", true);

            return output;
        }

        // Parse complete configuration from YAML node
        JobConfig parseConfig(const YAML::Node &root)
        {
            JobConfig config;

            // Project section
            if (root["project"])
            {
                const auto &project = root["project"];
                config.projectName = getWithDefault<std::string>(project, "name", "");
                config.projectDescription = getWithDefault<std::string>(project, "description", "");
            }

            if (root["input"])
            {
                config.input = parseInput(root["input"]);
            }

            if (root["partition"])
            {
                config.partition = parsePartition(root["partition"]);
            }

            if (root["output"])
            {
                config.output = parseOutput(root["output"]);
            }

            return config;
        }

    } // anonymous namespace

    DebugLevel debugLevelFromNames(const std::vector<std::string> &names)
    {
        DebugLevel level;
        for (const auto &name : names)
        {
            if (name == "info")
                level.info = true;
            else if (name == "time")
                level.time = true;
            else if (name == "coarsen")
                level.coarsen = true;
            else if (name == "refine")
                level.refine = true;
            else if (name == "ipart")
                level.ipart = true;
            else if (name == "moveInfo")
                level.moveInfo = true;
            else if (name == "sepInfo")
                level.sepInfo = true;
            else if (name == "connInfo")
                level.connInfo = true;
            else if (name == "contigInfo")
                level.contigInfo = true;
            else
                throw std::invalid_argument("Unknown debug flag: " + name);
        }
        return level;
    }

    JobConfig parseYamlFile(const std::string &filepath)
    {
        try
        {
            YAML::Node root = YAML::LoadFile(filepath);
            return parseConfig(root);
        }
        catch (const YAML::Exception &e)
        {
            throw std::runtime_error("YAML parse error in '" + filepath + "': " + e.what());
        }
        catch (const std::exception &e)
        {
            throw std::runtime_error("Error reading '" + filepath + "': " + e.what());
        }
    }

    JobConfig parseYamlString(const std::string &yamlContent)
    {
        try
        {
            YAML::Node root = YAML::Load(yamlContent);
            return parseConfig(root);
        }
        catch (const YAML::Exception &e)
        {
            throw std::runtime_error(std::string("YAML parse error: ") + e.what());
        }
    }

} // namespace mpart
