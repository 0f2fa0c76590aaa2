#include "options.hpp"

#include <stdexcept>

namespace mpart
{

    namespace
    {

        Idx flag(bool enabled)
        {
            return enabled ? 1 : 0;
        }

        const OptionKey allKeys[OPTION_KEY_COUNT] = {
            OptionKey::PartitionMethod, OptionKey::Objective,
            OptionKey::Coarsening, OptionKey::InitialPartitioning,
            OptionKey::Refinement, OptionKey::NumCuts,
            OptionKey::NumSeparators, OptionKey::Numbering,
            OptionKey::NumIterations, OptionKey::Seed,
            OptionKey::MinConnectivity, OptionKey::NoTwoHop,
            OptionKey::Contiguous, OptionKey::Compress,
            OptionKey::ComponentOrder, OptionKey::PruningFactor,
            OptionKey::ImbalanceFactor, OptionKey::DebugLevel};

    } // anonymous namespace

    // =========================================================================
    // DebugLevel
    // =========================================================================

    Idx DebugLevel::encode() const
    {
        Idx mask = 0;
        if (info)
            mask |= METIS_DBG_INFO;
        if (time)
            mask |= METIS_DBG_TIME;
        if (coarsen)
            mask |= METIS_DBG_COARSEN;
        if (refine)
            mask |= METIS_DBG_REFINE;
        if (ipart)
            mask |= METIS_DBG_IPART;
        if (moveInfo)
            mask |= METIS_DBG_MOVEINFO;
        if (sepInfo)
            mask |= METIS_DBG_SEPINFO;
        if (connInfo)
            mask |= METIS_DBG_CONNINFO;
        if (contigInfo)
            mask |= METIS_DBG_CONTIGINFO;
        return mask;
    }

    DebugLevel DebugLevel::decode(Idx mask)
    {
        DebugLevel level;
        level.info = (mask & METIS_DBG_INFO) != 0;
        level.time = (mask & METIS_DBG_TIME) != 0;
        level.coarsen = (mask & METIS_DBG_COARSEN) != 0;
        level.refine = (mask & METIS_DBG_REFINE) != 0;
        level.ipart = (mask & METIS_DBG_IPART) != 0;
        level.moveInfo = (mask & METIS_DBG_MOVEINFO) != 0;
        level.sepInfo = (mask & METIS_DBG_SEPINFO) != 0;
        level.connInfo = (mask & METIS_DBG_CONNINFO) != 0;
        level.contigInfo = (mask & METIS_DBG_CONTIGINFO) != 0;
        return level;
    }

    // =========================================================================
    // Option Factories
    // =========================================================================

    Option Option::partitionMethod(PartitionMethod method)
    {
        return Option(OptionKey::PartitionMethod,
                      method == PartitionMethod::Kway ? METIS_PTYPE_KWAY : METIS_PTYPE_RB);
    }

    Option Option::objective(Objective objective)
    {
        return Option(OptionKey::Objective,
                      objective == Objective::Volume ? METIS_OBJTYPE_VOL : METIS_OBJTYPE_CUT);
    }

    Option Option::coarsening(Coarsening scheme)
    {
        return Option(OptionKey::Coarsening,
                      scheme == Coarsening::SortedHeavyEdge ? METIS_CTYPE_SHEM : METIS_CTYPE_RM);
    }

    Option Option::initialPartitioning(InitialPartitioning scheme)
    {
        Idx value = METIS_IPTYPE_GROW;
        switch (scheme)
        {
        case InitialPartitioning::Grow:
            value = METIS_IPTYPE_GROW;
            break;
        case InitialPartitioning::Random:
            value = METIS_IPTYPE_RANDOM;
            break;
        case InitialPartitioning::Edge:
            value = METIS_IPTYPE_EDGE;
            break;
        case InitialPartitioning::Node:
            value = METIS_IPTYPE_NODE;
            break;
        }
        return Option(OptionKey::InitialPartitioning, value);
    }

    Option Option::refinement(Refinement scheme)
    {
        Idx value = METIS_RTYPE_FM;
        switch (scheme)
        {
        case Refinement::Fm:
            value = METIS_RTYPE_FM;
            break;
        case Refinement::Greedy:
            value = METIS_RTYPE_GREEDY;
            break;
        case Refinement::Sep2Sided:
            value = METIS_RTYPE_SEP2SIDED;
            break;
        case Refinement::Sep1Sided:
            value = METIS_RTYPE_SEP1SIDED;
            break;
        }
        return Option(OptionKey::Refinement, value);
    }

    Option Option::numCuts(Idx n) { return Option(OptionKey::NumCuts, n); }
    Option Option::numSeparators(Idx n) { return Option(OptionKey::NumSeparators, n); }

    Option Option::numbering(Numbering numbering)
    {
        return Option(OptionKey::Numbering, numbering == Numbering::Fortran ? 1 : 0);
    }

    Option Option::numIterations(Idx n) { return Option(OptionKey::NumIterations, n); }
    Option Option::seed(Idx seed) { return Option(OptionKey::Seed, seed); }

    Option Option::minConnectivity(bool enabled) { return Option(OptionKey::MinConnectivity, flag(enabled)); }
    Option Option::noTwoHop(bool enabled) { return Option(OptionKey::NoTwoHop, flag(enabled)); }
    Option Option::contiguous(bool enabled) { return Option(OptionKey::Contiguous, flag(enabled)); }
    Option Option::compress(bool enabled) { return Option(OptionKey::Compress, flag(enabled)); }
    Option Option::componentOrder(bool enabled) { return Option(OptionKey::ComponentOrder, flag(enabled)); }

    Option Option::pruningFactor(Idx x) { return Option(OptionKey::PruningFactor, x); }
    Option Option::imbalanceFactor(Idx x) { return Option(OptionKey::ImbalanceFactor, x); }

    Option Option::debugLevel(const DebugLevel &level)
    {
        return Option(OptionKey::DebugLevel, level.encode());
    }

    // =========================================================================
    // Key Lookup
    // =========================================================================

    std::size_t optionSlot(OptionKey key)
    {
        switch (key)
        {
        case OptionKey::PartitionMethod:
            return METIS_OPTION_PTYPE;
        case OptionKey::Objective:
            return METIS_OPTION_OBJTYPE;
        case OptionKey::Coarsening:
            return METIS_OPTION_CTYPE;
        case OptionKey::InitialPartitioning:
            return METIS_OPTION_IPTYPE;
        case OptionKey::Refinement:
            return METIS_OPTION_RTYPE;
        case OptionKey::NumCuts:
            return METIS_OPTION_NCUTS;
        case OptionKey::NumSeparators:
            return METIS_OPTION_NSEPS;
        case OptionKey::Numbering:
            return METIS_OPTION_NUMBERING;
        case OptionKey::NumIterations:
            return METIS_OPTION_NITER;
        case OptionKey::Seed:
            return METIS_OPTION_SEED;
        case OptionKey::MinConnectivity:
            return METIS_OPTION_MINCONN;
        case OptionKey::NoTwoHop:
            return METIS_OPTION_NO2HOP;
        case OptionKey::Contiguous:
            return METIS_OPTION_CONTIG;
        case OptionKey::Compress:
            return METIS_OPTION_COMPRESS;
        case OptionKey::ComponentOrder:
            return METIS_OPTION_CCORDER;
        case OptionKey::PruningFactor:
            return METIS_OPTION_PFACTOR;
        case OptionKey::ImbalanceFactor:
            return METIS_OPTION_UFACTOR;
        case OptionKey::DebugLevel:
            return METIS_OPTION_DBGLVL;
        }
        throw std::logic_error("unknown option key");
    }

    const char *optionName(OptionKey key)
    {
        switch (key)
        {
        case OptionKey::PartitionMethod:
            return "ptype";
        case OptionKey::Objective:
            return "objtype";
        case OptionKey::Coarsening:
            return "ctype";
        case OptionKey::InitialPartitioning:
            return "iptype";
        case OptionKey::Refinement:
            return "rtype";
        case OptionKey::NumCuts:
            return "ncuts";
        case OptionKey::NumSeparators:
            return "nseps";
        case OptionKey::Numbering:
            return "numbering";
        case OptionKey::NumIterations:
            return "niter";
        case OptionKey::Seed:
            return "seed";
        case OptionKey::MinConnectivity:
            return "minconn";
        case OptionKey::NoTwoHop:
            return "no2hop";
        case OptionKey::Contiguous:
            return "contig";
        case OptionKey::Compress:
            return "compress";
        case OptionKey::ComponentOrder:
            return "ccorder";
        case OptionKey::PruningFactor:
            return "pfactor";
        case OptionKey::ImbalanceFactor:
            return "ufactor";
        case OptionKey::DebugLevel:
            return "dbglvl";
        }
        return "unknown";
    }

    OptionKey optionKeyFromName(const std::string &name)
    {
        for (auto key : allKeys)
        {
            if (name == optionName(key))
            {
                return key;
            }
        }
        throw std::invalid_argument("Unknown METIS option: " + name);
    }

    // =========================================================================
    // Options
    // =========================================================================

    Options::Options()
    {
        reset();
    }

    Options &Options::set(const Option &option)
    {
        values_[optionSlot(option.key())] = option.value();
        return *this;
    }

    Options &Options::setAll(const OptionArray &values)
    {
        values_ = values;
        return *this;
    }

    void Options::reset()
    {
        values_.fill(OPTION_DEFAULT);
    }

    Idx Options::get(OptionKey key) const
    {
        return values_[optionSlot(key)];
    }

} // namespace mpart
