#pragma once

/**
 * @file options.hpp
 * @brief Fine-tuning parameters passed to METIS.
 *
 * METIS reads its tuning parameters from a fixed-length integer array where
 * each parameter owns one slot. The slot layout is part of the METIS ABI, so
 * the set of keys is closed: an Option can only be built through the static
 * factories below, each of which encodes a typed value into its slot.
 *
 * A slot holding -1 lets METIS pick its own default. No consistency check
 * between parameters is made here; METIS decides which combinations apply to
 * a given routine.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"

#include <string>

namespace mpart {

/// Every tuning parameter understood by METIS
enum class OptionKey {
    PartitionMethod,      ///< METIS_OPTION_PTYPE
    Objective,            ///< METIS_OPTION_OBJTYPE
    Coarsening,           ///< METIS_OPTION_CTYPE
    InitialPartitioning,  ///< METIS_OPTION_IPTYPE
    Refinement,           ///< METIS_OPTION_RTYPE
    NumCuts,              ///< METIS_OPTION_NCUTS
    NumSeparators,        ///< METIS_OPTION_NSEPS
    Numbering,            ///< METIS_OPTION_NUMBERING
    NumIterations,        ///< METIS_OPTION_NITER
    Seed,                 ///< METIS_OPTION_SEED
    MinConnectivity,      ///< METIS_OPTION_MINCONN
    NoTwoHop,             ///< METIS_OPTION_NO2HOP
    Contiguous,           ///< METIS_OPTION_CONTIG
    Compress,             ///< METIS_OPTION_COMPRESS
    ComponentOrder,       ///< METIS_OPTION_CCORDER
    PruningFactor,        ///< METIS_OPTION_PFACTOR
    ImbalanceFactor,      ///< METIS_OPTION_UFACTOR
    DebugLevel            ///< METIS_OPTION_DBGLVL
};

/// Number of keys in OptionKey
constexpr std::size_t OPTION_KEY_COUNT = 18;

/// Partitioning method
enum class PartitionMethod {
    RecursiveBisection,  // Multilevel recursive bisectioning
    Kway                 // Multilevel k-way partitioning
};

/// Objective to minimize
enum class Objective {
    Cut,    // Edge-cut minimization
    Volume  // Total communication volume minimization
};

/// Matching scheme used during coarsening
enum class Coarsening {
    Random,          // Random matching
    SortedHeavyEdge  // Sorted heavy-edge matching
};

/// Algorithm used during initial partitioning
enum class InitialPartitioning {
    Grow,    // Greedy bisection growing
    Random,  // Random bisection followed by refinement
    Edge,    // Separator derived from an edge cut
    Node     // Greedy node-based bisection growing
};

/// Algorithm used for refinement
enum class Refinement {
    Fm,         // FM-based cut refinement
    Greedy,     // Greedy cut and volume refinement
    Sep2Sided,  // Two-sided node FM refinement
    Sep1Sided   // One-sided node FM refinement
};

/// Numbering scheme of the adjacency or element-node arrays
enum class Numbering {
    C,       // Starts from 0
    Fortran  // Starts from 1
};

/**
 * @brief Progress and debugging output printed by METIS.
 *
 * Each flag maps to one bit of METIS_OPTION_DBGLVL.
 */
struct MPART_API DebugLevel {
    bool info = false;        ///< Diagnostic messages (1)
    bool time = false;        ///< Timing analysis (2)
    bool coarsen = false;     ///< Coarsening statistics (4)
    bool refine = false;      ///< Refinement statistics (8)
    bool ipart = false;       ///< Initial partitioning statistics (16)
    bool moveInfo = false;    ///< Vertex moves during refinement (32)
    bool sepInfo = false;     ///< Vertex separators (64)
    bool connInfo = false;    ///< Subdomain connectivity minimization (128)
    bool contigInfo = false;  ///< Connected component elimination (256)

    /// Bitmask in the METIS layout
    Idx encode() const;

    /// Flags set in a METIS bitmask; unknown bits are ignored
    static DebugLevel decode(Idx mask);
};

/**
 * @brief One tuning parameter together with its encoded value.
 */
class MPART_API Option {
public:
    static Option partitionMethod(PartitionMethod method);
    static Option objective(Objective objective);
    static Option coarsening(Coarsening scheme);
    static Option initialPartitioning(InitialPartitioning scheme);
    static Option refinement(Refinement scheme);

    /// Number of partitionings computed; the best one is kept. Default 1.
    static Option numCuts(Idx n);

    /// Number of separators computed at each nested dissection level. Default 1.
    static Option numSeparators(Idx n);

    static Option numbering(Numbering numbering);

    /// Refinement iterations at each uncoarsening step. Default 10.
    static Option numIterations(Idx n);

    static Option seed(Idx seed);

    /// Minimize the maximum degree of the subdomain graph
    static Option minConnectivity(bool enabled);

    /// Disable 2-hop matching during coarsening
    static Option noTwoHop(bool enabled);

    /// Try to produce contiguous partitions
    static Option contiguous(bool enabled);

    /// Merge vertices with identical adjacency lists
    static Option compress(bool enabled);

    /// Order connected components separately
    static Option componentOrder(bool enabled);

    /**
     * Vertices with degree above 0.1*x*(average degree) are removed before
     * ordering and placed last. Default 0, no removal.
     */
    static Option pruningFactor(Idx x);

    /// Allowed load imbalance of (1 + x)/1000
    static Option imbalanceFactor(Idx x);

    static Option debugLevel(const DebugLevel& level);

    OptionKey key() const { return key_; }
    Idx value() const { return value_; }

private:
    Option(OptionKey key, Idx value) : key_(key), value_(value) {}

    OptionKey key_;
    Idx value_;
};

/// Slot of a key in the METIS options array
MPART_API std::size_t optionSlot(OptionKey key);

/// Configuration name of a key (e.g. "niter", "ufactor")
MPART_API const char* optionName(OptionKey key);

/**
 * @brief Looks up a key by its configuration name.
 * @throws std::invalid_argument if the name is unknown
 */
MPART_API OptionKey optionKeyFromName(const std::string& name);

/**
 * @brief Fixed-size vector of tuning values, one slot per METIS option.
 */
class MPART_API Options {
public:
    /// All slots set to OPTION_DEFAULT
    Options();

    /// Writes one option into its slot
    Options& set(const Option& option);

    /// Replaces the whole vector
    Options& setAll(const OptionArray& values);

    /// Restores every slot to OPTION_DEFAULT
    void reset();

    Idx get(OptionKey key) const;
    bool isSet(OptionKey key) const { return get(key) != OPTION_DEFAULT; }

    const OptionArray& values() const { return values_; }
    Idx* data() { return values_.data(); }

    bool operator==(const Options& other) const { return values_ == other.values_; }
    bool operator!=(const Options& other) const { return values_ != other.values_; }

private:
    OptionArray values_;
};

}  // namespace mpart
