#pragma once

/**
 * @file graph.hpp
 * @brief Builder for a METIS graph partition computation.
 *
 * A Graph borrows the caller's adjacency arrays, optionally borrows weight
 * arrays, holds the tuning options and finally runs one METIS partitioning
 * routine.
 *
 * Example:
 * @code
 *   // Two vertices and an edge between them.
 *   std::vector<mpart::Idx> xadj = {0, 1, 2};
 *   std::vector<mpart::Idx> adjncy = {1, 0};
 *   std::vector<mpart::Idx> part(2);
 *
 *   mpart::Graph::create(1, 2, xadj, adjncy)
 *       .setOption(mpart::Option::numIterations(4))
 *       .partRecursive(part);
 *   // part[0] != part[1]
 * @endcode
 *
 * While the request is alive it holds an exclusive lease on xadj and adjncy.
 * METIS may modify them during the call and restores them before returning.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"
#include "buffer_lease.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "request_support.hpp"
#include "solver_backend.hpp"

namespace mpart {

class MPART_API Graph {
public:
    /**
     * @brief Creates a graph request after checking its structure.
     *
     * @param ncon Number of balancing constraints, at least 1
     * @param nparts Number of parts, at least 1
     * @param xadj Offsets of the adjacency structure (nvtxs+1 entries)
     * @param adjncy Adjacency lists, zero-based vertex indices
     * @throws InvalidStructureError if the arrays do not describe a graph
     * @throws std::logic_error if the arrays are borrowed by another request
     */
    static Graph create(Idx ncon, Idx nparts, IdxView xadj, IdxView adjncy);

    /**
     * @brief Creates a graph request without checking its structure.
     *
     * The caller guarantees the structure is valid. Only the shape checks
     * needed to build pointer arguments are made: positive counts, non-empty
     * xadj, adjncy length equal to the last offset, lengths that fit in Idx.
     *
     * @throws std::invalid_argument or std::length_error on a shape violation
     */
    static Graph createUnchecked(Idx ncon, Idx nparts, IdxView xadj, IdxView adjncy);

    Graph(Graph&&) noexcept = default;
    Graph& operator=(Graph&&) noexcept = default;
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    /// Computational weights, ncon values per vertex. Uniform by default.
    Graph& setVertexWeights(IdxView vwgt);

    /// Communication sizes, one per vertex. Uniform by default.
    Graph& setVertexSizes(IdxView vsize);

    /// Edge weights, one per adjncy entry. Uniform by default.
    Graph& setEdgeWeights(IdxView adjwgt);

    /// Target weight fraction for each part and constraint (ncon*nparts values)
    Graph& setTargetPartWeights(RealView tpwgts);

    /// Load imbalance tolerance for each constraint (ncon values)
    Graph& setImbalanceTolerances(RealView ubvec);

    Graph& setOption(const Option& option);
    Graph& setOptions(const OptionArray& options);

    /// Backend used for the METIS call (metisBackend() by default)
    Graph& setBackend(SolverBackend& backend);

    /// Compare the adjacency arrays before and after the METIS call
    Graph& setVerifyInputRestore(bool enabled);

    /**
     * @brief Partitions with multilevel recursive bisection
     *        (METIS_PartGraphRecursive).
     *
     * @param part Receives the part of each vertex (nvtxs entries)
     * @return The edge-cut or communication volume of the solution
     * @throws PartitionError if METIS fails
     */
    Idx partRecursive(IdxView part);

    /**
     * @brief Partitions with multilevel k-way partitioning
     *        (METIS_PartGraphKway).
     *
     * @param part Receives the part of each vertex (nvtxs entries)
     * @return The edge-cut or communication volume of the solution
     * @throws PartitionError if METIS fails
     */
    Idx partKway(IdxView part);

    Idx vertexCount() const { return nvtxs_; }
    Idx edgeEntryCount() const { return static_cast<Idx>(adjncy_.size()); }
    Idx constraintCount() const { return ncon_; }
    Idx partCount() const { return nparts_; }
    const Options& options() const { return options_; }

    bool hasVertexWeights() const { return !vwgt_.empty(); }
    bool hasVertexSizes() const { return !vsize_.empty(); }
    bool hasEdgeWeights() const { return !adjwgt_.empty(); }
    bool hasTargetPartWeights() const { return !tpwgts_.empty(); }
    bool hasImbalanceTolerances() const { return !ubvec_.empty(); }
    bool verifiesInputRestore() const { return verifyRestore_; }
    bool isConsumed() const { return state_ == detail::RequestState::Consumed; }

private:
    Graph(Idx ncon, Idx nparts, IdxView xadj, IdxView adjncy);

    Idx solve(bool kway, IdxView part);

    Idx ncon_;
    Idx nparts_;
    Idx nvtxs_;

    IdxView xadj_;
    IdxView adjncy_;
    IdxView vwgt_;
    IdxView vsize_;
    IdxView adjwgt_;
    RealView tpwgts_;
    RealView ubvec_;

    Options options_;
    SolverBackend* backend_;
    bool verifyRestore_ = MPART_VERIFY_RESTORE_DEFAULT != 0;
    detail::RequestState state_ = detail::RequestState::Ready;

    BufferLease xadjLease_;
    BufferLease adjncyLease_;
};

}  // namespace mpart
