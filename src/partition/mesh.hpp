#pragma once

/**
 * @file mesh.hpp
 * @brief Builder for a METIS mesh partition computation.
 *
 * Usage mirrors Graph. A mesh is given by its element-node structure: eptr
 * holds ne+1 offsets into eind, which lists the nodes of every element. The
 * node count is derived from the largest node index.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"
#include "buffer_lease.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "request_support.hpp"
#include "solver_backend.hpp"

namespace mpart {

class MPART_API Mesh {
public:
    /**
     * @brief Creates a mesh request after checking its structure.
     *
     * @param nparts Number of parts, at least 1
     * @param eptr Offsets of the element-node structure (ne+1 entries)
     * @param eind Nodes of each element, zero-based
     * @throws InvalidStructureError if the arrays do not describe a mesh
     * @throws std::logic_error if the arrays are borrowed by another request
     */
    static Mesh create(Idx nparts, IdxView eptr, IdxView eind);

    /**
     * @brief Creates a mesh request without checking its structure.
     * @throws std::invalid_argument or std::length_error on a shape violation
     */
    static Mesh createUnchecked(Idx nparts, IdxView eptr, IdxView eind);

    Mesh(Mesh&&) noexcept = default;
    Mesh& operator=(Mesh&&) noexcept = default;
    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    /// Computational weights, one per element. Uniform by default.
    Mesh& setElementWeights(IdxView vwgt);

    /// Communication sizes, one per element. Uniform by default.
    Mesh& setElementSizes(IdxView vsize);

    /// Target weight fraction of each part (nparts values)
    Mesh& setTargetPartWeights(RealView tpwgts);

    /**
     * @brief Number of nodes two elements must share to be adjacent in the
     *        dual graph. Default 1. Only used by partDual.
     */
    Mesh& setSharedNodeThreshold(Idx ncommon);

    Mesh& setOption(const Option& option);
    Mesh& setOptions(const OptionArray& options);
    Mesh& setBackend(SolverBackend& backend);
    Mesh& setVerifyInputRestore(bool enabled);

    /**
     * @brief Partitions the mesh through its dual graph (METIS_PartMeshDual).
     *
     * @param epart Receives the part of each element (ne entries)
     * @param npart Receives the part of each node (nn entries)
     * @return The edge-cut or communication volume of the solution
     * @throws PartitionError if METIS fails
     */
    Idx partDual(IdxView epart, IdxView npart);

    /**
     * @brief Partitions the mesh through its nodal graph
     *        (METIS_PartMeshNodal). The shared-node threshold is ignored.
     *
     * @param epart Receives the part of each element (ne entries)
     * @param npart Receives the part of each node (nn entries)
     * @return The edge-cut or communication volume of the solution
     * @throws PartitionError if METIS fails
     */
    Idx partNodal(IdxView epart, IdxView npart);

    Idx elementCount() const { return ne_; }
    Idx nodeCount() const { return nn_; }
    Idx partCount() const { return nparts_; }
    Idx sharedNodeThreshold() const { return ncommon_; }
    const Options& options() const { return options_; }

    bool hasElementWeights() const { return !vwgt_.empty(); }
    bool hasElementSizes() const { return !vsize_.empty(); }
    bool hasTargetPartWeights() const { return !tpwgts_.empty(); }
    bool verifiesInputRestore() const { return verifyRestore_; }
    bool isConsumed() const { return state_ == detail::RequestState::Consumed; }

private:
    Mesh(Idx nparts, Idx nn, IdxView eptr, IdxView eind);

    Idx solve(bool dual, IdxView epart, IdxView npart);

    Idx nparts_;
    Idx ne_;
    Idx nn_;
    Idx ncommon_ = 1;

    IdxView eptr_;
    IdxView eind_;
    IdxView vwgt_;
    IdxView vsize_;
    RealView tpwgts_;

    Options options_;
    SolverBackend* backend_;
    bool verifyRestore_ = MPART_VERIFY_RESTORE_DEFAULT != 0;
    detail::RequestState state_ = detail::RequestState::Ready;

    BufferLease eptrLease_;
    BufferLease eindLease_;
};

}  // namespace mpart
