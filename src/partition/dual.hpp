#pragma once

/**
 * @file dual.hpp
 * @brief Dual graph of a mesh, in memory allocated by METIS.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"
#include "solver_backend.hpp"

#include <cstddef>
#include <utility>

namespace mpart {

/**
 * @brief Owning handle on the adjacency arrays produced by meshToDual.
 *
 * Both arrays were allocated by METIS and are released through METIS_Free
 * exactly once, when the handle is destroyed or assigned over. The arrays
 * are exposed only as views; they cannot be detached from the handle.
 */
class MPART_API Dual {
public:
    ~Dual();

    Dual(Dual&& other) noexcept;
    Dual& operator=(Dual&& other) noexcept;
    Dual(const Dual&) = delete;
    Dual& operator=(const Dual&) = delete;

    /// Offsets of the dual graph, one entry per element plus one
    ConstIdxView xadj() const { return ConstIdxView(xadj_, xadjSize_); }

    /// Adjacent elements of each element
    ConstIdxView adjncy() const { return ConstIdxView(adjncy_, adjncySize_); }

    /**
     * @brief Both arrays as mutable views.
     *
     * The two views are handed out together so they stay a matched pair,
     * e.g. to feed Graph::create.
     */
    std::pair<IdxView, IdxView> mutableViews() {
        return {IdxView(xadj_, xadjSize_), IdxView(adjncy_, adjncySize_)};
    }

    /// Number of vertices of the dual graph (the element count of the mesh)
    Idx vertexCount() const { return xadjSize_ == 0 ? 0 : static_cast<Idx>(xadjSize_) - 1; }

private:
    friend Dual meshToDual(IdxView eptr, IdxView eind, Idx ncommon,
                           SolverBackend& backend);

    Dual(SolverBackend* backend, Idx* xadj, std::size_t xadjSize);

    void release() noexcept;

    SolverBackend* backend_ = nullptr;
    Idx* xadj_ = nullptr;
    Idx* adjncy_ = nullptr;
    std::size_t xadjSize_ = 0;
    std::size_t adjncySize_ = 0;
};

/**
 * @brief Builds the dual graph of a mesh (METIS_MeshToDual).
 *
 * Two elements are adjacent in the dual graph when they share at least
 * ncommon nodes. The mesh structure is checked first and zero-based
 * numbering is used.
 *
 * @param eptr Offsets of the element-node structure (ne+1 entries)
 * @param eind Nodes of each element
 * @param ncommon Shared node threshold
 * @param backend Backend performing the call
 * @return The dual graph, owning the METIS-allocated arrays
 * @throws InvalidStructureError if the mesh arrays are malformed
 * @throws PartitionError if METIS fails; nothing is allocated in that case
 */
MPART_API Dual meshToDual(IdxView eptr, IdxView eind, Idx ncommon,
                          SolverBackend& backend);

/// meshToDual with the METIS backend
MPART_API Dual meshToDual(IdxView eptr, IdxView eind, Idx ncommon = 1);

}  // namespace mpart
