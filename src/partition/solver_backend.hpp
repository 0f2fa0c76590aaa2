#pragma once

/**
 * @file solver_backend.hpp
 * @brief The boundary between partition requests and the METIS library.
 *
 * Every METIS routine used by mpart is reached through SolverBackend. The
 * default backend forwards to the linked library; tests install a recording
 * backend to observe calls and deallocations without running METIS.
 *
 * Arguments are passed exactly as METIS takes them: scalar counts by address
 * (METIS may overwrite them), optional arrays as possibly-null pointers, and
 * the raw status code as the return value.
 */

#include "common/mpart_export.hpp"
#include "common/mpart_types.hpp"

namespace mpart {

/**
 * @brief Abstract interface over the METIS entry points.
 */
class MPART_API SolverBackend {
public:
    virtual ~SolverBackend() = default;

    /// METIS_PartGraphRecursive
    virtual int partGraphRecursive(Idx* nvtxs, Idx* ncon, Idx* xadj, Idx* adjncy,
                                   Idx* vwgt, Idx* vsize, Idx* adjwgt, Idx* nparts,
                                   Real* tpwgts, Real* ubvec, Idx* options,
                                   Idx* objval, Idx* part) = 0;

    /// METIS_PartGraphKway
    virtual int partGraphKway(Idx* nvtxs, Idx* ncon, Idx* xadj, Idx* adjncy,
                              Idx* vwgt, Idx* vsize, Idx* adjwgt, Idx* nparts,
                              Real* tpwgts, Real* ubvec, Idx* options,
                              Idx* objval, Idx* part) = 0;

    /// METIS_PartMeshDual
    virtual int partMeshDual(Idx* ne, Idx* nn, Idx* eptr, Idx* eind, Idx* vwgt,
                             Idx* vsize, Idx* ncommon, Idx* nparts, Real* tpwgts,
                             Idx* options, Idx* objval, Idx* epart, Idx* npart) = 0;

    /// METIS_PartMeshNodal
    virtual int partMeshNodal(Idx* ne, Idx* nn, Idx* eptr, Idx* eind, Idx* vwgt,
                              Idx* vsize, Idx* nparts, Real* tpwgts, Idx* options,
                              Idx* objval, Idx* epart, Idx* npart) = 0;

    /// METIS_MeshToDual; on success *xadj and *adjncy are allocated by the backend
    virtual int meshToDual(Idx* ne, Idx* nn, Idx* eptr, Idx* eind, Idx* ncommon,
                           Idx* numflag, Idx** xadj, Idx** adjncy) = 0;

    /// METIS_Free; releases memory allocated by meshToDual
    virtual void release(void* ptr) = 0;
};

/**
 * @brief SolverBackend that calls the linked METIS library.
 */
class MPART_API MetisBackend : public SolverBackend {
public:
    int partGraphRecursive(Idx* nvtxs, Idx* ncon, Idx* xadj, Idx* adjncy,
                           Idx* vwgt, Idx* vsize, Idx* adjwgt, Idx* nparts,
                           Real* tpwgts, Real* ubvec, Idx* options,
                           Idx* objval, Idx* part) override;

    int partGraphKway(Idx* nvtxs, Idx* ncon, Idx* xadj, Idx* adjncy,
                      Idx* vwgt, Idx* vsize, Idx* adjwgt, Idx* nparts,
                      Real* tpwgts, Real* ubvec, Idx* options,
                      Idx* objval, Idx* part) override;

    int partMeshDual(Idx* ne, Idx* nn, Idx* eptr, Idx* eind, Idx* vwgt,
                     Idx* vsize, Idx* ncommon, Idx* nparts, Real* tpwgts,
                     Idx* options, Idx* objval, Idx* epart, Idx* npart) override;

    int partMeshNodal(Idx* ne, Idx* nn, Idx* eptr, Idx* eind, Idx* vwgt,
                      Idx* vsize, Idx* nparts, Real* tpwgts, Idx* options,
                      Idx* objval, Idx* epart, Idx* npart) override;

    int meshToDual(Idx* ne, Idx* nn, Idx* eptr, Idx* eind, Idx* ncommon,
                   Idx* numflag, Idx** xadj, Idx** adjncy) override;

    void release(void* ptr) override;
};

/// Process-wide METIS backend used by requests that were not given another one
MPART_API SolverBackend& metisBackend();

}  // namespace mpart
