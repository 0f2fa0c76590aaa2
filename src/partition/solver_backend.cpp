#include "solver_backend.hpp"

namespace mpart
{

    int MetisBackend::partGraphRecursive(Idx *nvtxs, Idx *ncon, Idx *xadj, Idx *adjncy,
                                         Idx *vwgt, Idx *vsize, Idx *adjwgt, Idx *nparts,
                                         Real *tpwgts, Real *ubvec, Idx *options,
                                         Idx *objval, Idx *part)
    {
        return METIS_PartGraphRecursive(nvtxs, ncon, xadj, adjncy, vwgt, vsize, adjwgt,
                                        nparts, tpwgts, ubvec, options, objval, part);
    }

    int MetisBackend::partGraphKway(Idx *nvtxs, Idx *ncon, Idx *xadj, Idx *adjncy,
                                    Idx *vwgt, Idx *vsize, Idx *adjwgt, Idx *nparts,
                                    Real *tpwgts, Real *ubvec, Idx *options,
                                    Idx *objval, Idx *part)
    {
        return METIS_PartGraphKway(nvtxs, ncon, xadj, adjncy, vwgt, vsize, adjwgt,
                                   nparts, tpwgts, ubvec, options, objval, part);
    }

    int MetisBackend::partMeshDual(Idx *ne, Idx *nn, Idx *eptr, Idx *eind, Idx *vwgt,
                                   Idx *vsize, Idx *ncommon, Idx *nparts, Real *tpwgts,
                                   Idx *options, Idx *objval, Idx *epart, Idx *npart)
    {
        return METIS_PartMeshDual(ne, nn, eptr, eind, vwgt, vsize, ncommon, nparts,
                                  tpwgts, options, objval, epart, npart);
    }

    int MetisBackend::partMeshNodal(Idx *ne, Idx *nn, Idx *eptr, Idx *eind, Idx *vwgt,
                                    Idx *vsize, Idx *nparts, Real *tpwgts, Idx *options,
                                    Idx *objval, Idx *epart, Idx *npart)
    {
        return METIS_PartMeshNodal(ne, nn, eptr, eind, vwgt, vsize, nparts, tpwgts,
                                   options, objval, epart, npart);
    }

    int MetisBackend::meshToDual(Idx *ne, Idx *nn, Idx *eptr, Idx *eind, Idx *ncommon,
                                 Idx *numflag, Idx **xadj, Idx **adjncy)
    {
        return METIS_MeshToDual(ne, nn, eptr, eind, ncommon, numflag, xadj, adjncy);
    }

    void MetisBackend::release(void *ptr)
    {
        METIS_Free(ptr);
    }

    SolverBackend &metisBackend()
    {
        static MetisBackend backend;
        return backend;
    }

} // namespace mpart
